#include "snapvault/range.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include "snapvault/error_codes.hpp"

namespace snapvault::range
{

    namespace
    {
        constexpr std::string_view kUnitPrefix = "bytes=";

        std::string_view trim(std::string_view value)
        {
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front())))
            {
                value.remove_prefix(1);
            }
            while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back())))
            {
                value.remove_suffix(1);
            }
            return value;
        }

        bool starts_with_unit(std::string_view header)
        {
            if (header.size() < kUnitPrefix.size())
            {
                return false;
            }
            for (std::size_t i = 0; i < kUnitPrefix.size(); ++i)
            {
                if (std::tolower(static_cast<unsigned char>(header[i])) != kUnitPrefix[i])
                {
                    return false;
                }
            }
            return true;
        }

        std::optional<std::uint64_t> parse_bound(std::string_view text)
        {
            text = trim(text);
            if (text.empty())
            {
                return std::nullopt;
            }
            std::uint64_t value = 0;
            const auto *begin = text.data();
            const auto *end = text.data() + text.size();
            const auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc{} || ptr != end)
            {
                throw TransferError(ErrorCode::InvalidRange, "Invalid range header");
            }
            return value;
        }

    } // namespace

    std::string RangeWindow::content_range() const
    {
        return "bytes " + std::to_string(start) + "-" + std::to_string(end) + "/" + std::to_string(total);
    }

    ByteRange parse_range_header(std::string_view header)
    {
        header = trim(header);
        if (!starts_with_unit(header))
        {
            throw TransferError(ErrorCode::InvalidRange, "Invalid range header");
        }
        const auto spec = header.substr(kUnitPrefix.size());
        if (spec.find(',') != std::string_view::npos)
        {
            throw TransferError(ErrorCode::InvalidRange, "Multiple ranges are not supported");
        }
        const auto dash = spec.find('-');
        if (dash == std::string_view::npos)
        {
            throw TransferError(ErrorCode::InvalidRange, "Invalid range header");
        }
        ByteRange range;
        range.start = parse_bound(spec.substr(0, dash));
        range.end = parse_bound(spec.substr(dash + 1));
        return range;
    }

    RangeWindow resolve(const std::optional<ByteRange> &requested, std::uint64_t total_length)
    {
        RangeWindow window;
        window.total = total_length;
        if (!requested)
        {
            window.start = 0;
            window.end = total_length == 0 ? 0 : total_length - 1;
            window.partial = false;
            return window;
        }

        const auto start = requested->start.value_or(0);
        if (start >= total_length)
        {
            throw TransferError(ErrorCode::RangeNotSatisfiable, "Range not satisfiable");
        }
        auto end = requested->end.value_or(total_length - 1);
        if (end >= total_length)
        {
            end = total_length - 1;
        }
        if (start > end)
        {
            throw TransferError(ErrorCode::RangeNotSatisfiable, "Range not satisfiable");
        }

        window.start = start;
        window.end = end;
        window.partial = true;
        return window;
    }

    RangeWindow resolve_header(std::optional<std::string_view> header, std::uint64_t total_length)
    {
        if (!header)
        {
            return resolve(std::nullopt, total_length);
        }
        return resolve(parse_range_header(*header), total_length);
    }

    ByteStream::ByteStream(const std::filesystem::path &path, const RangeWindow &window, std::size_t chunk_size)
        : file_(path, std::ios::binary), remaining_(window.length()),
          chunk_size_(chunk_size == 0 ? kDefaultChunkSize : chunk_size)
    {
        if (!file_.is_open())
        {
            throw TransferError(ErrorCode::IOFailure, "Failed to open " + path.string());
        }
        file_.seekg(static_cast<std::streamoff>(window.start));
        if (!file_)
        {
            throw TransferError(ErrorCode::IOFailure, "Failed to seek " + path.string());
        }
        finished_ = remaining_ == 0;
    }

    bool ByteStream::next(std::vector<char> &block)
    {
        block.clear();
        if (finished_)
        {
            return false;
        }
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, remaining_));
        block.resize(want);
        file_.read(block.data(), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(file_.gcount());
        block.resize(got);
        if (got == 0)
        {
            finished_ = true;
            return false;
        }
        remaining_ -= got;
        sent_ += got;
        if (remaining_ == 0 || got < want)
        {
            finished_ = true;
        }
        return true;
    }

} // namespace snapvault::range
