#include "session_common.hpp"

#include <cctype>
#include <charconv>

namespace snapvault::server::session_common
{

    namespace
    {

        int hex_value(char c)
        {
            if (c >= '0' && c <= '9')
            {
                return c - '0';
            }
            if (c >= 'a' && c <= 'f')
            {
                return c - 'a' + 10;
            }
            if (c >= 'A' && c <= 'F')
            {
                return c - 'A' + 10;
            }
            return -1;
        }

    } // namespace

    std::optional<std::string> Target::param(const std::string &key) const
    {
        auto it = query.find(key);
        if (it == query.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    std::string url_decode(std::string_view value)
    {
        std::string decoded;
        decoded.reserve(value.size());
        for (std::size_t i = 0; i < value.size(); ++i)
        {
            const char c = value[i];
            if (c == '+')
            {
                decoded.push_back(' ');
            }
            else if (c == '%' && i + 2 < value.size() && hex_value(value[i + 1]) >= 0 &&
                     hex_value(value[i + 2]) >= 0)
            {
                decoded.push_back(static_cast<char>(hex_value(value[i + 1]) * 16 + hex_value(value[i + 2])));
                i += 2;
            }
            else
            {
                decoded.push_back(c);
            }
        }
        return decoded;
    }

    Target parse_target(std::string_view target)
    {
        Target result;
        const auto question = target.find('?');
        result.path = std::string(target.substr(0, question));
        if (question == std::string_view::npos)
        {
            return result;
        }

        auto query = target.substr(question + 1);
        while (!query.empty())
        {
            const auto amp = query.find('&');
            const auto item = query.substr(0, amp);
            query = amp == std::string_view::npos ? std::string_view{} : query.substr(amp + 1);
            if (item.empty())
            {
                continue;
            }
            const auto eq = item.find('=');
            auto key = url_decode(item.substr(0, eq));
            auto value = eq == std::string_view::npos ? std::string{} : url_decode(item.substr(eq + 1));
            result.query.emplace(std::move(key), std::move(value));
        }
        return result;
    }

    boost::beast::http::status status_for(ErrorCode code) noexcept
    {
        using boost::beast::http::status;
        switch (code)
        {
        case ErrorCode::Ok:
            return status::ok;
        case ErrorCode::SourceMissing:
        case ErrorCode::UnknownOperation:
        case ErrorCode::NotFound:
            return status::not_found;
        case ErrorCode::RangeNotSatisfiable:
            return status::range_not_satisfiable;
        case ErrorCode::Conflict:
            return status::conflict;
        case ErrorCode::CorruptArchive:
        case ErrorCode::InvalidRange:
        case ErrorCode::MissingChunk:
        case ErrorCode::ChecksumMismatch:
        case ErrorCode::NothingToRestore:
        case ErrorCode::InvalidRequest:
            return status::bad_request;
        case ErrorCode::IOFailure:
        case ErrorCode::InternalError:
            break;
        }
        return status::internal_server_error;
    }

    std::string safe_file_name(std::string_view name)
    {
        const auto slash = name.find_last_of("/\\");
        if (slash != std::string_view::npos)
        {
            name.remove_prefix(slash + 1);
        }
        std::string safe;
        for (const char c : name)
        {
            const auto uc = static_cast<unsigned char>(c);
            if (std::isalnum(uc) || c == '.' || c == '-' || c == '_')
            {
                safe.push_back(c);
            }
        }
        while (!safe.empty() && safe.front() == '.')
        {
            safe.erase(safe.begin());
        }
        return safe;
    }

    std::optional<std::uint64_t> parse_unsigned(std::string_view value)
    {
        std::uint64_t parsed = 0;
        const auto *begin = value.data();
        const auto *end = value.data() + value.size();
        const auto [ptr, ec] = std::from_chars(begin, end, parsed);
        if (value.empty() || ec != std::errc{} || ptr != end)
        {
            return std::nullopt;
        }
        return parsed;
    }

} // namespace snapvault::server::session_common
