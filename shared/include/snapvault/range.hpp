/**
 * SnapVault - Byte-range negotiation and windowed block streaming.
 */
#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace snapvault::range
{

    inline constexpr std::size_t kDefaultChunkSize = 1024 * 1024;

    // Bounds as written by the client; either side may be omitted.
    struct ByteRange
    {
        std::optional<std::uint64_t> start;
        std::optional<std::uint64_t> end;
    };

    struct RangeWindow
    {
        std::uint64_t start{};
        std::uint64_t end{};
        std::uint64_t total{};
        bool partial{};

        std::uint64_t length() const noexcept { return total == 0 ? 0 : end - start + 1; }

        // "bytes start-end/total"
        std::string content_range() const;
    };

    // Accepts "bytes=<start>-<end>" with either bound optional. Throws InvalidRange.
    ByteRange parse_range_header(std::string_view header);

    // Throws RangeNotSatisfiable when the window cannot be served.
    RangeWindow resolve(const std::optional<ByteRange> &requested, std::uint64_t total_length);

    RangeWindow resolve_header(std::optional<std::string_view> header, std::uint64_t total_length);

    // Single-pass reader over [window.start, window.end].
    class ByteStream
    {
    public:
        ByteStream(const std::filesystem::path &path, const RangeWindow &window,
                   std::size_t chunk_size = kDefaultChunkSize);

        // Fills `block` with at most chunk_size bytes. Returns false once the window is
        // exhausted or the file ends early.
        bool next(std::vector<char> &block);

        bool done() const noexcept { return finished_; }
        std::uint64_t bytes_sent() const noexcept { return sent_; }

    private:
        std::ifstream file_;
        std::uint64_t remaining_{};
        std::uint64_t sent_{};
        std::size_t chunk_size_{};
        bool finished_{false};
    };

} // namespace snapvault::range
