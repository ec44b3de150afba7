/**
 * SnapVault - ZIP container codec for database snapshots (minizip-ng, deflate).
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <set>
#include <string>
#include <vector>

namespace snapvault::archive
{

    struct Archive
    {
        std::filesystem::path path;
        std::uint64_t size{};
        std::string checksum;
    };

    // Writes every source under its base name. All sources are checked before the
    // container is created; a missing one raises SourceMissing.
    Archive build(const std::vector<std::filesystem::path> &sources, const std::filesystem::path &destination);

    // CorruptArchive when the file is not a readable ZIP container.
    std::set<std::string> list_entries(const std::filesystem::path &archive_path);

    // Copies entries named in `wanted` to destinations[name]; anything else in the
    // container is skipped. Returns the destinations actually written, in archive order.
    std::vector<std::filesystem::path> extract(const std::filesystem::path &archive_path,
                                               const std::set<std::string> &wanted,
                                               const std::map<std::string, std::filesystem::path> &destinations);

} // namespace snapvault::archive
