#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

#include "snapvault/protocol.hpp"

namespace snapvault::server
{

    struct ManagedFile
    {
        std::filesystem::path path;     // as configured, reported to clients
        std::filesystem::path location; // resolved against the working root
        bool exists{};
        std::uint64_t size{};
        std::string size_formatted;
    };

    class ManagedFileSet
    {
    public:
        ManagedFileSet(std::filesystem::path root, std::vector<std::filesystem::path> paths);

        const std::filesystem::path &root() const noexcept { return root_; }

        std::vector<ManagedFile> scan() const;

        snapvault::protocol::BackupStatus status() const;

        std::vector<std::filesystem::path> locations() const;

        // Throws SourceMissing for the first configured file that does not exist.
        void require_all_present() const;

        // Base name -> resolved location. Later entries never shadow earlier ones.
        std::map<std::string, std::filesystem::path> destinations_by_name() const;

        std::string display_path(const std::filesystem::path &location) const;

    private:
        std::filesystem::path resolve(const std::filesystem::path &path) const;

        std::filesystem::path root_;
        std::vector<std::filesystem::path> paths_;
    };

} // namespace snapvault::server
