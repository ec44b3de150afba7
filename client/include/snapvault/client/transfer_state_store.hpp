#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapvault::client
{

    // Progress of interrupted backup downloads, keyed by the final local file.
    class TransferStateStore
    {
    public:
        struct Entry
        {
            std::filesystem::path local_path;
            std::string checksum;
            std::uint64_t total_size{};
            std::uint64_t bytes_transferred{};
        };

        explicit TransferStateStore(std::optional<std::filesystem::path> state_path = std::nullopt);

        const std::filesystem::path &state_path() const noexcept { return state_path_; }

        std::optional<Entry> find_download(const std::filesystem::path &local_path) const;

        void upsert_download(const std::filesystem::path &local_path, const std::string &checksum,
                             std::uint64_t total_size, std::uint64_t bytes_transferred);

        void update_download_progress(const std::filesystem::path &local_path, std::uint64_t bytes_transferred);

        void remove_download(const std::filesystem::path &local_path);

        const std::vector<Entry> &entries() const noexcept { return entries_; }

    private:
        static std::filesystem::path default_state_path();
        void load();
        void save() const;
        std::vector<Entry>::iterator find_entry(const std::filesystem::path &local_path);
        static std::filesystem::path normalize_path(const std::filesystem::path &path);

        std::filesystem::path state_path_;
        std::vector<Entry> entries_;
    };

} // namespace snapvault::client
