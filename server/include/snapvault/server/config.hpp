#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapvault::server
{

    inline const std::vector<std::filesystem::path> kDefaultDatabases{
        "database/books_data.db",
        "database/books_static.db",
    };

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root{"."};
        std::vector<std::filesystem::path> databases{kDefaultDatabases};
        std::filesystem::path uploads_dir{"temp_uploads"};
        std::filesystem::path backups_dir{"temp_backups"};
        std::string archive_prefix{"books_db"};
        std::size_t worker_threads{0};
        std::uint64_t max_body_bytes{1ULL << 30};
        std::chrono::seconds upload_timeout{std::chrono::seconds{3600}};
        std::chrono::seconds backup_grace{std::chrono::seconds{600}};
        std::chrono::seconds operation_grace{std::chrono::seconds{3600}};
        std::chrono::seconds sweep_interval{std::chrono::seconds{30}};
        std::optional<std::filesystem::path> log_file;
        bool verbose{false};
    };

} // namespace snapvault::server
