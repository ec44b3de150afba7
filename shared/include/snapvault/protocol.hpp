/**
 * SnapVault - JSON schema of the backup/restore endpoints.
 */
#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace snapvault::protocol
{

    std::string format_size(std::uint64_t size_bytes);

    // Local time as YYYYmmdd_HHMMSS, used in archive and snapshot file names.
    std::string file_stamp(std::chrono::system_clock::time_point when = std::chrono::system_clock::now());

    enum class OperationStatus : std::uint8_t
    {
        Uploading,
        Restoring,
        Completed,
        Failed
    };

    std::string_view to_string(OperationStatus status) noexcept;
    std::optional<OperationStatus> operation_status_from_string(std::string_view value) noexcept;

    constexpr bool is_terminal(OperationStatus status) noexcept
    {
        return status == OperationStatus::Completed || status == OperationStatus::Failed;
    }

    struct DatabaseStatus
    {
        std::string path;
        bool exists{};
        std::uint64_t size_bytes{};
        std::string size_formatted;
    };

    void to_json(nlohmann::json &json, const DatabaseStatus &status);
    void from_json(const nlohmann::json &json, DatabaseStatus &status);

    struct BackupStatus
    {
        std::vector<DatabaseStatus> databases;
        std::uint64_t total_size_bytes{};
        std::string total_size_formatted;
        bool all_files_exist{true};
    };

    void to_json(nlohmann::json &json, const BackupStatus &status);
    void from_json(const nlohmann::json &json, BackupStatus &status);

    // Wire form of a TransferOperation; timestamps are unix seconds.
    struct OperationRecord
    {
        std::string type{"restore"};
        OperationStatus status{OperationStatus::Uploading};
        double started_at{};
        std::optional<double> completed_at{};
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
        std::string temp_dir;
        std::vector<std::string> restored_files;
        std::optional<std::string> error{};
    };

    void to_json(nlohmann::json &json, const OperationRecord &record);
    void from_json(const nlohmann::json &json, OperationRecord &record);

    struct ChunkProgress
    {
        std::string upload_id;
        std::string message;
        std::uint64_t chunks_received{};
        std::uint64_t total_chunks{};
    };

    void to_json(nlohmann::json &json, const ChunkProgress &progress);
    void from_json(const nlohmann::json &json, ChunkProgress &progress);

    struct RestoreResponse
    {
        std::string upload_id;
        std::string message;
        std::vector<std::string> restored_files;
    };

    void to_json(nlohmann::json &json, const RestoreResponse &response);
    void from_json(const nlohmann::json &json, RestoreResponse &response);

    struct VerifyResponse
    {
        bool verified{};
        std::optional<std::string> expected{};
        std::optional<std::string> received{};
    };

    void to_json(nlohmann::json &json, const VerifyResponse &response);
    void from_json(const nlohmann::json &json, VerifyResponse &response);

    struct ErrorBody
    {
        std::string error;
        std::optional<std::string> upload_id{};
        std::optional<std::string> expected{};
        std::optional<std::string> calculated{};
    };

    void to_json(nlohmann::json &json, const ErrorBody &body);
    void from_json(const nlohmann::json &json, ErrorBody &body);

} // namespace snapvault::protocol
