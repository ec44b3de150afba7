#include "snapvault/protocol.hpp"

#include <array>
#include <cstdio>
#include <ctime>
#include <stdexcept>

namespace snapvault::protocol
{

    namespace
    {

        struct StatusMapping
        {
            OperationStatus status;
            std::string_view label;
        };

        constexpr std::array<StatusMapping, 4> kStatusMappings{{
            {OperationStatus::Uploading, "uploading"},
            {OperationStatus::Restoring, "restoring"},
            {OperationStatus::Completed, "completed"},
            {OperationStatus::Failed, "failed"},
        }};

        template <typename T>
        void read_optional(const nlohmann::json &json, const char *key, std::optional<T> &target)
        {
            if (auto it = json.find(key); it != json.end() && !it->is_null())
            {
                target = it->get<T>();
            }
        }

    } // namespace

    std::string format_size(std::uint64_t size_bytes)
    {
        if (size_bytes == 0)
        {
            return "0 B";
        }
        static constexpr std::array<const char *, 5> kUnits{"B", "KB", "MB", "GB", "TB"};
        auto value = static_cast<double>(size_bytes);
        std::size_t unit = 0;
        while (value >= 1024.0 && unit < kUnits.size() - 1)
        {
            value /= 1024.0;
            ++unit;
        }
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.2f %s", value, kUnits[unit]);
        return buffer;
    }

    std::string file_stamp(std::chrono::system_clock::time_point when)
    {
        const std::time_t seconds = std::chrono::system_clock::to_time_t(when);
        std::tm local{};
        localtime_r(&seconds, &local);
        char buffer[32];
        std::strftime(buffer, sizeof(buffer), "%Y%m%d_%H%M%S", &local);
        return buffer;
    }

    std::string_view to_string(OperationStatus status) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.status == status)
            {
                return mapping.label;
            }
        }
        return "unknown";
    }

    std::optional<OperationStatus> operation_status_from_string(std::string_view value) noexcept
    {
        for (const auto &mapping : kStatusMappings)
        {
            if (mapping.label == value)
            {
                return mapping.status;
            }
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const DatabaseStatus &status)
    {
        json = {
            {"path", status.path},
            {"exists", status.exists},
            {"size_bytes", status.size_bytes},
            {"size_formatted", status.size_formatted},
        };
    }

    void from_json(const nlohmann::json &json, DatabaseStatus &status)
    {
        status.path = json.at("path").get<std::string>();
        status.exists = json.value("exists", false);
        status.size_bytes = json.value("size_bytes", 0ULL);
        status.size_formatted = json.value("size_formatted", std::string{});
    }

    void to_json(nlohmann::json &json, const BackupStatus &status)
    {
        json = {
            {"databases", status.databases},
            {"total_size_bytes", status.total_size_bytes},
            {"total_size_formatted", status.total_size_formatted},
            {"all_files_exist", status.all_files_exist},
        };
    }

    void from_json(const nlohmann::json &json, BackupStatus &status)
    {
        status.databases = json.value("databases", std::vector<DatabaseStatus>{});
        status.total_size_bytes = json.value("total_size_bytes", 0ULL);
        status.total_size_formatted = json.value("total_size_formatted", std::string{});
        status.all_files_exist = json.value("all_files_exist", false);
    }

    void to_json(nlohmann::json &json, const OperationRecord &record)
    {
        json = {
            {"type", record.type},
            {"status", std::string(to_string(record.status))},
            {"started_at", record.started_at},
            {"chunks_received", record.chunks_received},
            {"total_chunks", record.total_chunks},
            {"temp_dir", record.temp_dir},
            {"restored_files", record.restored_files},
        };
        if (record.completed_at)
        {
            json["completed_at"] = *record.completed_at;
        }
        if (record.error)
        {
            json["error"] = *record.error;
        }
    }

    void from_json(const nlohmann::json &json, OperationRecord &record)
    {
        record.type = json.value("type", std::string{"restore"});
        const auto status_label = json.at("status").get<std::string>();
        const auto status = operation_status_from_string(status_label);
        if (!status)
        {
            throw std::runtime_error("Unknown operation status: " + status_label);
        }
        record.status = *status;
        record.started_at = json.value("started_at", 0.0);
        read_optional(json, "completed_at", record.completed_at);
        record.chunks_received = json.value("chunks_received", 0ULL);
        record.total_chunks = json.value("total_chunks", 0ULL);
        record.temp_dir = json.value("temp_dir", std::string{});
        record.restored_files = json.value("restored_files", std::vector<std::string>{});
        read_optional(json, "error", record.error);
    }

    void to_json(nlohmann::json &json, const ChunkProgress &progress)
    {
        json = {
            {"success", true},
            {"upload_id", progress.upload_id},
            {"message", progress.message},
            {"chunks_received", progress.chunks_received},
            {"total_chunks", progress.total_chunks},
        };
    }

    void from_json(const nlohmann::json &json, ChunkProgress &progress)
    {
        progress.upload_id = json.at("upload_id").get<std::string>();
        progress.message = json.value("message", std::string{});
        progress.chunks_received = json.value("chunks_received", 0ULL);
        progress.total_chunks = json.value("total_chunks", 0ULL);
    }

    void to_json(nlohmann::json &json, const RestoreResponse &response)
    {
        json = {
            {"success", true},
            {"message", response.message},
            {"restored_files", response.restored_files},
            {"upload_id", response.upload_id},
        };
    }

    void from_json(const nlohmann::json &json, RestoreResponse &response)
    {
        response.upload_id = json.at("upload_id").get<std::string>();
        response.message = json.value("message", std::string{});
        response.restored_files = json.value("restored_files", std::vector<std::string>{});
    }

    void to_json(nlohmann::json &json, const VerifyResponse &response)
    {
        json = {{"verified", response.verified}};
        if (response.expected)
        {
            json["expected"] = *response.expected;
        }
        if (response.received)
        {
            json["received"] = *response.received;
        }
    }

    void from_json(const nlohmann::json &json, VerifyResponse &response)
    {
        response.verified = json.at("verified").get<bool>();
        read_optional(json, "expected", response.expected);
        read_optional(json, "received", response.received);
    }

    void to_json(nlohmann::json &json, const ErrorBody &body)
    {
        json = {{"error", body.error}};
        if (body.upload_id)
        {
            json["upload_id"] = *body.upload_id;
        }
        if (body.expected)
        {
            json["expected"] = *body.expected;
        }
        if (body.calculated)
        {
            json["calculated"] = *body.calculated;
        }
    }

    void from_json(const nlohmann::json &json, ErrorBody &body)
    {
        body.error = json.value("error", std::string{});
        read_optional(json, "upload_id", body.upload_id);
        read_optional(json, "expected", body.expected);
        read_optional(json, "calculated", body.calculated);
    }

} // namespace snapvault::protocol
