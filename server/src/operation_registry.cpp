#include "snapvault/server/operation_registry.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"

namespace snapvault::server
{

    namespace
    {
        using snapvault::protocol::OperationStatus;
        using Clock = TransferOperation::Clock;

        constexpr auto kMetadataDir = ".operations";
        constexpr std::size_t kMaxIdLength = 128;

        std::int64_t to_millis(Clock::time_point point)
        {
            return std::chrono::duration_cast<std::chrono::milliseconds>(point.time_since_epoch()).count();
        }

        Clock::time_point from_millis(std::int64_t millis)
        {
            return Clock::time_point{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{millis})};
        }

        double to_unix_seconds(Clock::time_point point)
        {
            return static_cast<double>(to_millis(point)) / 1000.0;
        }

        nlohmann::json to_json(const TransferOperation &operation)
        {
            nlohmann::json json{
                {"id", operation.id},
                {"kind", operation.kind},
                {"status", std::string(snapvault::protocol::to_string(operation.status))},
                {"created_at", to_millis(operation.created_at)},
                {"last_activity", to_millis(operation.last_activity)},
                {"total_chunks", operation.total_chunks},
                {"received_chunks", operation.received_chunks},
                {"staging_dir", operation.staging_dir.generic_string()},
                {"restored_files", operation.restored_files},
            };
            if (operation.completed_at)
            {
                json["completed_at"] = to_millis(*operation.completed_at);
            }
            if (operation.error)
            {
                json["error"] = *operation.error;
            }
            return json;
        }

        TransferOperation state_from_json(const nlohmann::json &json)
        {
            TransferOperation operation;
            operation.id = json.at("id").get<std::string>();
            operation.kind = json.value("kind", std::string{"restore"});
            const auto status = snapvault::protocol::operation_status_from_string(json.at("status").get<std::string>());
            operation.status = status.value_or(OperationStatus::Failed);
            operation.created_at = from_millis(json.value("created_at", std::int64_t{0}));
            operation.last_activity = from_millis(json.value("last_activity", std::int64_t{0}));
            if (auto it = json.find("completed_at"); it != json.end())
            {
                operation.completed_at = from_millis(it->get<std::int64_t>());
            }
            operation.total_chunks = json.value("total_chunks", 1ULL);
            operation.received_chunks = json.value("received_chunks", std::set<std::uint64_t>{});
            operation.staging_dir = json.value("staging_dir", std::string{});
            operation.restored_files = json.value("restored_files", std::vector<std::string>{});
            if (auto it = json.find("error"); it != json.end())
            {
                operation.error = it->get<std::string>();
            }
            return operation;
        }

    } // namespace

    snapvault::protocol::OperationRecord TransferOperation::to_record() const
    {
        snapvault::protocol::OperationRecord record;
        record.type = kind;
        record.status = status;
        record.started_at = to_unix_seconds(created_at);
        if (completed_at)
        {
            record.completed_at = to_unix_seconds(*completed_at);
        }
        record.chunks_received = chunks_received();
        record.total_chunks = total_chunks;
        record.temp_dir = staging_dir.generic_string();
        record.restored_files = restored_files;
        record.error = error;
        return record;
    }

    OperationRegistry::OperationRegistry(std::filesystem::path staging_root)
        : staging_root_(std::move(staging_root)), registry_dir_(staging_root_ / kMetadataDir)
    {
        std::filesystem::create_directories(registry_dir_);
        load_existing();
    }

    bool OperationRegistry::is_valid_id(const std::string &id)
    {
        if (id.empty() || id.size() > kMaxIdLength)
        {
            return false;
        }
        return std::all_of(id.begin(), id.end(), [](unsigned char c)
                           { return std::isalnum(c) || c == '-' || c == '_'; });
    }

    TransferOperation OperationRegistry::create(const std::optional<std::string> &requested_id,
                                                std::uint64_t total_chunks)
    {
        if (total_chunks == 0)
        {
            throw TransferError(ErrorCode::InvalidRequest, "total_chunks must be at least 1");
        }
        if (requested_id && !is_valid_id(*requested_id))
        {
            throw TransferError(ErrorCode::InvalidRequest, "Invalid upload_id");
        }

        std::lock_guard lock(mutex_);
        std::string id = requested_id.value_or(std::string{});
        if (id.empty())
        {
            do
            {
                id = crypto::random_identifier();
            } while (operations_.contains(id));
        }
        else if (operations_.contains(id))
        {
            throw TransferError(ErrorCode::Conflict, "Upload session " + id + " already exists");
        }
        return insert_locked(id, total_chunks);
    }

    std::pair<TransferOperation, bool> OperationRegistry::create_or_get(const std::string &id,
                                                                         std::uint64_t total_chunks)
    {
        if (total_chunks == 0)
        {
            throw TransferError(ErrorCode::InvalidRequest, "total_chunks must be at least 1");
        }
        if (!is_valid_id(id))
        {
            throw TransferError(ErrorCode::InvalidRequest, "Invalid upload_id");
        }

        std::lock_guard lock(mutex_);
        if (auto it = operations_.find(id); it != operations_.end())
        {
            return {it->second, false};
        }
        return {insert_locked(id, total_chunks), true};
    }

    TransferOperation OperationRegistry::insert_locked(const std::string &id, std::uint64_t total_chunks)
    {
        const auto now = Clock::now();
        TransferOperation operation;
        operation.id = id;
        operation.created_at = now;
        operation.last_activity = now;
        operation.total_chunks = total_chunks;
        operation.staging_dir = staging_root_ / id;

        std::error_code ec;
        std::filesystem::remove_all(operation.staging_dir, ec);
        std::filesystem::create_directories(operation.staging_dir);

        operations_[id] = operation;
        persist_state(operation);
        return operation;
    }

    TransferOperation OperationRegistry::record_chunk(const std::string &id, std::uint64_t chunk_index)
    {
        std::lock_guard lock(mutex_);
        auto &operation = require_locked(id);
        if (operation.status != OperationStatus::Uploading)
        {
            throw TransferError(ErrorCode::Conflict, "Upload session " + id + " is " +
                                                         std::string(snapvault::protocol::to_string(operation.status)));
        }
        if (chunk_index >= operation.total_chunks)
        {
            throw TransferError(ErrorCode::InvalidRequest, "Chunk index " + std::to_string(chunk_index) +
                                                               " out of range for " +
                                                               std::to_string(operation.total_chunks) + " chunks");
        }
        operation.received_chunks.insert(chunk_index);
        operation.last_activity = Clock::now();
        persist_state(operation);
        return operation;
    }

    bool OperationRegistry::try_begin_restore(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        auto &operation = require_locked(id);
        if (operation.status != OperationStatus::Uploading)
        {
            return false;
        }
        operation.status = OperationStatus::Restoring;
        operation.last_activity = Clock::now();
        persist_state(operation);
        return true;
    }

    bool OperationRegistry::mark_completed(const std::string &id, std::vector<std::string> restored_files)
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end() || snapvault::protocol::is_terminal(it->second.status))
        {
            return false;
        }
        auto &operation = it->second;
        const auto now = Clock::now();
        operation.status = OperationStatus::Completed;
        operation.completed_at = now;
        operation.last_activity = now;
        operation.restored_files = std::move(restored_files);
        persist_state(operation);
        return true;
    }

    bool OperationRegistry::mark_failed(const std::string &id, std::string error)
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end() || snapvault::protocol::is_terminal(it->second.status))
        {
            return false;
        }
        auto &operation = it->second;
        const auto now = Clock::now();
        operation.status = OperationStatus::Failed;
        operation.completed_at = now;
        operation.last_activity = now;
        operation.error = std::move(error);
        persist_state(operation);
        return true;
    }

    std::optional<TransferOperation> OperationRegistry::find(const std::string &id) const
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it != operations_.end())
        {
            return it->second;
        }
        return std::nullopt;
    }

    TransferOperation OperationRegistry::lookup(const std::string &id) const
    {
        auto operation = find(id);
        if (!operation)
        {
            throw TransferError(ErrorCode::UnknownOperation, "Operation not found");
        }
        return *operation;
    }

    std::vector<std::string> OperationRegistry::expire_idle(std::chrono::seconds max_idle, Clock::time_point now)
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> expired;
        for (auto &[id, operation] : operations_)
        {
            if (operation.status != OperationStatus::Uploading || now - operation.last_activity <= max_idle)
            {
                continue;
            }
            operation.status = OperationStatus::Failed;
            operation.completed_at = now;
            operation.error = "Upload abandoned after " + std::to_string(max_idle.count()) + "s without activity";
            persist_state(operation);
            expired.push_back(id);
        }
        return expired;
    }

    std::vector<std::string> OperationRegistry::terminal_ids() const
    {
        std::lock_guard lock(mutex_);
        std::vector<std::string> ids;
        for (const auto &[id, operation] : operations_)
        {
            if (snapvault::protocol::is_terminal(operation.status))
            {
                ids.push_back(id);
            }
        }
        return ids;
    }

    bool OperationRegistry::remove(const std::string &id)
    {
        std::lock_guard lock(mutex_);
        auto it = operations_.find(id);
        if (it == operations_.end())
        {
            return false;
        }
        remove_state(id);
        operations_.erase(it);
        return true;
    }

    std::size_t OperationRegistry::size() const
    {
        std::lock_guard lock(mutex_);
        return operations_.size();
    }

    TransferOperation &OperationRegistry::require_locked(const std::string &id)
    {
        auto it = operations_.find(id);
        if (it == operations_.end())
        {
            throw TransferError(ErrorCode::UnknownOperation, "Upload session not found");
        }
        return it->second;
    }

    std::filesystem::path OperationRegistry::metadata_path(const std::string &id) const
    {
        return registry_dir_ / (id + ".json");
    }

    // A restore cut short by a restart can never finish, so it is recorded as failed.
    void OperationRegistry::load_existing()
    {
        for (const auto &entry : std::filesystem::directory_iterator(registry_dir_))
        {
            if (!entry.is_regular_file() || entry.path().extension() != ".json")
            {
                continue;
            }
            std::ifstream in(entry.path());
            if (!in.is_open())
            {
                continue;
            }
            try
            {
                nlohmann::json json;
                in >> json;
                auto operation = state_from_json(json);
                if (!is_valid_id(operation.id))
                {
                    continue;
                }
                if (operation.status == OperationStatus::Restoring)
                {
                    operation.status = OperationStatus::Failed;
                    operation.completed_at = Clock::now();
                    operation.error = "Restore interrupted by server restart";
                    persist_state(operation);
                }
                operations_[operation.id] = std::move(operation);
            }
            catch (const nlohmann::json::exception &ex)
            {
                spdlog::warn("Skipping unreadable operation record {}: {}", entry.path().string(), ex.what());
            }
        }
        if (!operations_.empty())
        {
            spdlog::info("Loaded {} transfer operation(s) from {}", operations_.size(), registry_dir_.string());
        }
    }

    void OperationRegistry::persist_state(const TransferOperation &operation) const
    {
        const auto path = metadata_path(operation.id);
        std::ofstream out(path, std::ios::trunc);
        if (!out.is_open())
        {
            spdlog::warn("Failed to persist operation {} to {}", operation.id, path.string());
            return;
        }
        out << to_json(operation).dump(2);
    }

    void OperationRegistry::remove_state(const std::string &id) const
    {
        std::error_code ec;
        std::filesystem::remove(metadata_path(id), ec);
    }

} // namespace snapvault::server
