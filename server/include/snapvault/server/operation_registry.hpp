#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

#include "snapvault/protocol.hpp"

namespace snapvault::server
{

    struct TransferOperation
    {
        using Clock = std::chrono::system_clock;

        std::string id;
        std::string kind{"restore"};
        snapvault::protocol::OperationStatus status{snapvault::protocol::OperationStatus::Uploading};
        Clock::time_point created_at{};
        Clock::time_point last_activity{};
        std::optional<Clock::time_point> completed_at{};
        std::uint64_t total_chunks{1};
        std::set<std::uint64_t> received_chunks;
        std::filesystem::path staging_dir;
        std::vector<std::string> restored_files;
        std::optional<std::string> error{};

        std::uint64_t chunks_received() const noexcept { return received_chunks.size(); }
        bool all_chunks_received() const noexcept { return chunks_received() >= total_chunks; }

        snapvault::protocol::OperationRecord to_record() const;
    };

    // Every transition happens under one mutex and callers only ever see copies.
    // Records leave the table through remove(), which only the reclaimer calls.
    class OperationRegistry
    {
    public:
        explicit OperationRegistry(std::filesystem::path staging_root);

        const std::filesystem::path &staging_root() const noexcept { return staging_root_; }

        // Mints an id when none is requested. Creates the staging directory.
        TransferOperation create(const std::optional<std::string> &requested_id, std::uint64_t total_chunks);

        // Joins the operation if it exists, otherwise creates it; one lock covers both.
        // The flag is true when this call created it.
        std::pair<TransferOperation, bool> create_or_get(const std::string &id, std::uint64_t total_chunks);

        TransferOperation record_chunk(const std::string &id, std::uint64_t chunk_index);

        // uploading -> restoring; true for exactly one caller per operation.
        bool try_begin_restore(const std::string &id);

        bool mark_completed(const std::string &id, std::vector<std::string> restored_files);
        bool mark_failed(const std::string &id, std::string error);

        std::optional<TransferOperation> find(const std::string &id) const;

        // Throws UnknownOperation.
        TransferOperation lookup(const std::string &id) const;

        // Fails uploads with no activity for max_idle and returns their ids.
        std::vector<std::string> expire_idle(std::chrono::seconds max_idle, TransferOperation::Clock::time_point now);

        std::vector<std::string> terminal_ids() const;

        bool remove(const std::string &id);

        std::size_t size() const;

        static bool is_valid_id(const std::string &id);

    private:
        std::filesystem::path metadata_path(const std::string &id) const;
        void load_existing();
        void persist_state(const TransferOperation &operation) const;
        void remove_state(const std::string &id) const;
        TransferOperation &require_locked(const std::string &id);
        TransferOperation insert_locked(const std::string &id, std::uint64_t total_chunks);

        std::filesystem::path staging_root_;
        std::filesystem::path registry_dir_;
        mutable std::mutex mutex_;
        std::unordered_map<std::string, TransferOperation> operations_;
    };

} // namespace snapvault::server
