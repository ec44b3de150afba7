#include "snapvault/server/restore_engine.hpp"

#include <set>
#include <system_error>

#include <spdlog/spdlog.h>

#include "snapvault/archive.hpp"
#include "snapvault/crypto.hpp"
#include "snapvault/protocol.hpp"

namespace snapvault::server
{

    RestoreEngine::RestoreEngine(const ManagedFileSet &files, OperationRegistry &registry)
        : files_(files), registry_(registry)
    {
    }

    std::vector<std::filesystem::path> RestoreEngine::snapshot_existing() const
    {
        const auto stamp = snapvault::protocol::file_stamp();
        std::vector<std::filesystem::path> snapshots;
        for (const auto &file : files_.scan())
        {
            if (!file.exists)
            {
                continue;
            }
            auto backup = file.location;
            backup += "." + stamp + ".bak";
            for (int attempt = 1; std::filesystem::exists(backup); ++attempt)
            {
                backup = file.location;
                backup += "." + stamp + "." + std::to_string(attempt) + ".bak";
            }
            std::error_code ec;
            std::filesystem::copy_file(file.location, backup, std::filesystem::copy_options::none, ec);
            if (ec)
            {
                throw TransferError(ErrorCode::IOFailure,
                                    "Failed to snapshot " + file.path.generic_string() + ": " + ec.message());
            }
            spdlog::info("Snapshot of {} written to {}", file.path.generic_string(), backup.string());
            snapshots.push_back(std::move(backup));
        }
        return snapshots;
    }

    ChecksumVerdict RestoreEngine::verify_checksum(const std::filesystem::path &archive_path,
                                                   const std::string &operation_id, const std::string &expected)
    {
        ChecksumVerdict verdict;
        try
        {
            verdict.calculated = crypto::hash_file(archive_path);
        }
        catch (const TransferError &ex)
        {
            verdict.code = ex.code();
            verdict.message = ex.what();
        }
        catch (const std::exception &ex)
        {
            verdict.code = ErrorCode::IOFailure;
            verdict.message = ex.what();
        }

        if (verdict.code != ErrorCode::Ok)
        {
            registry_.mark_failed(operation_id, verdict.message);
            spdlog::error("Upload {} could not be hashed: {}", operation_id, verdict.message);
            return verdict;
        }
        if (verdict.calculated != expected)
        {
            verdict.code = ErrorCode::ChecksumMismatch;
            verdict.message = "Checksum mismatch";
            registry_.mark_failed(operation_id, verdict.message);
            spdlog::warn("Upload {} checksum mismatch: expected {}, calculated {}", operation_id, expected,
                         verdict.calculated);
            return verdict;
        }
        verdict.matched = true;
        return verdict;
    }

    RestoreResult RestoreEngine::restore(const std::filesystem::path &archive_path, const std::string &operation_id)
    {
        RestoreResult result;
        try
        {
            const auto entries = archive::list_entries(archive_path);

            result.snapshots = snapshot_existing();

            auto destinations = files_.destinations_by_name();
            for (const auto &[name, location] : destinations)
            {
                if (location.has_parent_path())
                {
                    std::error_code ec;
                    std::filesystem::create_directories(location.parent_path(), ec);
                    if (ec)
                    {
                        throw TransferError(ErrorCode::IOFailure, "Failed to create " +
                                                                      location.parent_path().string() + ": " +
                                                                      ec.message());
                    }
                }
            }

            std::set<std::string> wanted;
            for (const auto &[name, location] : destinations)
            {
                if (entries.contains(name))
                {
                    wanted.insert(name);
                }
            }

            const auto written = archive::extract(archive_path, wanted, destinations);
            if (written.empty())
            {
                throw TransferError(ErrorCode::NothingToRestore, "No database files found in backup");
            }

            // Configuration order, not archive order.
            const std::set<std::filesystem::path> written_set(written.begin(), written.end());
            for (const auto &location : files_.locations())
            {
                if (written_set.contains(location))
                {
                    result.restored_files.push_back(files_.display_path(location));
                }
            }
            registry_.mark_completed(operation_id, result.restored_files);
            result.success = true;
            result.message = "Database restored successfully";
            spdlog::info("Restore {} completed: {} file(s)", operation_id, result.restored_files.size());
        }
        catch (const TransferError &ex)
        {
            result.code = ex.code();
            result.message = ex.what();
        }
        catch (const std::exception &ex)
        {
            result.code = ErrorCode::IOFailure;
            result.message = ex.what();
        }

        if (!result.success)
        {
            result.restored_files.clear();
            registry_.mark_failed(operation_id, result.message);
            spdlog::error("Restore {} failed ({}): {}", operation_id, to_string(result.code), result.message);
        }
        return result;
    }

} // namespace snapvault::server
