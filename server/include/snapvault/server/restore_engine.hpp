#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "snapvault/error_codes.hpp"
#include "snapvault/server/managed_files.hpp"
#include "snapvault/server/operation_registry.hpp"

namespace snapvault::server
{

    struct RestoreResult
    {
        bool success{false};
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        std::vector<std::string> restored_files;
        std::vector<std::filesystem::path> snapshots;
    };

    struct ChecksumVerdict
    {
        bool matched{false};
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        std::string calculated;
    };

    class RestoreEngine
    {
    public:
        RestoreEngine(const ManagedFileSet &files, OperationRegistry &registry);

        // The operation must already be in `restoring`. Existing files are copied to
        // <path>.<stamp>.bak before anything is overwritten; a failure part-way leaves
        // both the snapshots and any partially written files in place.
        RestoreResult restore(const std::filesystem::path &archive_path, const std::string &operation_id);

        // Marks the operation failed on a mismatch or when the archive cannot be hashed.
        ChecksumVerdict verify_checksum(const std::filesystem::path &archive_path, const std::string &operation_id,
                                        const std::string &expected);

    private:
        std::vector<std::filesystem::path> snapshot_existing() const;

        const ManagedFileSet &files_;
        OperationRegistry &registry_;
    };

} // namespace snapvault::server
