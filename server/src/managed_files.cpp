#include "snapvault/server/managed_files.hpp"

#include <system_error>

#include "snapvault/error_codes.hpp"

namespace snapvault::server
{

    ManagedFileSet::ManagedFileSet(std::filesystem::path root, std::vector<std::filesystem::path> paths)
        : root_(std::move(root)), paths_(std::move(paths))
    {
        if (paths_.empty())
        {
            throw TransferError(ErrorCode::InvalidRequest, "At least one database file must be configured");
        }
    }

    std::filesystem::path ManagedFileSet::resolve(const std::filesystem::path &path) const
    {
        if (path.is_absolute())
        {
            return path.lexically_normal();
        }
        return (root_ / path).lexically_normal();
    }

    std::vector<ManagedFile> ManagedFileSet::scan() const
    {
        std::vector<ManagedFile> files;
        files.reserve(paths_.size());
        for (const auto &path : paths_)
        {
            ManagedFile file;
            file.path = path;
            file.location = resolve(path);
            std::error_code ec;
            file.exists = std::filesystem::is_regular_file(file.location, ec);
            if (file.exists)
            {
                file.size = std::filesystem::file_size(file.location, ec);
                if (ec)
                {
                    file.size = 0;
                }
            }
            file.size_formatted = snapvault::protocol::format_size(file.size);
            files.push_back(std::move(file));
        }
        return files;
    }

    snapvault::protocol::BackupStatus ManagedFileSet::status() const
    {
        snapvault::protocol::BackupStatus status;
        for (const auto &file : scan())
        {
            status.databases.push_back(snapvault::protocol::DatabaseStatus{
                .path = file.path.generic_string(),
                .exists = file.exists,
                .size_bytes = file.size,
                .size_formatted = file.size_formatted,
            });
            status.total_size_bytes += file.size;
            if (!file.exists)
            {
                status.all_files_exist = false;
            }
        }
        status.total_size_formatted = snapvault::protocol::format_size(status.total_size_bytes);
        return status;
    }

    std::vector<std::filesystem::path> ManagedFileSet::locations() const
    {
        std::vector<std::filesystem::path> result;
        result.reserve(paths_.size());
        for (const auto &path : paths_)
        {
            result.push_back(resolve(path));
        }
        return result;
    }

    void ManagedFileSet::require_all_present() const
    {
        for (const auto &file : scan())
        {
            if (!file.exists)
            {
                throw TransferError(ErrorCode::SourceMissing,
                                    "Database file " + file.path.generic_string() + " not found");
            }
        }
    }

    std::map<std::string, std::filesystem::path> ManagedFileSet::destinations_by_name() const
    {
        std::map<std::string, std::filesystem::path> destinations;
        for (const auto &path : paths_)
        {
            destinations.emplace(path.filename().string(), resolve(path));
        }
        return destinations;
    }

    std::string ManagedFileSet::display_path(const std::filesystem::path &location) const
    {
        const auto normalized = location.lexically_normal();
        for (const auto &path : paths_)
        {
            if (resolve(path) == normalized)
            {
                return path.generic_string();
            }
        }
        return normalized.generic_string();
    }

} // namespace snapvault::server
