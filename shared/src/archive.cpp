#include "snapvault/archive.hpp"

#include <algorithm>
#include <chrono>
#include <ctime>
#include <fstream>
#include <memory>

#include <minizip-ng/mz.h>
#include <minizip-ng/mz_compat.h>
#include <zlib.h>

#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"

namespace snapvault::archive
{

    namespace
    {
        constexpr std::size_t kCopyBlockSize = 64 * 1024;
        constexpr int kCompressionLevel = Z_DEFAULT_COMPRESSION;
        constexpr int kMemLevel = 8;
        constexpr std::size_t kMaxEntryName = 512;

        struct ZipCloser
        {
            void operator()(void *handle) const
            {
                zipClose(handle, nullptr);
            }
        };

        struct UnzipCloser
        {
            void operator()(void *handle) const
            {
                unzClose(handle);
            }
        };

        using ZipHandle = std::unique_ptr<void, ZipCloser>;
        using UnzipHandle = std::unique_ptr<void, UnzipCloser>;

        // Entry dates come from the source mtime so that unchanged sources always
        // produce the same container bytes.
        zip_fileinfo file_info_for(const std::filesystem::path &source)
        {
            zip_fileinfo info = {};
            const auto file_time = std::filesystem::last_write_time(source);
            const auto system_time = std::chrono::file_clock::to_sys(file_time);
            const std::time_t seconds = std::chrono::system_clock::to_time_t(
                std::chrono::time_point_cast<std::chrono::system_clock::duration>(
                    std::chrono::floor<std::chrono::seconds>(system_time)));
            std::tm local{};
            if (localtime_r(&seconds, &local) != nullptr)
            {
                info.tmz_date.tm_year = static_cast<decltype(info.tmz_date.tm_year)>(local.tm_year);
                info.tmz_date.tm_mon = static_cast<decltype(info.tmz_date.tm_mon)>(local.tm_mon);
                info.tmz_date.tm_mday = static_cast<decltype(info.tmz_date.tm_mday)>(local.tm_mday);
                info.tmz_date.tm_hour = static_cast<decltype(info.tmz_date.tm_hour)>(local.tm_hour);
                info.tmz_date.tm_min = static_cast<decltype(info.tmz_date.tm_min)>(local.tm_min);
                info.tmz_date.tm_sec = static_cast<decltype(info.tmz_date.tm_sec)>(local.tm_sec);
            }
            return info;
        }

        void write_entry(void *zip, const std::filesystem::path &source, std::vector<char> &buffer)
        {
            const auto entry_name = source.filename().string();
            const auto info = file_info_for(source);
            if (zipOpenNewFileInZip3_64(zip, entry_name.c_str(), &info, nullptr, 0, nullptr, 0, nullptr, Z_DEFLATED,
                                        kCompressionLevel, 0, -MAX_WBITS, kMemLevel, Z_DEFAULT_STRATEGY, nullptr, 0,
                                        1) != ZIP_OK)
            {
                throw TransferError(ErrorCode::IOFailure, "Failed to add entry to archive: " + entry_name);
            }

            std::ifstream in(source, std::ios::binary);
            if (!in.is_open())
            {
                zipCloseFileInZip(zip);
                throw TransferError(ErrorCode::SourceMissing, "Database file " + source.string() + " not found");
            }
            while (in)
            {
                in.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
                const auto read_count = static_cast<unsigned int>(in.gcount());
                if (read_count > 0 && zipWriteInFileInZip(zip, buffer.data(), read_count) != ZIP_OK)
                {
                    zipCloseFileInZip(zip);
                    throw TransferError(ErrorCode::IOFailure, "Failed to write archive entry: " + entry_name);
                }
            }
            if (in.bad())
            {
                zipCloseFileInZip(zip);
                throw TransferError(ErrorCode::IOFailure, "Failed to read " + source.string());
            }
            if (zipCloseFileInZip(zip) != ZIP_OK)
            {
                throw TransferError(ErrorCode::IOFailure, "Failed to finish archive entry: " + entry_name);
            }
        }

        UnzipHandle open_for_reading(const std::filesystem::path &archive_path)
        {
            UnzipHandle handle(unzOpen64(archive_path.string().c_str()));
            if (!handle)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Invalid zip file");
            }
            return handle;
        }

        std::string current_entry_name(void *unz)
        {
            unz_file_info64 info{};
            char name[kMaxEntryName] = {};
            if (unzGetCurrentFileInfo64(unz, &info, name, sizeof(name), nullptr, 0, nullptr, 0) != UNZ_OK)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Failed to read archive directory");
            }
            return std::string(name);
        }

        template <typename Visitor>
        void for_each_entry(void *unz, Visitor &&visit)
        {
            unz_global_info64 global{};
            if (unzGetGlobalInfo64(unz, &global) != UNZ_OK)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Failed to read archive directory");
            }
            if (global.number_entry == 0)
            {
                return;
            }
            int status = unzGoToFirstFile(unz);
            if (status != UNZ_OK)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Failed to read first archive entry");
            }
            while (status == UNZ_OK)
            {
                visit(current_entry_name(unz));
                status = unzGoToNextFile(unz);
            }
            if (status != UNZ_END_OF_LIST_OF_FILE)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Archive directory is truncated");
            }
        }

        void copy_current_entry(void *unz, const std::string &name, const std::filesystem::path &destination,
                                std::vector<char> &buffer)
        {
            if (unzOpenCurrentFile(unz) != UNZ_OK)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Failed to open archive entry: " + name);
            }
            std::ofstream out(destination, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                unzCloseCurrentFile(unz);
                throw TransferError(ErrorCode::IOFailure, "Failed to open " + destination.string() + " for writing");
            }

            int read_count = 0;
            do
            {
                read_count = unzReadCurrentFile(unz, buffer.data(), static_cast<unsigned int>(buffer.size()));
                if (read_count < 0)
                {
                    unzCloseCurrentFile(unz);
                    throw TransferError(ErrorCode::CorruptArchive,
                                        "Error reading archive entry " + name + " (code " + std::to_string(read_count) +
                                            ")");
                }
                if (read_count > 0)
                {
                    out.write(buffer.data(), read_count);
                    if (!out)
                    {
                        unzCloseCurrentFile(unz);
                        throw TransferError(ErrorCode::IOFailure, "Failed to write " + destination.string());
                    }
                }
            } while (read_count > 0);

            out.close();
            if (unzCloseCurrentFile(unz) != UNZ_OK)
            {
                throw TransferError(ErrorCode::CorruptArchive, "Checksum error in archive entry: " + name);
            }
            if (!out)
            {
                throw TransferError(ErrorCode::IOFailure, "Failed to flush " + destination.string());
            }
        }

    } // namespace

    Archive build(const std::vector<std::filesystem::path> &sources, const std::filesystem::path &destination)
    {
        for (const auto &source : sources)
        {
            if (!std::filesystem::is_regular_file(source))
            {
                throw TransferError(ErrorCode::SourceMissing, "Database file " + source.string() + " not found");
            }
        }

        if (destination.has_parent_path())
        {
            std::filesystem::create_directories(destination.parent_path());
        }

        try
        {
            ZipHandle zip(zipOpen64(destination.string().c_str(), APPEND_STATUS_CREATE));
            if (!zip)
            {
                throw TransferError(ErrorCode::IOFailure, "Failed to create archive " + destination.string());
            }
            std::vector<char> buffer(kCopyBlockSize);
            for (const auto &source : sources)
            {
                write_entry(zip.get(), source, buffer);
            }
            if (zipClose(zip.release(), nullptr) != ZIP_OK)
            {
                throw TransferError(ErrorCode::IOFailure, "Failed to finalize archive " + destination.string());
            }
        }
        catch (const std::exception &)
        {
            std::error_code ec;
            std::filesystem::remove(destination, ec);
            throw;
        }

        Archive result;
        result.path = std::filesystem::absolute(destination);
        result.size = std::filesystem::file_size(destination);
        result.checksum = crypto::hash_file(destination);
        return result;
    }

    std::set<std::string> list_entries(const std::filesystem::path &archive_path)
    {
        auto unz = open_for_reading(archive_path);
        std::set<std::string> names;
        for_each_entry(unz.get(), [&](const std::string &name)
                       { names.insert(name); });
        return names;
    }

    std::vector<std::filesystem::path> extract(const std::filesystem::path &archive_path,
                                               const std::set<std::string> &wanted,
                                               const std::map<std::string, std::filesystem::path> &destinations)
    {
        auto unz = open_for_reading(archive_path);
        std::vector<char> buffer(kCopyBlockSize);
        std::vector<std::filesystem::path> written;
        for_each_entry(unz.get(), [&](const std::string &name)
                       {
            if (!wanted.contains(name))
            {
                return;
            }
            const auto target = destinations.find(name);
            if (target == destinations.end())
            {
                return;
            }
            copy_current_entry(unz.get(), name, target->second, buffer);
            if (std::find(written.begin(), written.end(), target->second) == written.end())
            {
                written.push_back(target->second);
            } });
        return written;
    }

} // namespace snapvault::archive
