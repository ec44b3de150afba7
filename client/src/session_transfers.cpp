#include "snapvault/client/session.hpp"

#include <boost/system/system_error.hpp>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iostream>
#include <thread>

#include "snapvault/crypto.hpp"
#include "snapvault/error_codes.hpp"
#include "snapvault/form_data.hpp"
#include "snapvault/protocol.hpp"

namespace snapvault::client
{

    namespace
    {
        constexpr std::uint64_t kProgressSaveInterval = 4 * 1024 * 1024;
        constexpr int kStatusPollLimit = 120;

        std::uint64_t header_number(const HttpResponse &response, const std::string &name)
        {
            const auto value = response.header(name);
            if (!value || value->empty())
            {
                return 0;
            }
            return std::stoull(*value);
        }

    } // namespace

    bool ClientSession::perform_backup(const std::filesystem::path &local_target)
    {
        const auto absolute_local = std::filesystem::absolute(local_target).lexically_normal();
        if (std::filesystem::exists(absolute_local))
        {
            std::cout << "ERROR: file_exists" << std::endl;
            std::cout << "Local file already exists." << std::endl;
            return false;
        }
        const auto parent = absolute_local.parent_path();
        if (!parent.empty())
        {
            std::error_code ec;
            std::filesystem::create_directories(parent, ec);
        }

        auto part_path = absolute_local;
        part_path += ".part";
        if (!state_store_.find_download(absolute_local) && std::filesystem::exists(part_path))
        {
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
        }

        bool complete = false;
        for (std::size_t attempt = 0; attempt <= config_.retries && !complete; ++attempt)
        {
            try
            {
                switch (download_attempt(absolute_local, part_path))
                {
                case AttemptResult::Complete:
                    complete = true;
                    break;
                case AttemptResult::Restart:
                    std::cout << "Server archive changed, restarting download" << std::endl;
                    break;
                case AttemptResult::Failed:
                    return false;
                }
            }
            catch (const boost::system::system_error &ex)
            {
                std::cout << std::endl
                          << "Connection lost: " << ex.what() << std::endl;
                logger_.warn("backup", "attempt ", attempt + 1, " failed: ", ex.what());
                if (attempt < config_.retries)
                {
                    backoff(attempt);
                }
            }
            catch (const TransferError &ex)
            {
                std::cout << "ERROR: " << to_string(ex.code()) << std::endl;
                std::cout << ex.what() << std::endl;
                return false;
            }
        }
        std::cout << std::endl;

        if (!complete)
        {
            std::cout << "ERROR: download_incomplete" << std::endl;
            std::cout << "Download interrupted; run the command again to resume." << std::endl;
            return false;
        }

        const auto entry = state_store_.find_download(absolute_local);
        const auto file_hash = crypto::hash_file(part_path);
        if (!entry || file_hash != entry->checksum)
        {
            std::cout << "ERROR: hash_mismatch" << std::endl;
            std::cout << "File hash verification failed." << std::endl;
            std::error_code ec;
            std::filesystem::remove(part_path, ec);
            state_store_.remove_download(absolute_local);
            return false;
        }

        std::error_code ec;
        std::filesystem::rename(part_path, absolute_local, ec);
        if (ec)
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to finalize downloaded file: " << ec.message() << std::endl;
            return false;
        }

        state_store_.remove_download(absolute_local);
        logger_.info("backup", absolute_local.string(), " complete, checksum ", file_hash);
        std::cout << "OK " << file_hash << std::endl;
        return true;
    }

    ClientSession::AttemptResult ClientSession::download_attempt(const std::filesystem::path &local_target,
                                                                 const std::filesystem::path &partial)
    {
        const auto entry = state_store_.find_download(local_target);
        std::uint64_t have = 0;
        if (entry && std::filesystem::exists(partial))
        {
            have = std::filesystem::file_size(partial);
        }
        if (have > 0)
        {
            std::cout << "Resuming download from byte " << have << std::endl;
        }

        std::ofstream out;
        bool restart = false;
        std::uint64_t total = 0;
        std::uint64_t last_saved = have;
        const auto target = "/backup?chunk_size=" + std::to_string(config_.chunk_size);
        const auto range_start = have > 0 ? std::optional<std::uint64_t>(have) : std::nullopt;

        const auto response = http_.download(
            target, range_start,
            [&](const HttpResponse &head)
            {
                const auto checksum = head.header("X-Checksum").value_or("");
                total = header_number(head, "X-Total-Size");
                if (have > 0 && (head.status != 206 || checksum != entry->checksum))
                {
                    restart = true;
                    return false;
                }
                out.open(partial, std::ios::binary | (have > 0 ? std::ios::app : std::ios::trunc));
                if (!out.is_open())
                {
                    throw TransferError(ErrorCode::IOFailure, "Failed to open partial file for writing.");
                }
                state_store_.upsert_download(local_target, checksum, total, have);
                return true;
            },
            [&](const char *data, std::size_t size)
            {
                out.write(data, static_cast<std::streamsize>(size));
                if (!out)
                {
                    throw TransferError(ErrorCode::IOFailure, "Failed to write to partial file.");
                }
                have += size;
                if (have - last_saved >= kProgressSaveInterval)
                {
                    out.flush();
                    state_store_.update_download_progress(local_target, have);
                    last_saved = have;
                }
                std::cout << "\rDownloaded " << have << " / " << total << " bytes" << std::flush;
            });

        if (out.is_open())
        {
            out.close();
            state_store_.update_download_progress(local_target, have);
        }

        if (restart || (response.status == 416 && !(entry && have == entry->total_size)))
        {
            std::error_code ec;
            std::filesystem::remove(partial, ec);
            state_store_.remove_download(local_target);
            return AttemptResult::Restart;
        }
        if (response.status == 416)
        {
            return AttemptResult::Complete;
        }
        if (!response.ok())
        {
            print_error(response);
            return AttemptResult::Failed;
        }
        return have >= total ? AttemptResult::Complete : AttemptResult::Restart;
    }

    bool ClientSession::perform_restore(const std::filesystem::path &archive_path)
    {
        if (!std::filesystem::is_regular_file(archive_path))
        {
            std::cout << "ERROR: file_not_found" << std::endl;
            std::cout << "Archive " << archive_path.string() << " does not exist." << std::endl;
            return false;
        }

        const auto size = std::filesystem::file_size(archive_path);
        const auto checksum = crypto::hash_file(archive_path);
        const auto chunk_size = static_cast<std::uint64_t>(config_.chunk_size);
        const auto total_chunks = std::max<std::uint64_t>(1, (size + chunk_size - 1) / chunk_size);
        const auto upload_id = crypto::random_identifier();
        const auto boundary = snapvault::protocol::make_boundary();
        const auto content_type = snapvault::protocol::form_content_type(boundary);
        const auto filename = archive_path.filename().string();

        std::ifstream in(archive_path, std::ios::binary);
        if (!in.is_open())
        {
            std::cout << "ERROR: file_io" << std::endl;
            std::cout << "Failed to open archive." << std::endl;
            return false;
        }

        std::cout << "Uploading " << filename << " as " << upload_id << " (" << total_chunks << " chunk(s))"
                  << std::endl;
        logger_.info("restore", "upload ", upload_id, " of ", archive_path.string(), " checksum ", checksum);

        std::string data;
        for (std::uint64_t index = 0; index < total_chunks; ++index)
        {
            data.resize(static_cast<std::size_t>(chunk_size));
            in.read(data.data(), static_cast<std::streamsize>(data.size()));
            data.resize(static_cast<std::size_t>(in.gcount()));

            const std::vector<snapvault::protocol::FormPart> parts{
                {.name = "backup_file", .filename = filename, .content_type = "application/zip", .data = data},
                {.name = "upload_id", .data = upload_id},
                {.name = "chunk", .data = std::to_string(index)},
                {.name = "total_chunks", .data = std::to_string(total_chunks)},
                {.name = "checksum", .data = checksum},
            };
            const auto response = post_chunk(snapvault::protocol::encode_form_data(boundary, parts), content_type, index);
            if (!response)
            {
                std::cout << "ERROR: upload_failed" << std::endl;
                std::cout << "Chunk " << index << " could not be delivered." << std::endl;
                return false;
            }

            const bool last = index + 1 == total_chunks;
            if (last && response->status == 409)
            {
                // An earlier delivery of the final chunk already started the restore.
                return await_restore(upload_id);
            }
            if (!response->ok())
            {
                print_error(*response);
                return false;
            }

            const auto json = nlohmann::json::parse(response->body);
            if (!last)
            {
                const auto progress = json.get<snapvault::protocol::ChunkProgress>();
                std::cout << "\r" << progress.message << std::flush;
                continue;
            }
            std::cout << std::endl;
            if (!json.contains("restored_files"))
            {
                return await_restore(upload_id);
            }
            const auto result = json.get<snapvault::protocol::RestoreResponse>();
            std::cout << result.message << std::endl;
            for (const auto &file : result.restored_files)
            {
                std::cout << "  restored " << file << std::endl;
            }
            std::cout << "OK" << std::endl;
        }
        return true;
    }

    std::optional<HttpResponse> ClientSession::post_chunk(const std::string &body, const std::string &content_type,
                                                          std::uint64_t chunk_index)
    {
        for (std::size_t attempt = 0; attempt <= config_.retries; ++attempt)
        {
            try
            {
                return http_.post("/restore", body, content_type);
            }
            catch (const boost::system::system_error &ex)
            {
                logger_.warn("restore", "chunk ", chunk_index, " attempt ", attempt + 1, " failed: ", ex.what());
                if (attempt < config_.retries)
                {
                    backoff(attempt);
                }
            }
        }
        return std::nullopt;
    }

    bool ClientSession::await_restore(const std::string &upload_id)
    {
        for (int poll = 0; poll < kStatusPollLimit; ++poll)
        {
            const auto response = http_.get("/operation/status/" + upload_id);
            if (!response.ok())
            {
                print_error(response);
                return false;
            }
            const auto record = nlohmann::json::parse(response.body).get<snapvault::protocol::OperationRecord>();
            if (snapvault::protocol::is_terminal(record.status))
            {
                return handle_operation({upload_id});
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(500));
        }
        std::cout << "ERROR: timeout" << std::endl;
        std::cout << "Restore " << upload_id << " is still running." << std::endl;
        return false;
    }

} // namespace snapvault::client
