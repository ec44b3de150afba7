#include "snapvault/server/session.hpp"

#include <system_error>

#include "snapvault/form_data.hpp"
#include "snapvault/protocol.hpp"
#include "session_common.hpp"

namespace snapvault::server
{

    namespace http = boost::beast::http;

    namespace
    {

        std::uint64_t required_number(const snapvault::protocol::FormData &form, std::string_view name,
                                      std::uint64_t fallback)
        {
            const auto value = form.field(name);
            if (!value)
            {
                return fallback;
            }
            const auto parsed = session_common::parse_unsigned(*value);
            if (!parsed)
            {
                throw TransferError(ErrorCode::InvalidRequest, "Invalid " + std::string(name) + " value");
            }
            return *parsed;
        }

        std::optional<std::string> non_empty(std::optional<std::string> value)
        {
            if (value && value->empty())
            {
                return std::nullopt;
            }
            return value;
        }

    } // namespace

    void Session::handle_restore()
    {
        const auto content_type = std::string(request_[http::field::content_type]);
        const auto form = snapvault::protocol::decode_form_data(content_type, request_.body());

        const auto *file = form.find("backup_file");
        if (file == nullptr)
        {
            send_error(ErrorCode::InvalidRequest, "No file provided");
            return;
        }
        if (!file->filename || file->filename->empty())
        {
            send_error(ErrorCode::InvalidRequest, "No file selected");
            return;
        }

        const auto requested_id = non_empty(form.field("upload_id"));
        const auto checksum = non_empty(form.field("checksum"));
        const auto total_chunks = required_number(form, "total_chunks", 1);
        if (total_chunks == 0)
        {
            send_error(ErrorCode::InvalidRequest, "total_chunks must be at least 1", requested_id);
            return;
        }

        if (!form.field("chunk"))
        {
            const auto operation_id = services_.assembler.begin(requested_id, 1);
            std::filesystem::path archive_path;
            try
            {
                archive_path = services_.assembler.store_single(operation_id, file->data);
            }
            catch (const std::exception &ex)
            {
                services_.registry.mark_failed(operation_id, ex.what());
                services_.reclaimer.schedule_operation_removal(services_.registry, operation_id,
                                                               services_.config.operation_grace);
                throw;
            }
            if (!services_.registry.try_begin_restore(operation_id))
            {
                send_error(ErrorCode::Conflict, "Upload session is no longer accepting data", operation_id);
                return;
            }
            finish_restore(operation_id, archive_path, checksum);
            return;
        }

        const auto chunk_index = required_number(form, "chunk", 0);
        std::string operation_id;
        if (!requested_id)
        {
            operation_id = services_.assembler.begin(std::nullopt, total_chunks);
        }
        else if (chunk_index == 0)
        {
            operation_id = services_.assembler.join(*requested_id, total_chunks);
        }
        else if (services_.registry.find(*requested_id))
        {
            operation_id = *requested_id;
        }
        else
        {
            send_error(ErrorCode::UnknownOperation, "Upload session not found", requested_id);
            return;
        }

        ChunkOutcome outcome;
        try
        {
            outcome = services_.assembler.accept(operation_id, chunk_index, file->data);
        }
        catch (const TransferError &ex)
        {
            send_error(ex.code(), ex.what(), operation_id);
            return;
        }

        snapvault::protocol::ChunkProgress progress{
            .upload_id = operation_id,
            .message = "Chunk " + std::to_string(chunk_index + 1) + "/" + std::to_string(outcome.total_chunks) +
                       " received",
            .chunks_received = outcome.chunks_received,
            .total_chunks = outcome.total_chunks,
        };
        if (outcome.state == ChunkOutcome::State::MoreExpected)
        {
            send_json(http::status::ok, progress);
            return;
        }

        // Only the request that wins the claim assembles; a racing duplicate just reports progress.
        if (!services_.registry.try_begin_restore(operation_id))
        {
            progress.message = "All chunks received, restore already in progress";
            send_json(http::status::ok, progress);
            return;
        }

        std::filesystem::path combined;
        try
        {
            combined = services_.assembler.assemble(operation_id);
        }
        catch (const TransferError &ex)
        {
            services_.registry.mark_failed(operation_id, ex.what());
            services_.reclaimer.schedule_operation_removal(services_.registry, operation_id,
                                                           services_.config.operation_grace);
            send_error(ex.code(), ex.what(), operation_id);
            return;
        }
        catch (const std::exception &ex)
        {
            services_.registry.mark_failed(operation_id, ex.what());
            services_.reclaimer.schedule_operation_removal(services_.registry, operation_id,
                                                           services_.config.operation_grace);
            send_error(ErrorCode::IOFailure, ex.what(), operation_id);
            return;
        }
        finish_restore(operation_id, combined, checksum);
    }

    void Session::finish_restore(const std::string &operation_id, const std::filesystem::path &archive_path,
                                 const std::optional<std::string> &expected_checksum)
    {
        services_.reclaimer.schedule_operation_removal(services_.registry, operation_id,
                                                       services_.config.operation_grace);

        if (expected_checksum)
        {
            const auto verdict =
                services_.restore_engine.verify_checksum(archive_path, operation_id, *expected_checksum);
            if (verdict.code == ErrorCode::ChecksumMismatch)
            {
                snapvault::protocol::ErrorBody body{
                    .error = verdict.message,
                    .upload_id = operation_id,
                    .expected = *expected_checksum,
                    .calculated = verdict.calculated,
                };
                send_json(session_common::status_for(ErrorCode::ChecksumMismatch), body);
                return;
            }
            if (!verdict.matched)
            {
                send_error(verdict.code, verdict.message, operation_id);
                return;
            }
        }

        const auto result = services_.restore_engine.restore(archive_path, operation_id);
        if (!result.success)
        {
            send_error(result.code, result.message, operation_id);
            return;
        }

        std::error_code ec;
        std::filesystem::remove(archive_path, ec);

        snapvault::protocol::RestoreResponse response{
            .upload_id = operation_id,
            .message = result.message,
            .restored_files = result.restored_files,
        };
        send_json(http::status::ok, response);
    }

} // namespace snapvault::server
