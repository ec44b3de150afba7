#include "snapvault/server/session.hpp"

#include <algorithm>
#include <system_error>

#include <spdlog/spdlog.h>

#include "snapvault/archive.hpp"
#include "snapvault/crypto.hpp"
#include "snapvault/protocol.hpp"
#include "session_common.hpp"

namespace snapvault::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;

    namespace
    {
        constexpr std::size_t kMaxStreamChunk = 64 * 1024 * 1024;

        std::size_t requested_chunk_size(const session_common::Target &target)
        {
            const auto value = target.param("chunk_size");
            if (!value)
            {
                return range::kDefaultChunkSize;
            }
            const auto parsed = session_common::parse_unsigned(*value);
            if (!parsed || *parsed < 1)
            {
                return range::kDefaultChunkSize;
            }
            return static_cast<std::size_t>(std::min<std::uint64_t>(*parsed, kMaxStreamChunk));
        }

        // Built under a private name and renamed into place so concurrent requests never
        // observe a half-written container.
        archive::Archive build_backup_archive(const ServerServices &services)
        {
            const auto name = services.config.archive_prefix + "_backup_" + snapvault::protocol::file_stamp() + ".zip";
            const auto destination = services.backups_dir / name;
            const auto staging = services.backups_dir / ("." + name + "." + crypto::random_identifier().substr(0, 8));

            auto built = archive::build(services.files.locations(), staging);
            std::error_code ec;
            std::filesystem::rename(staging, destination, ec);
            if (ec)
            {
                std::error_code ignored;
                std::filesystem::remove(staging, ignored);
                throw TransferError(ErrorCode::IOFailure, "Failed to publish archive " + name + ": " + ec.message());
            }
            built.path = std::filesystem::absolute(destination);
            return built;
        }

    } // namespace

    void Session::handle_backup_download()
    {
        const auto target = session_common::parse_target(std::string(request_.target()));
        const auto chunk_size = requested_chunk_size(target);

        std::optional<range::ByteRange> requested;
        if (auto header = request_.find(http::field::range); header != request_.end())
        {
            requested = range::parse_range_header(std::string(header->value()));
        }

        services_.files.require_all_present();
        const auto built = build_backup_archive(services_);
        services_.reclaimer.schedule_file_removal(built.path, services_.config.backup_grace);
        spdlog::info("Backup archive {} built ({} bytes, checksum {})", built.path.filename().string(), built.size,
                     built.checksum);

        range::RangeWindow window;
        try
        {
            window = range::resolve(requested, built.size);
        }
        catch (const TransferError &ex)
        {
            if (ex.code() != ErrorCode::RangeNotSatisfiable)
            {
                throw;
            }
            Response response{http::status::range_not_satisfiable, request_.version()};
            response.set(http::field::content_type, "application/json");
            response.set(http::field::content_range, "bytes */" + std::to_string(built.size));
            response.body() = nlohmann::json(snapvault::protocol::ErrorBody{.error = ex.what()}).dump();
            send_response(std::move(response));
            return;
        }

        start_stream(built.path, built.path.filename().string(), built.checksum, window, chunk_size);
    }

    void Session::handle_backup_status()
    {
        send_json(http::status::ok, services_.files.status());
    }

    void Session::handle_backup_verify()
    {
        const auto target = session_common::parse_target(std::string(request_.target()));
        const auto checksum = target.param("checksum");
        const auto filename = target.param("filename");
        if (!checksum || checksum->empty() || !filename || filename->empty())
        {
            send_error(ErrorCode::InvalidRequest, "Missing checksum or filename");
            return;
        }

        const auto safe_name = session_common::safe_file_name(*filename);
        const auto path = services_.backups_dir / safe_name;
        if (safe_name.empty() || !std::filesystem::is_regular_file(path))
        {
            send_error(ErrorCode::NotFound, "Backup file not found");
            return;
        }

        const auto calculated = crypto::hash_file(path);
        snapvault::protocol::VerifyResponse response;
        response.verified = calculated == *checksum;
        if (!response.verified)
        {
            response.expected = calculated;
            response.received = *checksum;
        }
        send_json(http::status::ok, response);
    }

    void Session::start_stream(const std::filesystem::path &archive_path, const std::string &download_name,
                               const std::string &checksum, const range::RangeWindow &window, std::size_t chunk_size)
    {
        auto download = std::make_unique<DownloadStream>();
        download->source = std::make_unique<range::ByteStream>(archive_path, window, chunk_size);
        download->length = window.length();

        auto &response = download->response;
        response.result(window.partial ? http::status::partial_content : http::status::ok);
        response.version(request_.version());
        response.keep_alive(request_.keep_alive());
        response.set(http::field::server, "snapvault");
        response.set(http::field::content_type, "application/zip");
        response.set(http::field::content_disposition, "attachment; filename=" + download_name);
        response.set(http::field::accept_ranges, "bytes");
        response.set(http::field::cache_control, "no-cache");
        response.set("X-Checksum", checksum);
        response.set("X-Total-Size", std::to_string(window.total));
        if (window.partial)
        {
            response.set(http::field::content_range, window.content_range());
        }
        response.content_length(window.length());
        response.body().data = nullptr;
        response.body().size = 0;
        response.body().more = true;

        download->serializer = std::make_unique<http::response_serializer<http::buffer_body>>(response);
        download_ = std::move(download);

        spdlog::debug("{} <- {} {}", remote_endpoint(), download_->response.result_int(),
                      window.partial ? window.content_range() : std::string{"full content"});
        auto self = shared_from_this();
        http::async_write_header(stream_, *download_->serializer,
                                 [this, self](beast::error_code ec, std::size_t /*bytes_transferred*/)
                                 {
                                     if (ec)
                                     {
                                         finish_stream(ec);
                                         return;
                                     }
                                     write_next_block();
                                 });
    }

    void Session::write_next_block()
    {
        auto &download = *download_;
        auto &body = download.response.body();
        if (download.source->next(download.block))
        {
            body.data = download.block.data();
            body.size = download.block.size();
            body.more = true;
        }
        else
        {
            if (download.source->bytes_sent() < download.length)
            {
                // The archive shrank underneath us; the promised length can no longer be met.
                finish_stream(beast::errc::make_error_code(beast::errc::io_error));
                return;
            }
            body.data = nullptr;
            body.size = 0;
            body.more = false;
        }
        http::async_write(stream_, *download.serializer,
                          [self = shared_from_this()](beast::error_code ec, std::size_t /*bytes_transferred*/)
                          { self->on_block_written(ec); });
    }

    void Session::on_block_written(beast::error_code ec)
    {
        if (ec == http::error::need_buffer)
        {
            ec = {};
        }
        if (ec)
        {
            finish_stream(ec);
            return;
        }
        if (download_->serializer->is_done())
        {
            finish_stream({});
            return;
        }
        write_next_block();
    }

    void Session::finish_stream(beast::error_code ec)
    {
        const auto sent = download_->source->bytes_sent();
        const bool close = ec || download_->response.need_eof();
        download_.reset();
        if (ec)
        {
            spdlog::warn("Backup stream to {} aborted after {} bytes: {}", remote_endpoint(), sent, ec.message());
        }
        else
        {
            spdlog::info("Backup stream to {} finished ({} bytes)", remote_endpoint(), sent);
        }
        if (close)
        {
            stop();
            return;
        }
        read_request();
    }

} // namespace snapvault::server
