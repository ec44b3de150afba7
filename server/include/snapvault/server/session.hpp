#pragma once

#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "snapvault/error_codes.hpp"
#include "snapvault/range.hpp"
#include "snapvault/server/chunk_assembler.hpp"
#include "snapvault/server/config.hpp"
#include "snapvault/server/managed_files.hpp"
#include "snapvault/server/operation_registry.hpp"
#include "snapvault/server/reclaimer.hpp"
#include "snapvault/server/restore_engine.hpp"

namespace snapvault::server
{

    struct ServerServices
    {
        const ServerConfig &config;
        const ManagedFileSet &files;
        OperationRegistry &registry;
        ChunkAssembler &assembler;
        RestoreEngine &restore_engine;
        Reclaimer &reclaimer;
        std::filesystem::path backups_dir;
    };

    // One keep-alive HTTP connection. Requests are handled one at a time; a backup
    // download streams its window block by block before the next request is read.
    class Session : public std::enable_shared_from_this<Session>
    {
    public:
        using Request = boost::beast::http::request<boost::beast::http::string_body>;
        using Response = boost::beast::http::response<boost::beast::http::string_body>;

        Session(boost::asio::ip::tcp::socket socket, ServerServices services);

        void start();

        void stop();

    private:
        void read_request();
        void on_read(boost::beast::error_code ec, std::size_t bytes_transferred);
        void process_request();
        void send_response(Response response);
        void send_json(boost::beast::http::status status, const nlohmann::json &body);
        void send_error(ErrorCode code, std::string message, std::optional<std::string> upload_id = std::nullopt);
        void send_method_not_allowed(std::string_view allowed);

        // Backup endpoints
        void handle_backup_download();
        void handle_backup_status();
        void handle_backup_verify();

        // Restore endpoints
        void handle_restore();
        void handle_operation_status(const std::string &operation_id);
        void finish_restore(const std::string &operation_id, const std::filesystem::path &archive_path,
                            const std::optional<std::string> &expected_checksum);

        // Range streaming
        void start_stream(const std::filesystem::path &archive_path, const std::string &download_name,
                          const std::string &checksum, const range::RangeWindow &window, std::size_t chunk_size);
        void write_next_block();
        void on_block_written(boost::beast::error_code ec);
        void finish_stream(boost::beast::error_code ec);

        std::string remote_endpoint() const;

        boost::beast::tcp_stream stream_;
        ServerServices services_;
        boost::beast::flat_buffer buffer_;
        std::optional<boost::beast::http::request_parser<boost::beast::http::string_body>> parser_;
        Request request_;

        struct DownloadStream
        {
            std::unique_ptr<range::ByteStream> source;
            std::uint64_t length{};
            std::vector<char> block;
            boost::beast::http::response<boost::beast::http::buffer_body> response;
            std::unique_ptr<boost::beast::http::response_serializer<boost::beast::http::buffer_body>> serializer;
        };
        std::unique_ptr<DownloadStream> download_;
    };

} // namespace snapvault::server
