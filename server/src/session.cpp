#include "snapvault/server/session.hpp"

#include <boost/asio/dispatch.hpp>

#include <spdlog/spdlog.h>

#include "snapvault/protocol.hpp"
#include "session_common.hpp"

namespace snapvault::server
{

    namespace beast = boost::beast;
    namespace http = beast::http;

    namespace
    {
        constexpr auto kOperationStatusPrefix = std::string_view{"/operation/status/"};
        constexpr auto kServerName = "snapvault";
    } // namespace

    Session::Session(boost::asio::ip::tcp::socket socket, ServerServices services)
        : stream_(std::move(socket)), services_(std::move(services)) {}

    void Session::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        boost::asio::dispatch(stream_.get_executor(), beast::bind_front_handler(&Session::read_request,
                                                                                shared_from_this()));
    }

    void Session::stop()
    {
        beast::error_code ec;
        stream_.socket().shutdown(boost::asio::ip::tcp::socket::shutdown_send, ec);
        stream_.socket().close(ec);
    }

    void Session::read_request()
    {
        parser_.emplace();
        parser_->body_limit(services_.config.max_body_bytes);
        http::async_read(stream_, buffer_, *parser_,
                         beast::bind_front_handler(&Session::on_read, shared_from_this()));
    }

    void Session::on_read(beast::error_code ec, std::size_t /*bytes_transferred*/)
    {
        if (ec == http::error::end_of_stream)
        {
            stop();
            return;
        }
        if (ec == http::error::body_limit)
        {
            spdlog::warn("{} request body exceeds {} bytes", remote_endpoint(), services_.config.max_body_bytes);
            request_ = Request{http::verb::post, "/", 11};
            request_.keep_alive(false);
            send_error(ErrorCode::InvalidRequest, "Request body too large");
            return;
        }
        if (ec)
        {
            spdlog::debug("Read failed for {}: {}", remote_endpoint(), ec.message());
            stop();
            return;
        }
        request_ = parser_->release();
        process_request();
    }

    void Session::process_request()
    {
        const auto target = session_common::parse_target(std::string(request_.target()));
        const auto method = request_.method();
        spdlog::debug("{} {} {}", remote_endpoint(), std::string(request_.method_string()), target.path);

        try
        {
            if (target.path == "/backup")
            {
                if (method != http::verb::get)
                {
                    send_method_not_allowed("GET");
                    return;
                }
                handle_backup_download();
            }
            else if (target.path == "/backup/status")
            {
                if (method != http::verb::get)
                {
                    send_method_not_allowed("GET");
                    return;
                }
                handle_backup_status();
            }
            else if (target.path == "/backup/verify")
            {
                if (method != http::verb::get)
                {
                    send_method_not_allowed("GET");
                    return;
                }
                handle_backup_verify();
            }
            else if (target.path == "/restore")
            {
                if (method != http::verb::post)
                {
                    send_method_not_allowed("POST");
                    return;
                }
                handle_restore();
            }
            else if (target.path.starts_with(kOperationStatusPrefix) &&
                     target.path.size() > kOperationStatusPrefix.size())
            {
                if (method != http::verb::get)
                {
                    send_method_not_allowed("GET");
                    return;
                }
                handle_operation_status(session_common::url_decode(target.path.substr(kOperationStatusPrefix.size())));
            }
            else
            {
                send_error(ErrorCode::NotFound, "Not found");
            }
        }
        catch (const TransferError &ex)
        {
            send_error(ex.code(), ex.what());
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error for {} {}: {}", std::string(request_.method_string()), target.path,
                          ex.what());
            send_error(ErrorCode::InternalError, ex.what());
        }
    }

    void Session::send_response(Response response)
    {
        response.version(request_.version());
        response.keep_alive(request_.keep_alive());
        response.set(http::field::server, kServerName);
        response.prepare_payload();

        auto message = std::make_shared<Response>(std::move(response));
        spdlog::debug("{} <- {}", remote_endpoint(), message->result_int());
        auto self = shared_from_this();
        http::async_write(stream_, *message,
                          [this, self, message](beast::error_code ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("Write failed for {}: {}", remote_endpoint(), ec.message());
                                  stop();
                                  return;
                              }
                              if (message->need_eof())
                              {
                                  stop();
                                  return;
                              }
                              read_request();
                          });
    }

    void Session::send_json(http::status status, const nlohmann::json &body)
    {
        Response response{status, request_.version()};
        response.set(http::field::content_type, "application/json");
        response.body() = body.dump();
        send_response(std::move(response));
    }

    void Session::send_error(ErrorCode code, std::string message, std::optional<std::string> upload_id)
    {
        snapvault::protocol::ErrorBody body;
        body.error = std::move(message);
        body.upload_id = std::move(upload_id);
        send_json(session_common::status_for(code), body);
    }

    void Session::send_method_not_allowed(std::string_view allowed)
    {
        Response response{http::status::method_not_allowed, request_.version()};
        response.set(http::field::content_type, "application/json");
        response.set(http::field::allow, std::string(allowed));
        response.body() = nlohmann::json{{"error", "Method not allowed"}}.dump();
        send_response(std::move(response));
    }

    void Session::handle_operation_status(const std::string &operation_id)
    {
        auto operation = services_.registry.find(operation_id);
        if (!operation)
        {
            send_error(ErrorCode::UnknownOperation, "Operation not found");
            return;
        }
        send_json(http::status::ok, operation->to_record());
    }

    std::string Session::remote_endpoint() const
    {
        beast::error_code ec;
        const auto endpoint = stream_.socket().remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace snapvault::server
