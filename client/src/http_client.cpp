#include "snapvault/client/http_client.hpp"

#include <boost/asio/connect.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/version.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <chrono>

#include "snapvault/version.hpp"

namespace snapvault::client
{

    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = boost::asio::ip::tcp;

    namespace
    {
        constexpr std::size_t kReadBlock = 64 * 1024;
        constexpr auto kIoTimeout = std::chrono::seconds(120);

        std::string lower(std::string value)
        {
            std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c)
                           { return static_cast<char>(std::tolower(c)); });
            return value;
        }

        template <typename Fields>
        void collect_headers(const Fields &fields, HttpResponse &response)
        {
            for (const auto &field : fields)
            {
                response.headers[lower(std::string(field.name_string()))] = std::string(field.value());
            }
        }

        std::string user_agent()
        {
            return "snapvault-client/" + std::string(snapvault::version());
        }

        void close_stream(beast::tcp_stream &stream)
        {
            beast::error_code ec;
            stream.socket().shutdown(tcp::socket::shutdown_both, ec);
        }

    } // namespace

    std::optional<std::string> HttpResponse::header(const std::string &name) const
    {
        auto it = headers.find(lower(name));
        if (it == headers.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    HttpClient::HttpClient(std::string host, std::uint16_t port) : host_(std::move(host)), port_(port) {}

    HttpResponse HttpClient::get(const std::string &target)
    {
        return post(target, {}, {});
    }

    HttpResponse HttpClient::post(const std::string &target, std::string body, const std::string &content_type)
    {
        boost::asio::io_context io_context;
        tcp::resolver resolver(io_context);
        beast::tcp_stream stream(io_context);
        stream.expires_after(kIoTimeout);
        stream.connect(resolver.resolve(host_, std::to_string(port_)));

        const bool has_body = !content_type.empty();
        http::request<http::string_body> request{has_body ? http::verb::post : http::verb::get, target, 11};
        request.set(http::field::host, host_);
        request.set(http::field::user_agent, user_agent());
        request.keep_alive(false);
        if (has_body)
        {
            request.set(http::field::content_type, content_type);
            request.body() = std::move(body);
        }
        request.prepare_payload();
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::response_parser<http::string_body> parser;
        parser.body_limit(boost::none);
        http::read(stream, buffer, parser);

        HttpResponse response;
        response.status = parser.get().result_int();
        collect_headers(parser.get(), response);
        response.body = std::move(parser.get().body());
        close_stream(stream);
        return response;
    }

    HttpResponse HttpClient::download(const std::string &target, std::optional<std::uint64_t> range_start,
                                      const HeaderHandler &on_headers, const BodySink &sink)
    {
        boost::asio::io_context io_context;
        tcp::resolver resolver(io_context);
        beast::tcp_stream stream(io_context);
        stream.expires_after(kIoTimeout);
        stream.connect(resolver.resolve(host_, std::to_string(port_)));

        http::request<http::empty_body> request{http::verb::get, target, 11};
        request.set(http::field::host, host_);
        request.set(http::field::user_agent, user_agent());
        request.keep_alive(false);
        if (range_start)
        {
            request.set(http::field::range, "bytes=" + std::to_string(*range_start) + "-");
        }
        http::write(stream, request);

        beast::flat_buffer buffer;
        http::response_parser<http::buffer_body> parser;
        parser.body_limit(boost::none);
        stream.expires_after(kIoTimeout);
        http::read_header(stream, buffer, parser);

        HttpResponse response;
        response.status = parser.get().result_int();
        collect_headers(parser.get(), response);
        const bool deliver = response.ok() && on_headers(response);
        if (response.ok() && !deliver)
        {
            close_stream(stream);
            return response;
        }

        std::array<char, kReadBlock> block{};
        while (!parser.is_done())
        {
            parser.get().body().data = block.data();
            parser.get().body().size = block.size();
            stream.expires_after(kIoTimeout);
            beast::error_code ec;
            http::read(stream, buffer, parser, ec);
            if (ec == http::error::need_buffer)
            {
                ec = {};
            }
            if (ec)
            {
                throw beast::system_error{ec};
            }
            const auto received = block.size() - parser.get().body().size;
            if (received == 0)
            {
                continue;
            }
            if (deliver)
            {
                sink(block.data(), received);
            }
            else
            {
                response.body.append(block.data(), received);
            }
        }
        close_stream(stream);
        return response;
    }

} // namespace snapvault::client
