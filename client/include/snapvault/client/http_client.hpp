#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace snapvault::client
{

    struct HttpResponse
    {
        unsigned status{};
        std::map<std::string, std::string> headers; // lower-case names
        std::string body;

        std::optional<std::string> header(const std::string &name) const;
        bool ok() const noexcept { return status >= 200 && status < 300; }
    };

    // Blocking HTTP/1.1 over a fresh connection per request. Transport failures
    // surface as boost::system::system_error.
    class HttpClient
    {
    public:
        // Returns false to abandon the body after the headers have been seen.
        using HeaderHandler = std::function<bool(const HttpResponse &)>;
        using BodySink = std::function<void(const char *data, std::size_t size)>;

        HttpClient(std::string host, std::uint16_t port);

        HttpResponse get(const std::string &target);

        HttpResponse post(const std::string &target, std::string body, const std::string &content_type);

        // Success bodies go to `sink` block by block; error bodies are kept in the returned response.
        HttpResponse download(const std::string &target, std::optional<std::uint64_t> range_start,
                              const HeaderHandler &on_headers, const BodySink &sink);

    private:
        std::string host_;
        std::uint16_t port_;
    };

} // namespace snapvault::client
