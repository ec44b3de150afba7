#pragma once

#include <ostream>
#include <boost/beast/http/status.hpp>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

#include "snapvault/error_codes.hpp"

namespace snapvault::server::session_common
{

    struct Target
    {
        std::string path;
        std::map<std::string, std::string> query;

        std::optional<std::string> param(const std::string &key) const;
    };

    // Splits "/path?a=1&b=2" and percent-decodes the query values.
    Target parse_target(std::string_view target);

    std::string url_decode(std::string_view value);

    boost::beast::http::status status_for(ErrorCode code) noexcept;

    // Strips directories and anything outside [A-Za-z0-9._-].
    std::string safe_file_name(std::string_view name);

    std::optional<std::uint64_t> parse_unsigned(std::string_view value);

} // namespace snapvault::server::session_common
