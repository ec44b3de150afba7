#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace snapvault::client
{

    struct ClientConfig
    {
        std::string host;
        std::uint16_t port{};
        std::string command;
        std::vector<std::string> args;
        std::size_t chunk_size{1024 * 1024};
        std::size_t retries{3};
        std::optional<std::filesystem::path> log_path;
        std::optional<std::filesystem::path> state_path;
    };

    ClientConfig parse_arguments(int argc, char *argv[]);

    std::string usage();

} // namespace snapvault::client
