#include "snapvault/client/config.hpp"

#include <filesystem>
#include <stdexcept>
#include <string>

namespace snapvault::client
{

    std::string usage()
    {
        return "Usage: snapvault_client <host>:<port> <command> [args] [--chunk-size <bytes>] [--retries <n>] "
               "[--log <file>] [--state <file>]\n"
               "Commands:\n"
               "  status                         show managed database files\n"
               "  backup <out.zip>               download a backup, resuming an interrupted one\n"
               "  restore <archive.zip>          upload an archive in chunks and restore it\n"
               "  operation <upload_id>          show a restore operation\n"
               "  verify <filename> <checksum>   check a server-side backup archive\n";
    }

    ClientConfig parse_arguments(int argc, char *argv[])
    {
        if (argc < 3)
        {
            throw std::runtime_error(usage());
        }

        ClientConfig config;
        int index = 1;
        const std::string endpoint = argv[index++];

        const auto colon_pos = endpoint.rfind(':');
        if (colon_pos == std::string::npos || colon_pos == 0)
        {
            throw std::runtime_error("Expected endpoint format host:port");
        }
        config.host = endpoint.substr(0, colon_pos);
        const auto port_string = endpoint.substr(colon_pos + 1);
        config.port = static_cast<std::uint16_t>(std::stoi(port_string));

        config.command = argv[index++];

        while (index < argc)
        {
            const std::string arg = argv[index++];
            if (arg == "--log")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--log requires a file path");
                }
                config.log_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--state")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--state requires a file path");
                }
                config.state_path = std::filesystem::path(argv[index++]);
            }
            else if (arg == "--chunk-size")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--chunk-size requires a value (bytes)");
                }
                config.chunk_size = static_cast<std::size_t>(std::stoull(argv[index++]));
                if (config.chunk_size == 0)
                {
                    throw std::runtime_error("--chunk-size must be positive");
                }
            }
            else if (arg == "--retries")
            {
                if (index >= argc)
                {
                    throw std::runtime_error("--retries requires a value");
                }
                config.retries = static_cast<std::size_t>(std::stoull(argv[index++]));
            }
            else if (arg.starts_with("--"))
            {
                throw std::runtime_error("Unknown argument: " + arg);
            }
            else
            {
                config.args.push_back(arg);
            }
        }

        return config;
    }

} // namespace snapvault::client
