#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "snapvault/server/server.hpp"
#include "snapvault/version.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace
{

    void print_usage(const char *program_name)
    {
        std::cout << "SnapVault server " << snapvault::version() << "\n"
                  << "Usage: " << program_name << " --port <PORT> [options]\n"
                  << "  --address <ADDRESS>        listen address (default 0.0.0.0)\n"
                  << "  --root <DIR>               working root for databases and temp data (default .)\n"
                  << "  --database <PATH>          managed database file, repeatable\n"
                  << "  --threads <N>              worker threads (default: hardware concurrency)\n"
                  << "  --upload-timeout <SEC>     idle time before an upload is abandoned (default 3600)\n"
                  << "  --backup-grace <SEC>       lifetime of a built backup archive (default 600)\n"
                  << "  --operation-grace <SEC>    lifetime of a finished restore operation (default 3600)\n"
                  << "  --sweep-interval <SEC>     cleanup timer period (default 30)\n"
                  << "  --max-body <BYTES>         largest accepted request body (default 1 GiB)\n"
                  << "  --archive-prefix <NAME>    backup archive name prefix (default books_db)\n"
                  << "  --log <FILE>               also log to FILE\n"
                  << "  --verbose                  debug logging\n";
    }

    std::optional<std::string> read_option(int &index, int argc, char *argv[])
    {
        if (index + 1 >= argc)
        {
            return std::nullopt;
        }
        ++index;
        return std::string(argv[index]);
    }

    std::chrono::seconds to_seconds(const std::string &value)
    {
        return std::chrono::seconds(std::stoll(value));
    }

} // namespace

int main(int argc, char *argv[])
{
    using snapvault::server::Server;
    using snapvault::server::ServerConfig;

    ServerConfig config;
    std::vector<std::filesystem::path> databases;

    try
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string arg = argv[i];
            if (arg == "--help" || arg == "-h")
            {
                print_usage(argv[0]);
                return EXIT_SUCCESS;
            }
            if (arg == "--verbose")
            {
                config.verbose = true;
                continue;
            }

            const bool takes_value = arg == "--port" || arg == "--root" || arg == "--address" || arg == "--threads" ||
                                     arg == "--database" || arg == "--upload-timeout" || arg == "--backup-grace" ||
                                     arg == "--operation-grace" || arg == "--sweep-interval" || arg == "--max-body" ||
                                     arg == "--archive-prefix" || arg == "--log";
            if (!takes_value)
            {
                std::cerr << "Unknown argument: " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }
            auto value = read_option(i, argc, argv);
            if (!value)
            {
                std::cerr << "Missing value for " << arg << std::endl;
                print_usage(argv[0]);
                return EXIT_FAILURE;
            }

            if (arg == "--port")
            {
                config.port = static_cast<std::uint16_t>(std::stoi(*value));
            }
            else if (arg == "--root")
            {
                config.root = std::filesystem::path(*value);
            }
            else if (arg == "--address")
            {
                config.address = *value;
            }
            else if (arg == "--threads")
            {
                config.worker_threads = static_cast<std::size_t>(std::stoul(*value));
            }
            else if (arg == "--database")
            {
                databases.emplace_back(*value);
            }
            else if (arg == "--upload-timeout")
            {
                config.upload_timeout = to_seconds(*value);
            }
            else if (arg == "--backup-grace")
            {
                config.backup_grace = to_seconds(*value);
            }
            else if (arg == "--operation-grace")
            {
                config.operation_grace = to_seconds(*value);
            }
            else if (arg == "--sweep-interval")
            {
                config.sweep_interval = to_seconds(*value);
            }
            else if (arg == "--max-body")
            {
                config.max_body_bytes = std::stoull(*value);
            }
            else if (arg == "--archive-prefix")
            {
                config.archive_prefix = *value;
            }
            else if (arg == "--log")
            {
                config.log_file = std::filesystem::path(*value);
            }
        }
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Invalid argument value: " << ex.what() << std::endl;
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }

    if (config.port == 0 || config.root.empty() || config.sweep_interval.count() <= 0)
    {
        print_usage(argv[0]);
        return EXIT_FAILURE;
    }
    if (!databases.empty())
    {
        config.databases = std::move(databases);
    }

    try
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (config.log_file)
        {
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(config.log_file->string(), true));
        }
        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(config.verbose ? spdlog::level::debug : spdlog::level::info);
        logger->set_pattern("%Y-%m-%d %H:%M:%S [%^%l%$] %v");
        spdlog::set_default_logger(logger);
        spdlog::info("Starting SnapVault server {} on {}:{}", snapvault::version(), config.address, config.port);

        Server server(std::move(config));
        server.run();
    }
    catch (const std::exception &ex)
    {
        std::cerr << "Server failed: " << ex.what() << std::endl;
        spdlog::error("Fatal error: {}", ex.what());
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
