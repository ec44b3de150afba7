#include "snapvault/client/session.hpp"

#include <algorithm>
#include <chrono>
#include <iostream>
#include <thread>

#include "snapvault/protocol.hpp"

namespace snapvault::client
{

    ClientSession::ClientSession(ClientConfig config, TransferLog logger)
        : config_(std::move(config)),
          logger_(std::move(logger)),
          state_store_(config_.state_path),
          http_(config_.host, config_.port)
    {
    }

    int ClientSession::run()
    {
        logger_.info("session", "command ", config_.command, " against ", config_.host, ":", config_.port);
        return dispatch(config_.command, config_.args) ? 0 : 1;
    }

    bool ClientSession::dispatch(const std::string &command, const std::vector<std::string> &args)
    {
        if (command == "status")
        {
            return handle_status();
        }
        if (command == "backup")
        {
            if (args.size() != 1)
            {
                std::cout << "Usage: backup <out.zip>" << std::endl;
                return false;
            }
            return perform_backup(args[0]);
        }
        if (command == "restore")
        {
            if (args.size() != 1)
            {
                std::cout << "Usage: restore <archive.zip>" << std::endl;
                return false;
            }
            return perform_restore(args[0]);
        }
        if (command == "operation")
        {
            return handle_operation(args);
        }
        if (command == "verify")
        {
            return handle_verify(args);
        }
        std::cout << "Unknown command: " << command << "\n"
                  << usage();
        return false;
    }

    bool ClientSession::handle_status()
    {
        const auto response = http_.get("/backup/status");
        if (!response.ok())
        {
            print_error(response);
            return false;
        }
        const auto status = nlohmann::json::parse(response.body).get<snapvault::protocol::BackupStatus>();
        for (const auto &database : status.databases)
        {
            std::cout << (database.exists ? "  " : "! ") << database.path << "  "
                      << (database.exists ? database.size_formatted : std::string{"missing"}) << std::endl;
        }
        std::cout << "Total: " << status.total_size_formatted << std::endl;
        return status.all_files_exist;
    }

    bool ClientSession::handle_operation(const std::vector<std::string> &args)
    {
        if (args.size() != 1)
        {
            std::cout << "Usage: operation <upload_id>" << std::endl;
            return false;
        }
        const auto response = http_.get("/operation/status/" + args[0]);
        if (!response.ok())
        {
            print_error(response);
            return false;
        }
        const auto record = nlohmann::json::parse(response.body).get<snapvault::protocol::OperationRecord>();
        std::cout << "Operation " << args[0] << ": " << snapvault::protocol::to_string(record.status) << " ("
                  << record.chunks_received << "/" << record.total_chunks << " chunks)" << std::endl;
        for (const auto &file : record.restored_files)
        {
            std::cout << "  restored " << file << std::endl;
        }
        if (record.error)
        {
            std::cout << "  error: " << *record.error << std::endl;
        }
        return record.status != snapvault::protocol::OperationStatus::Failed;
    }

    bool ClientSession::handle_verify(const std::vector<std::string> &args)
    {
        if (args.size() != 2)
        {
            std::cout << "Usage: verify <filename> <checksum>" << std::endl;
            return false;
        }
        const auto response = http_.get("/backup/verify?filename=" + args[0] + "&checksum=" + args[1]);
        if (!response.ok())
        {
            print_error(response);
            return false;
        }
        const auto result = nlohmann::json::parse(response.body).get<snapvault::protocol::VerifyResponse>();
        if (result.verified)
        {
            std::cout << "OK" << std::endl;
            return true;
        }
        std::cout << "ERROR: checksum_mismatch" << std::endl;
        std::cout << "Expected " << result.expected.value_or("?") << ", received " << result.received.value_or("?")
                  << std::endl;
        return false;
    }

    void ClientSession::print_error(const HttpResponse &response) const
    {
        std::cout << "ERROR: http_" << response.status << std::endl;
        const auto json = nlohmann::json::parse(response.body, nullptr, false);
        if (json.is_object() && json.contains("error") && json["error"].is_string())
        {
            std::cout << json["error"].get<std::string>() << std::endl;
        }
        else if (!response.body.empty())
        {
            std::cout << response.body << std::endl;
        }
    }

    void ClientSession::backoff(std::size_t attempt) const
    {
        const auto delay = std::chrono::milliseconds(250) * (1 << std::min<std::size_t>(attempt, 5));
        std::this_thread::sleep_for(delay);
    }

} // namespace snapvault::client
