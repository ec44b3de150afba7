#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "snapvault/client/config.hpp"
#include "snapvault/client/http_client.hpp"
#include "snapvault/client/logger.hpp"
#include "snapvault/client/transfer_state_store.hpp"

namespace snapvault::client
{

    class ClientSession
    {
    public:
        ClientSession(ClientConfig config, TransferLog logger);

        // Returns the process exit code.
        int run();

        bool perform_backup(const std::filesystem::path &local_target);
        bool perform_restore(const std::filesystem::path &archive_path);

    private:
        bool dispatch(const std::string &command, const std::vector<std::string> &args);

        bool handle_status();
        bool handle_operation(const std::vector<std::string> &args);
        bool handle_verify(const std::vector<std::string> &args);

        enum class AttemptResult
        {
            Complete,
            Restart,
            Failed
        };

        // One request; transport failures propagate as boost::system::system_error.
        AttemptResult download_attempt(const std::filesystem::path &local_target, const std::filesystem::path &partial);
        bool await_restore(const std::string &upload_id);
        std::optional<HttpResponse> post_chunk(const std::string &body, const std::string &content_type,
                                               std::uint64_t chunk_index);

        void print_error(const HttpResponse &response) const;
        void backoff(std::size_t attempt) const;

        ClientConfig config_;
        TransferLog logger_;
        TransferStateStore state_store_;
        HttpClient http_;
    };

} // namespace snapvault::client
