#include <cassert>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "snapvault/client/config.hpp"
#include "snapvault/client/transfer_state_store.hpp"

using namespace snapvault::client;

namespace
{

    ClientConfig parse(std::vector<std::string> args)
    {
        std::vector<char *> argv;
        for (auto &arg : args)
        {
            argv.push_back(arg.data());
        }
        return parse_arguments(static_cast<int>(argv.size()), argv.data());
    }

    void test_parse_arguments()
    {
        auto config = parse({"snapvault_client", "db.example.com:8080", "backup", "out.zip", "--chunk-size", "4096",
                             "--retries", "5"});
        assert(config.host == "db.example.com");
        assert(config.port == 8080);
        assert(config.command == "backup");
        assert(config.args == std::vector<std::string>{"out.zip"});
        assert(config.chunk_size == 4096);
        assert(config.retries == 5);
        assert(!config.log_path);

        config = parse({"snapvault_client", "localhost:5000", "status", "--log", "client.log"});
        assert(config.args.empty());
        assert(config.log_path == std::filesystem::path("client.log"));
        assert(config.chunk_size == 1024 * 1024);

        bool caught = false;
        try
        {
            (void)parse({"snapvault_client", "localhost", "status"});
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);

        caught = false;
        try
        {
            (void)parse({"snapvault_client", "localhost:5000", "restore", "a.zip", "--chunk-size", "0"});
        }
        catch (const std::runtime_error &)
        {
            caught = true;
        }
        assert(caught);
    }

    void test_transfer_state_store()
    {
        const auto root = std::filesystem::temp_directory_path() / "snapvault_state_test";
        std::filesystem::remove_all(root);
        const auto state_path = root / "nested" / "transfers.json";
        const auto target = root / "downloads" / ".." / "downloads" / "backup.zip";

        {
            TransferStateStore store(state_path);
            assert(store.entries().empty());
            assert(!store.find_download(target));
            store.upsert_download(target, "abc123", 4096, 0);
            store.update_download_progress(target, 1024);
            store.upsert_download(root / "downloads" / "other.zip", "def456", 10, 10);
        }
        assert(std::filesystem::exists(state_path));

        TransferStateStore reloaded(state_path);
        assert(reloaded.entries().size() == 2);
        const auto entry = reloaded.find_download(root / "downloads" / "backup.zip");
        assert(entry);
        assert(entry->checksum == "abc123");
        assert(entry->total_size == 4096);
        assert(entry->bytes_transferred == 1024);

        reloaded.upsert_download(target, "fresh", 2048, 0);
        assert(reloaded.entries().size() == 2);
        assert(reloaded.find_download(target)->checksum == "fresh");

        reloaded.remove_download(target);
        assert(!reloaded.find_download(target));
        assert(TransferStateStore(state_path).entries().size() == 1);

        {
            std::ofstream corrupt(state_path, std::ios::trunc);
            corrupt << "{ not json";
        }
        assert(TransferStateStore(state_path).entries().empty());

        std::filesystem::remove_all(root);
    }

} // namespace

void run_client_component_tests()
{
    test_parse_arguments();
    test_transfer_state_store();
}
