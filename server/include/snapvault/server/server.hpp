#pragma once

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/asio/steady_timer.hpp>
#include <filesystem>
#include <memory>
#include <thread>
#include <vector>

#include "snapvault/server/chunk_assembler.hpp"
#include "snapvault/server/config.hpp"
#include "snapvault/server/managed_files.hpp"
#include "snapvault/server/operation_registry.hpp"
#include "snapvault/server/reclaimer.hpp"
#include "snapvault/server/restore_engine.hpp"

namespace snapvault::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        // Blocks until stop() or SIGINT/SIGTERM.
        void run();

        // Safe to call from any thread.
        void stop();

        std::uint16_t port() const;

        OperationRegistry &registry() noexcept { return registry_; }
        Reclaimer &reclaimer() noexcept { return reclaimer_; }

    private:
        void accept_next();
        void on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket);
        void schedule_sweep();
        void run_sweep();
        void shutdown();

        ServerConfig config_;
        boost::asio::io_context io_context_;
        boost::asio::ip::tcp::acceptor acceptor_;
        boost::asio::signal_set signals_;
        boost::asio::steady_timer sweep_timer_;

        std::filesystem::path backups_dir_;
        ManagedFileSet files_;
        OperationRegistry registry_;
        Reclaimer reclaimer_;
        ChunkAssembler assembler_;
        RestoreEngine restore_engine_;

        std::vector<std::thread> workers_;
    };

} // namespace snapvault::server
