#include "snapvault/server/server.hpp"

#include <boost/asio/ip/address.hpp>
#include <boost/asio/post.hpp>

#include <csignal>
#include <thread>

#include <spdlog/spdlog.h>

#include "snapvault/server/session.hpp"

namespace snapvault::server
{

    namespace
    {

        std::size_t resolve_worker_threads(std::size_t requested)
        {
            if (requested > 0)
            {
                return requested;
            }
            const auto hardware = std::thread::hardware_concurrency();
            return hardware == 0 ? 2 : hardware;
        }

        std::filesystem::path under_root(const std::filesystem::path &root, const std::filesystem::path &path)
        {
            auto resolved = path.is_absolute() ? path : root / path;
            std::filesystem::create_directories(resolved);
            return resolved.lexically_normal();
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_),
          backups_dir_(under_root(config_.root, config_.backups_dir)),
          files_(config_.root, config_.databases),
          registry_(under_root(config_.root, config_.uploads_dir)),
          assembler_(registry_),
          restore_engine_(files_, registry_)
    {
        const auto address = boost::asio::ip::make_address(config_.address);
        const boost::asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} with root {}", config_.address, port(), config_.root.string());
        for (const auto &file : files_.scan())
        {
            spdlog::info("Managing {} ({})", file.path.generic_string(), file.exists ? file.size_formatted : "missing");
        }

        // Operations finished before a restart still need their staging data reclaimed.
        for (const auto &id : registry_.terminal_ids())
        {
            reclaimer_.schedule_operation_removal(registry_, id, config_.operation_grace);
        }

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const boost::system::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            spdlog::info("Signal received, shutting down");
            shutdown();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count > 0 ? worker_count - 1 : 0);
        for (std::size_t i = 1; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
        io_context_.run();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        reclaimer_.clear();
    }

    void Server::stop()
    {
        boost::asio::post(io_context_, [this]
                          { shutdown(); });
    }

    std::uint16_t Server::port() const
    {
        boost::system::error_code ec;
        const auto endpoint = acceptor_.local_endpoint(ec);
        return ec ? config_.port : endpoint.port();
    }

    void Server::accept_next()
    {
        acceptor_.async_accept([this](const boost::system::error_code &ec, boost::asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(boost::system::error_code ec, boost::asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{config_, files_, registry_, assembler_, restore_engine_, reclaimer_, backups_dir_};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (!ec || ec == boost::asio::error::operation_aborted)
        {
            if (acceptor_.is_open())
            {
                accept_next();
            }
        }
        else
        {
            spdlog::error("Accept error: {}", ec.message());
            accept_next();
        }
    }

    void Server::schedule_sweep()
    {
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const boost::system::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            run_sweep();
            schedule_sweep(); });
    }

    void Server::run_sweep()
    {
        const auto expired = registry_.expire_idle(config_.upload_timeout, TransferOperation::Clock::now());
        for (const auto &id : expired)
        {
            spdlog::warn("Upload {} abandoned, scheduling cleanup", id);
            reclaimer_.schedule_operation_removal(registry_, id, config_.operation_grace);
        }
        const auto ran = reclaimer_.run_due();
        if (ran > 0)
        {
            spdlog::debug("Sweep reclaimed {} item(s), {} pending", ran, reclaimer_.pending());
        }
    }

    void Server::shutdown()
    {
        boost::system::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        signals_.cancel();
        io_context_.stop();
    }

} // namespace snapvault::server
