#include "xferstat/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <csignal>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

#include "xferstat/server/session.hpp"

namespace xferstat::server
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

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          library_(config_.root),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          acceptor_(io_context_),
          signals_(io_context_),
          sweep_timer_(io_context_)
    {
        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();

        spdlog::info("Listening on {}:{} serving {}", config_.address, config_.port, library_.root().string());

        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
        if (!ec) {
            handle_signal();
        } });
    }

    void Server::run()
    {
        accept_next();
        schedule_sweep();

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count - 1);
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
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (!ec)
        {
            ServerServices services{library_, registry_, config_.chunk_size};
            auto session = std::make_shared<Session>(std::move(socket), services);
            session->start();
        }
        if (ec == asio::error::operation_aborted || !acceptor_.is_open())
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        accept_next();
    }

    void Server::schedule_sweep()
    {
        if (config_.stall_timeout.count() <= 0 || config_.sweep_interval.count() <= 0)
        {
            return;
        }
        sweep_timer_.expires_after(config_.sweep_interval);
        sweep_timer_.async_wait([this](const std::error_code &ec)
                                {
            if (ec)
            {
                return;
            }
            sweep_stalled();
            schedule_sweep(); });
    }

    void Server::sweep_stalled()
    {
        const auto threshold = std::chrono::duration_cast<std::chrono::milliseconds>(config_.stall_timeout).count();
        for (const auto &entry : registry_.find_stalled(threshold))
        {
            spdlog::warn("{} {} stalled for {} ms, terminating", protocol::to_string(entry.kind),
                         entry.status->describe(), entry.status->millis_since_last_update());
            entry.status->terminate();
        }
    }

    void Server::handle_signal()
    {
        std::error_code ec;
        acceptor_.close(ec);
        sweep_timer_.cancel();
        io_context_.stop();
        spdlog::info("Signal received, shutting down");
    }

} // namespace xferstat::server
