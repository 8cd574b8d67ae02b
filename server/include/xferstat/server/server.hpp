#pragma once

#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <asio/signal_set.hpp>
#include <asio/steady_timer.hpp>
#include <thread>
#include <vector>

#include "xferstat/server/config.hpp"
#include "xferstat/server/media_library.hpp"
#include "xferstat/server/status_registry.hpp"

namespace xferstat::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);

        void run();

    private:
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);
        void schedule_sweep();
        void sweep_stalled();
        void handle_signal();

        ServerConfig config_;
        // Sessions still queued in the io_context reference these on destruction.
        MediaLibrary library_;
        StatusRegistry registry_;

        asio::io_context io_context_;
        asio::ip::tcp::acceptor acceptor_;
        asio::signal_set signals_;
        asio::steady_timer sweep_timer_;

        std::vector<std::thread> workers_;
    };

} // namespace xferstat::server
