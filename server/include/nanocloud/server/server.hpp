#pragma once

#include <asio/io_context.hpp>
#include <asio/signal_set.hpp>

#include <cstdint>
#include <thread>

#include <httplib.h>

#include "nanocloud/server/api.hpp"
#include "nanocloud/server/config.hpp"

namespace nanocloud::server
{

    // HTTP front of the Api: routes, body limits, worker pool and shutdown on
    // SIGINT/SIGTERM.
    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Binds the configured address and serves on a background thread.
        // Port 0 picks an ephemeral port. Returns the bound port.
        std::uint16_t start();

        // start() and block until a termination signal arrives or stop() is called.
        void run();

        void stop();

        std::uint16_t port() const noexcept { return port_; }

    private:
        void configure_routes();
        void join();

        Api api_;
        httplib::Server http_;
        asio::io_context signal_context_;
        asio::signal_set signals_;
        std::thread listener_;
        std::uint16_t port_{};
    };

} // namespace nanocloud::server
