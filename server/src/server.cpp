#include "nanocloud/server/server.hpp"

#include <csignal>
#include <exception>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "nanocloud/protocol.hpp"
#include "nanocloud/server/disconnect_signal.hpp"

namespace nanocloud::server
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

        // Asks httplib whether the peer of the request being served has gone away.
        class RequestDisconnectSignal final : public DisconnectSignal
        {
        public:
            explicit RequestDisconnectSignal(const httplib::Request &request) : request_(request) {}

            bool aborted() const override { return request_.is_connection_closed(); }

        private:
            const httplib::Request &request_;
        };

        std::string_view error_message(int status) noexcept
        {
            switch (status)
            {
            case 404:
                return "Not found.";
            case 413:
                return "Request body too large.";
            default:
                return "Malformed request.";
            }
        }

    } // namespace

    Server::Server(ServerConfig config)
        : api_(std::move(config)),
          signals_(signal_context_)
    {
        const auto &settings = api_.config();
        const auto workers = resolve_worker_threads(settings.worker_threads);
        http_.new_task_queue = [workers]
        { return new httplib::ThreadPool(workers); };
        http_.set_payload_max_length(static_cast<std::size_t>(settings.max_request_bytes));
        http_.set_read_timeout(settings.request_timeout);
        configure_routes();
    }

    Server::~Server()
    {
        stop();
    }

    void Server::configure_routes()
    {
        const auto serve = [this](const httplib::Request &request, httplib::Response &response)
        {
            const RequestDisconnectSignal signal(request);
            api_.handle(request, response, signal);
        };
        for (const std::string path : {"/api", "/api.php"})
        {
            http_.Get(path, serve);
            http_.Post(path, serve);
            http_.Put(path, serve);
            http_.Patch(path, serve);
            http_.Delete(path, serve);
        }

        // Both hooks see only the request head, so a disabled operation is
        // refused before its body is read or a 100 Continue goes out.
        http_.set_pre_routing_handler([this](const httplib::Request &request, httplib::Response &response)
                                      { return api_.admit(request, response) ? httplib::Server::HandlerResponse::Unhandled
                                                                             : httplib::Server::HandlerResponse::Handled; });
        http_.set_expect_100_continue_handler([this](const httplib::Request &request, httplib::Response &response)
                                              { return api_.admit(request, response) ? 100 : response.status; });

        http_.set_error_handler([](const httplib::Request &, httplib::Response &response)
                                {
            if (response.body.empty())
            {
                write_json(response, response.status, protocol::make_error(error_message(response.status)));
            } });
        http_.set_exception_handler([](const httplib::Request &request, httplib::Response &response,
                                       std::exception_ptr error)
                                    {
            try
            {
                std::rethrow_exception(error);
            }
            catch (const std::exception &ex)
            {
                spdlog::error("Unhandled error while serving {}: {}", request.target, ex.what());
            }
            catch (...)
            {
                spdlog::error("Unhandled non-standard exception while serving {}", request.target);
            }
            write_json(response, 500, protocol::make_error(nanocloud::ErrorCode::InternalError)); });
        http_.set_logger([](const httplib::Request &request, const httplib::Response &response)
                         { spdlog::debug("{}:{} {} {} -> {}", request.remote_addr, request.remote_port, request.method,
                                         request.target, response.status); });
    }

    std::uint16_t Server::start()
    {
        const auto &settings = api_.config();
        if (settings.port == 0)
        {
            const int bound = http_.bind_to_any_port(settings.address);
            if (bound < 0)
            {
                throw std::runtime_error("Failed to bind " + settings.address);
            }
            port_ = static_cast<std::uint16_t>(bound);
        }
        else
        {
            if (!http_.bind_to_port(settings.address, settings.port))
            {
                throw std::runtime_error("Failed to bind " + settings.address + ":" + std::to_string(settings.port));
            }
            port_ = settings.port;
        }

        listener_ = std::thread([this]
                                {
            http_.listen_after_bind();
            signal_context_.stop(); });
        http_.wait_until_ready();

        spdlog::info("Listening on {}:{} with storage root {} and chunk root {}", settings.address, port_,
                     settings.storage_root.string(), settings.chunk_root.string());
        if (settings.read_only)
        {
            spdlog::warn("Read-only mode: uploads are rejected");
        }
        return port_;
    }

    void Server::run()
    {
        signals_.add(SIGINT);
        signals_.add(SIGTERM);
        signals_.async_wait([this](const std::error_code &ec, int /*signal*/)
                            {
            if (!ec)
            {
                spdlog::info("Signal received, shutting down");
                http_.stop();
            } });

        start();
        signal_context_.run();
        stop();
    }

    void Server::stop()
    {
        http_.stop();
        join();
    }

    void Server::join()
    {
        if (listener_.joinable())
        {
            listener_.join();
        }
    }

} // namespace nanocloud::server
