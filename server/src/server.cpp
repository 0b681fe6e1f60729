#include "filegate/server/server.hpp"

#include <asio/ip/address.hpp>
#include <asio/post.hpp>
#include <asio/signal_set.hpp>
#include <asio/strand.hpp>

#include <chrono>
#include <csignal>
#include <future>
#include <memory>

#include <spdlog/spdlog.h>

#include "filegate/server/connection.hpp"
#include "filegate/server/logging.hpp"

namespace filegate::server
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

        template <typename Duration>
        std::chrono::seconds as_seconds(Duration duration)
        {
            return std::chrono::duration_cast<std::chrono::seconds>(duration);
        }

    } // namespace

    Server::Server(ServerConfig config)
        : config_(std::move(config)),
          io_context_(static_cast<int>(resolve_worker_threads(config_.worker_threads))),
          work_guard_(asio::make_work_guard(io_context_)),
          acceptor_(asio::make_strand(io_context_)),
          sessions_(as_seconds(config_.session_ttl)),
          folders_(config_.folders_file()),
          users_(config_.users_file()),
          throttle_(config_.max_failed_logins, as_seconds(config_.lockout_duration)),
          resolver_(config_.root, sessions_, folders_, config_.effective_state_dir()),
          files_(resolver_),
          router_(RouterServices{sessions_, files_, users_, throttle_, config_.landing_page})
    {
    }

    Server::~Server()
    {
        stop();
    }

    void Server::load_state()
    {
        std::lock_guard lock(state_mutex_);
        if (state_loaded_)
        {
            return;
        }
        folders_.load();
        state_loaded_ = true;
    }

    void Server::start()
    {
        if (started_.exchange(true))
        {
            return;
        }
        load_state();

        const auto address = asio::ip::make_address(config_.address);
        const asio::ip::tcp::endpoint endpoint(address, config_.port);
        acceptor_.open(endpoint.protocol());
        acceptor_.set_option(asio::ip::tcp::acceptor::reuse_address(true));
        acceptor_.bind(endpoint);
        acceptor_.listen();
        bound_port_ = acceptor_.local_endpoint().port();

        spdlog::info("Listening on {}:{} with root {}", config_.address, bound_port_, resolver_.root().string());

        asio::post(acceptor_.get_executor(), [this]
                   { accept_next(); });

        const auto worker_count = resolve_worker_threads(config_.worker_threads);
        workers_.reserve(worker_count);
        for (std::size_t i = 0; i < worker_count; ++i)
        {
            workers_.emplace_back([this]
                                  { io_context_.run(); });
        }
        spdlog::info("Server event loop running with {} threads", worker_count);
    }

    void Server::stop()
    {
        if (!started_ || stopping_.exchange(true))
        {
            return;
        }

        try
        {
            folders_.save();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Failed to save folder map: {}", ex.what());
        }

        asio::post(acceptor_.get_executor(), [this]
                   {
            std::error_code ec;
            acceptor_.close(ec); });
        work_guard_.reset();

        for (auto &worker : workers_)
        {
            if (worker.joinable())
            {
                worker.join();
            }
        }
        workers_.clear();
        spdlog::info("Server stopped");
    }

    void Server::run()
    {
        start();

        std::promise<int> signalled;
        auto received = signalled.get_future();
        asio::signal_set signals(io_context_, SIGINT, SIGTERM);
        signals.async_wait([&signalled](const std::error_code &ec, int signal_number)
                           { signalled.set_value(ec ? 0 : signal_number); });

        const auto signal_number = received.get();
        spdlog::info("Signal {} received, shutting down", signal_number);
        stop();
    }

    bool Server::create_account(const std::string &username, const std::string &password, std::string &message)
    {
        load_state();
        if (!users_.create_account(username, password, message))
        {
            return false;
        }
        if (username != kAdminUser)
        {
            folders_.assign(username, username);
        }
        folders_.save();
        spdlog::info("Account created for {}", username);
        return true;
    }

    bool Server::delete_account(const std::string &username)
    {
        load_state();
        if (!users_.delete_account(username))
        {
            return false;
        }
        folders_.remove(username);
        folders_.save();
        const auto revoked = sessions_.revoke_user(username);
        security_log()->info("Account {} deleted, {} session(s) revoked", username, revoked);
        return true;
    }

    void Server::accept_next()
    {
        acceptor_.async_accept(asio::make_strand(io_context_),
                               [this](const std::error_code &ec, asio::ip::tcp::socket socket)
                               { on_accept(ec, std::move(socket)); });
    }

    void Server::on_accept(std::error_code ec, asio::ip::tcp::socket socket)
    {
        if (stopping_ || ec == asio::error::operation_aborted)
        {
            return;
        }
        if (ec)
        {
            spdlog::error("Accept error: {}", ec.message());
        }
        else
        {
            const ConnectionLimits limits{config_.max_body_bytes, config_.request_timeout};
            auto connection = std::make_shared<Connection>(std::move(socket), router_, limits);
            connection->start();
        }
        if (acceptor_.is_open())
        {
            accept_next();
        }
    }

} // namespace filegate::server
