#pragma once

#include <asio/executor_work_guard.hpp>
#include <asio/io_context.hpp>
#include <asio/ip/tcp.hpp>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "filegate/server/config.hpp"
#include "filegate/server/file_service.hpp"
#include "filegate/server/folder_map.hpp"
#include "filegate/server/login_throttle.hpp"
#include "filegate/server/path_resolver.hpp"
#include "filegate/server/router.hpp"
#include "filegate/server/session_store.hpp"
#include "filegate/server/user_store.hpp"

namespace filegate::server
{

    class Server
    {
    public:
        explicit Server(ServerConfig config);
        ~Server();

        Server(const Server &) = delete;
        Server &operator=(const Server &) = delete;

        // Binds the listener and runs the io_context on the worker pool; returns immediately.
        void start();

        // Persists the folder map, closes the listener and joins the workers.
        void stop();

        // start(), then blocks until SIGINT or SIGTERM, then stop().
        void run();

        // Port actually bound (useful when the configured port is 0).
        std::uint16_t port() const noexcept { return bound_port_; }

        bool create_account(const std::string &username, const std::string &password, std::string &message);
        bool delete_account(const std::string &username);

        const ServerConfig &config() const noexcept { return config_; }
        SessionStore &sessions() noexcept { return sessions_; }

    private:
        void load_state();
        void accept_next();
        void on_accept(std::error_code ec, asio::ip::tcp::socket socket);

        ServerConfig config_;
        asio::io_context io_context_;
        asio::executor_work_guard<asio::io_context::executor_type> work_guard_;
        asio::ip::tcp::acceptor acceptor_;

        SessionStore sessions_;
        FolderMap folders_;
        UserStore users_;
        LoginThrottle throttle_;
        PathResolver resolver_;
        FileService files_;
        Router router_;

        std::vector<std::thread> workers_;
        std::mutex state_mutex_;
        bool state_loaded_{false};
        std::atomic<bool> started_{false};
        std::atomic<bool> stopping_{false};
        std::uint16_t bound_port_{0};
    };

} // namespace filegate::server
