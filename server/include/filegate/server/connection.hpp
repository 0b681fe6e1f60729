#pragma once

#include <asio/ip/tcp.hpp>
#include <asio/steady_timer.hpp>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <memory>
#include <string>
#include <vector>

#include "filegate/http.hpp"
#include "filegate/server/router.hpp"

namespace filegate::server
{

    struct ConnectionLimits
    {
        std::uint64_t max_body_bytes;
        std::chrono::seconds request_timeout;
    };

    // One HTTP exchange on an accepted socket: read head, read body, dispatch,
    // write the response, close. The socket's executor must be a strand since
    // the deadline timer completes concurrently with socket operations.
    class Connection : public std::enable_shared_from_this<Connection>
    {
    public:
        Connection(asio::ip::tcp::socket socket, const Router &router, ConnectionLimits limits);

        void start();

        void stop();

    private:
        void read_head();
        void on_head(std::size_t head_size);
        void send_continue();
        void read_body();
        void respond();
        void write_response(http::Response response);
        void write_next_chunk();
        void finish();

        std::string remote_endpoint() const;

        asio::ip::tcp::socket socket_;
        asio::steady_timer deadline_;
        const Router &router_;
        ConnectionLimits limits_;

        std::string inbound_;
        http::Request request_;
        std::uint64_t body_length_{};

        std::string outbound_;
        std::ifstream file_;
        std::vector<char> chunk_;
        std::uint64_t file_remaining_{};
        bool closed_{false};
    };

} // namespace filegate::server
