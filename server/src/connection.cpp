#include "filegate/server/connection.hpp"

#include <asio/buffer.hpp>
#include <asio/read.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <algorithm>
#include <filesystem>

#include <spdlog/spdlog.h>

namespace filegate::server
{

    namespace
    {

        constexpr std::size_t kMaxHeadBytes = 64 * 1024;
        constexpr std::size_t kFileChunkBytes = 64 * 1024;
        constexpr std::string_view kHeadTerminator = "\r\n\r\n";
        constexpr std::string_view kContinueLine = "HTTP/1.1 100 Continue\r\n\r\n";

    } // namespace

    Connection::Connection(asio::ip::tcp::socket socket, const Router &router, ConnectionLimits limits)
        : socket_(std::move(socket)), deadline_(socket_.get_executor()), router_(router), limits_(limits) {}

    void Connection::start()
    {
        spdlog::debug("Client connected from {}", remote_endpoint());
        auto self = shared_from_this();
        deadline_.expires_after(limits_.request_timeout);
        deadline_.async_wait([this, self](const std::error_code &ec)
                             {
                                 if (ec)
                                 {
                                     return;
                                 }
                                 spdlog::warn("Request from {} timed out", remote_endpoint());
                                 stop();
                             });
        read_head();
    }

    void Connection::stop()
    {
        if (closed_)
        {
            return;
        }
        closed_ = true;
        std::error_code ec;
        deadline_.cancel();
        socket_.shutdown(asio::ip::tcp::socket::shutdown_both, ec);
        socket_.close(ec);
        file_.close();
    }

    void Connection::read_head()
    {
        auto self = shared_from_this();
        asio::async_read_until(socket_, asio::dynamic_buffer(inbound_, kMaxHeadBytes), kHeadTerminator,
                               [this, self](const std::error_code &ec, std::size_t head_size)
                               {
                                   if (ec == asio::error::not_found)
                                   {
                                       write_response(error_response(ErrorCode::BadRequest, "Request head too large"));
                                       return;
                                   }
                                   if (ec)
                                   {
                                       stop();
                                       return;
                                   }
                                   on_head(head_size);
                               });
    }

    void Connection::on_head(std::size_t head_size)
    {
        auto parsed = http::parse_request_head(std::string_view(inbound_).substr(0, head_size));
        if (!parsed)
        {
            spdlog::debug("Malformed request head from {}", remote_endpoint());
            write_response(error_response(ErrorCode::BadRequest, "Malformed request"));
            return;
        }
        request_ = std::move(*parsed);
        inbound_.erase(0, head_size);

        const auto length = http::content_length(request_);
        if (!length)
        {
            write_response(error_response(ErrorCode::BadRequest, "Invalid Content-Length"));
            return;
        }
        if (request_.header("transfer-encoding"))
        {
            write_response(error_response(ErrorCode::BadRequest, "Chunked request bodies are not supported"));
            return;
        }
        if (*length > limits_.max_body_bytes)
        {
            spdlog::warn("Rejected {} byte body from {} on {}", *length, remote_endpoint(), request_.path);
            write_response(error_response(ErrorCode::PayloadTooLarge, "Request body too large"));
            return;
        }
        body_length_ = *length;

        request_.body = std::move(inbound_);
        if (request_.body.size() > body_length_)
        {
            request_.body.resize(static_cast<std::size_t>(body_length_));
        }
        if (request_.body.size() == body_length_)
        {
            respond();
            return;
        }

        const auto expect = request_.header("expect");
        if (expect && http::to_lower(*expect) == "100-continue")
        {
            send_continue();
            return;
        }
        read_body();
    }

    void Connection::send_continue()
    {
        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(kContinueLine.data(), kContinueLine.size()),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  stop();
                                  return;
                              }
                              read_body();
                          });
    }

    void Connection::read_body()
    {
        auto self = shared_from_this();
        const auto missing = static_cast<std::size_t>(body_length_ - request_.body.size());
        asio::async_read(socket_, asio::dynamic_buffer(request_.body), asio::transfer_exactly(missing),
                         [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                         {
                             if (ec)
                             {
                                 spdlog::debug("Body read from {} failed: {}", remote_endpoint(), ec.message());
                                 stop();
                                 return;
                             }
                             respond();
                         });
    }

    void Connection::respond()
    {
        auto response = router_.dispatch(request_);
        spdlog::debug("{} {} from {} -> {}", request_.method, request_.target, remote_endpoint(), response.status);
        write_response(std::move(response));
    }

    void Connection::write_response(http::Response response)
    {
        if (closed_)
        {
            return;
        }
        response.set_header("Access-Control-Allow-Origin", "*");
        std::uint64_t length = response.body.size();
        if (response.file)
        {
            std::error_code ec;
            const auto size = std::filesystem::file_size(*response.file, ec);
            file_.open(*response.file, std::ios::binary);
            if (ec || !file_.is_open())
            {
                spdlog::error("Cannot open {} for download: {}", response.file->string(),
                              ec ? ec.message() : "open failed");
                file_.close();
                response = error_response(ErrorCode::Internal, "Internal server error");
                response.set_header("Access-Control-Allow-Origin", "*");
                length = response.body.size();
            }
            else
            {
                length = size;
                file_remaining_ = size;
                response.body.clear();
            }
        }

        outbound_ = http::serialize_head(response, length);
        if (file_remaining_ == 0)
        {
            outbound_ += response.body;
        }

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(outbound_),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("Write to {} failed: {}", remote_endpoint(), ec.message());
                                  stop();
                                  return;
                              }
                              if (file_remaining_ > 0)
                              {
                                  chunk_.resize(kFileChunkBytes);
                                  write_next_chunk();
                                  return;
                              }
                              finish();
                          });
    }

    void Connection::write_next_chunk()
    {
        const auto wanted = static_cast<std::size_t>(std::min<std::uint64_t>(file_remaining_, chunk_.size()));
        file_.read(chunk_.data(), static_cast<std::streamsize>(wanted));
        const auto got = static_cast<std::size_t>(file_.gcount());
        if (got == 0)
        {
            // The file shrank after Content-Length was sent; the client sees a short body.
            spdlog::error("Download of {} bytes cut short for {}", file_remaining_, remote_endpoint());
            stop();
            return;
        }
        file_remaining_ -= got;

        auto self = shared_from_this();
        asio::async_write(socket_, asio::buffer(chunk_.data(), got),
                          [this, self](const std::error_code &ec, std::size_t /*bytes_transferred*/)
                          {
                              if (ec)
                              {
                                  spdlog::debug("Download to {} aborted: {}", remote_endpoint(), ec.message());
                                  stop();
                                  return;
                              }
                              if (file_remaining_ > 0)
                              {
                                  write_next_chunk();
                                  return;
                              }
                              finish();
                          });
    }

    void Connection::finish()
    {
        if (closed_)
        {
            return;
        }
        std::error_code ec;
        socket_.shutdown(asio::ip::tcp::socket::shutdown_send, ec);
        stop();
    }

    std::string Connection::remote_endpoint() const
    {
        std::error_code ec;
        const auto endpoint = socket_.remote_endpoint(ec);
        if (ec)
        {
            return "unknown";
        }
        return endpoint.address().to_string() + ":" + std::to_string(endpoint.port());
    }

} // namespace filegate::server
