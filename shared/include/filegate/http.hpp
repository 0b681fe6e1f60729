/**
 * FileGate - Minimal HTTP/1.1 request parsing and response serialization.
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace filegate::http
{

    struct Header
    {
        std::string name;
        std::string value;
    };

    struct Request
    {
        std::string method;
        std::string target;
        std::string path;
        std::string version;
        std::map<std::string, std::string> query;
        // Keys are lower-cased.
        std::map<std::string, std::string> headers;
        std::string body;

        std::optional<std::string> header(std::string_view name) const;
        std::optional<std::string> query_param(std::string_view name) const;
    };

    struct Response
    {
        std::uint16_t status{200};
        std::vector<Header> headers;
        std::string body;
        // When set, the file is sent as the body instead of `body`.
        std::optional<std::filesystem::path> file;

        void set_header(std::string name, std::string value);
        std::optional<std::string> header(std::string_view name) const;
    };

    // Parses the request line and header block (without the terminating blank line).
    std::optional<Request> parse_request_head(std::string_view head);

    std::map<std::string, std::string> parse_query(std::string_view query);

    std::string url_decode(std::string_view text);

    // Absent header yields 0, a malformed one yields std::nullopt.
    std::optional<std::uint64_t> content_length(const Request &request);

    std::optional<std::string> bearer_token(const Request &request);

    std::string_view reason_phrase(std::uint16_t status) noexcept;

    std::string serialize_head(const Response &response, std::uint64_t content_length);

    std::string to_lower(std::string_view text);

} // namespace filegate::http
