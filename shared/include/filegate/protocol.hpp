/**
 * FileGate - JSON bodies exchanged with browser clients.
 */
#pragma once

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace filegate::protocol
{

    // Thrown by the from_json overloads when a body lacks a required field.
    class ProtocolError : public std::runtime_error
    {
    public:
        explicit ProtocolError(const std::string &message);
    };

    // Accepts JSON booleans as well as "true"/"false" strings and 0/1 numbers.
    bool flag_from_json(const nlohmann::json &value);

    // Query-string flag ("true"/"false", case-insensitive, or "1"/"0").
    std::optional<bool> parse_flag(std::string_view value);

    struct LoginRequest
    {
        std::string username;
        std::string password;
    };

    void to_json(nlohmann::json &json, const LoginRequest &request);
    void from_json(const nlohmann::json &json, LoginRequest &request);

    struct LoginResponse
    {
        std::string token;
        std::string username;
    };

    void to_json(nlohmann::json &json, const LoginResponse &response);

    struct FileItem
    {
        std::string name;
        bool is_directory{};
        std::uint64_t size{};
        std::int64_t last_modified{};
    };

    void to_json(nlohmann::json &json, const FileItem &item);
    void from_json(const nlohmann::json &json, FileItem &item);

    struct CreateRequest
    {
        std::string path;
        bool is_directory{};
    };

    void from_json(const nlohmann::json &json, CreateRequest &request);

    struct SaveRequest
    {
        std::string path;
        std::string content;
    };

    void from_json(const nlohmann::json &json, SaveRequest &request);

    struct RenameRequest
    {
        std::string path;
        std::string new_name;
        bool is_directory{};
    };

    void from_json(const nlohmann::json &json, RenameRequest &request);

} // namespace filegate::protocol
