#include "filegate/protocol.hpp"

#include "filegate/http.hpp"

namespace filegate::protocol
{

    namespace
    {

        const nlohmann::json *find_field(const nlohmann::json &json, std::string_view key,
                                         std::string_view alternate = {})
        {
            if (!json.is_object())
            {
                return nullptr;
            }
            auto it = json.find(std::string(key));
            if (it == json.end() && !alternate.empty())
            {
                it = json.find(std::string(alternate));
            }
            if (it == json.end() || it->is_null())
            {
                return nullptr;
            }
            return &*it;
        }

        std::string string_from_json(const nlohmann::json &value)
        {
            if (value.is_string())
            {
                return value.get<std::string>();
            }
            if (value.is_boolean() || value.is_number())
            {
                return value.dump();
            }
            throw ProtocolError("Expected a string value");
        }

    } // namespace

    ProtocolError::ProtocolError(const std::string &message) : std::runtime_error(message) {}

    bool flag_from_json(const nlohmann::json &value)
    {
        if (value.is_boolean())
        {
            return value.get<bool>();
        }
        if (value.is_number_integer())
        {
            return value.get<std::int64_t>() != 0;
        }
        if (value.is_string())
        {
            if (const auto parsed = parse_flag(value.get<std::string>()))
            {
                return *parsed;
            }
        }
        throw ProtocolError("Expected a boolean value");
    }

    std::optional<bool> parse_flag(std::string_view value)
    {
        const auto lowered = http::to_lower(value);
        if (lowered == "true" || lowered == "1")
        {
            return true;
        }
        if (lowered == "false" || lowered == "0")
        {
            return false;
        }
        return std::nullopt;
    }

    void to_json(nlohmann::json &json, const LoginRequest &request)
    {
        json = {
            {"username", request.username},
            {"password", request.password},
        };
    }

    void from_json(const nlohmann::json &json, LoginRequest &request)
    {
        const auto *username = find_field(json, "username", "Username");
        const auto *password = find_field(json, "password", "Password");
        if (username == nullptr || password == nullptr)
        {
            throw ProtocolError("Invalid request format");
        }
        request.username = string_from_json(*username);
        request.password = string_from_json(*password);
    }

    void to_json(nlohmann::json &json, const LoginResponse &response)
    {
        json = {
            {"success", true},
            {"token", response.token},
            {"username", response.username},
        };
    }

    void to_json(nlohmann::json &json, const FileItem &item)
    {
        json = {
            {"name", item.name},
            {"isDirectory", item.is_directory},
            {"size", item.size},
            {"lastModified", item.last_modified},
        };
    }

    void from_json(const nlohmann::json &json, FileItem &item)
    {
        item.name = json.at("name").get<std::string>();
        item.is_directory = json.value("isDirectory", false);
        item.size = json.value("size", std::uint64_t{0});
        item.last_modified = json.value("lastModified", std::int64_t{0});
    }

    void from_json(const nlohmann::json &json, CreateRequest &request)
    {
        const auto *path = find_field(json, "path");
        if (path == nullptr)
        {
            throw ProtocolError("Path is required.");
        }
        request.path = string_from_json(*path);
        const auto *is_directory = find_field(json, "isDirectory");
        request.is_directory = is_directory != nullptr && flag_from_json(*is_directory);
    }

    void from_json(const nlohmann::json &json, SaveRequest &request)
    {
        const auto *path = find_field(json, "path");
        const auto *content = find_field(json, "content");
        if (path == nullptr || content == nullptr)
        {
            throw ProtocolError("Path and content are required.");
        }
        request.path = string_from_json(*path);
        request.content = string_from_json(*content);
    }

    void from_json(const nlohmann::json &json, RenameRequest &request)
    {
        const auto *path = find_field(json, "path");
        const auto *new_name = find_field(json, "newName");
        const auto *is_directory = find_field(json, "isDirectory");
        if (path == nullptr || new_name == nullptr || is_directory == nullptr)
        {
            throw ProtocolError("Path, newName, and isDirectory are required.");
        }
        request.path = string_from_json(*path);
        request.new_name = string_from_json(*new_name);
        request.is_directory = flag_from_json(*is_directory);
    }

} // namespace filegate::protocol
