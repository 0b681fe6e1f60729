#include "filegate/server/config.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "json_file.hpp"

namespace filegate::server
{

    namespace
    {
        constexpr auto kStateDir = ".filegate";
        constexpr auto kFoldersFile = "folders.json";
        constexpr auto kUsersFile = "users.json";
    } // namespace

    std::filesystem::path ServerConfig::effective_state_dir() const
    {
        return state_dir.empty() ? root / kStateDir : state_dir;
    }

    std::filesystem::path ServerConfig::folders_file() const
    {
        return effective_state_dir() / kFoldersFile;
    }

    std::filesystem::path ServerConfig::users_file() const
    {
        return effective_state_dir() / kUsersFile;
    }

    void load_config_file(const std::filesystem::path &path, ServerConfig &config)
    {
        const auto json = json_file::read(path);
        if (!json)
        {
            throw std::runtime_error("Config file not found: " + path.string());
        }
        if (!json->is_object())
        {
            throw std::runtime_error("Config file must contain a JSON object: " + path.string());
        }

        const auto &doc = *json;
        config.address = doc.value("address", config.address);
        config.port = doc.value("port", config.port);
        if (doc.contains("root"))
        {
            config.root = doc.at("root").get<std::string>();
        }
        if (doc.contains("state_dir"))
        {
            config.state_dir = doc.at("state_dir").get<std::string>();
        }
        if (doc.contains("landing_page"))
        {
            config.landing_page = doc.at("landing_page").get<std::string>();
        }
        config.worker_threads = doc.value("threads", config.worker_threads);
        config.session_ttl = std::chrono::minutes{doc.value("session_ttl_minutes", config.session_ttl.count())};
        config.max_failed_logins = doc.value("max_failed_logins", config.max_failed_logins);
        config.lockout_duration = std::chrono::minutes{doc.value("lockout_minutes", config.lockout_duration.count())};
        config.request_timeout =
            std::chrono::seconds{doc.value("request_timeout_seconds", config.request_timeout.count())};
        config.max_body_bytes = doc.value("max_body_bytes", config.max_body_bytes);
        if (doc.contains("log_file") && !doc.at("log_file").is_null())
        {
            config.log_file = std::filesystem::path(doc.at("log_file").get<std::string>());
        }
        config.debug = doc.value("debug", config.debug);
    }

} // namespace filegate::server
