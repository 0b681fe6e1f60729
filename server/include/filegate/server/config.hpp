#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace filegate::server
{

    struct ServerConfig
    {
        std::string address{"0.0.0.0"};
        std::uint16_t port{0};
        std::filesystem::path root;
        // Defaults to <root>/.filegate when empty.
        std::filesystem::path state_dir;
        std::filesystem::path landing_page{"filegate.html"};
        std::size_t worker_threads{0};
        std::chrono::minutes session_ttl{std::chrono::minutes{120}};
        std::uint32_t max_failed_logins{5};
        std::chrono::minutes lockout_duration{std::chrono::minutes{15}};
        std::chrono::seconds request_timeout{std::chrono::seconds{300}};
        std::uint64_t max_body_bytes{512ULL * 1024 * 1024};
        std::optional<std::filesystem::path> log_file;
        bool debug{false};

        std::filesystem::path effective_state_dir() const;
        std::filesystem::path folders_file() const;
        std::filesystem::path users_file() const;
    };

    // Overlays the keys present in a JSON config file onto `config`.
    void load_config_file(const std::filesystem::path &path, ServerConfig &config);

} // namespace filegate::server
