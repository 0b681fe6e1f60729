#pragma once

#include <filesystem>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

namespace filegate::server
{

    constexpr auto kSecurityLoggerName = "security";

    // Installs the default "server" logger and a "security" logger over the same sinks.
    void configure_logging(const std::optional<std::filesystem::path> &log_file, bool debug);

    // Falls back to the default logger when configure_logging has not run (tests).
    std::shared_ptr<spdlog::logger> security_log();

} // namespace filegate::server
