#include "filegate/server/logging.hpp"

#include <vector>

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace filegate::server
{

    namespace
    {
        // Both loggers share the sinks and therefore the formatter; %n tells them apart.
        constexpr auto kPattern = "%Y-%m-%d %H:%M:%S [%^%l%$] [%n] %v";
    } // namespace

    void configure_logging(const std::optional<std::filesystem::path> &log_file, bool debug)
    {
        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
        if (log_file)
        {
            if (log_file->has_parent_path())
            {
                std::filesystem::create_directories(log_file->parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file->string(), false));
        }
        const auto level = debug ? spdlog::level::debug : spdlog::level::info;

        auto logger = std::make_shared<spdlog::logger>("server", sinks.begin(), sinks.end());
        logger->set_level(level);
        logger->set_pattern(kPattern);
        spdlog::set_default_logger(logger);

        spdlog::drop(kSecurityLoggerName);
        auto security = std::make_shared<spdlog::logger>(kSecurityLoggerName, sinks.begin(), sinks.end());
        security->set_level(level);
        spdlog::register_logger(security);
    }

    std::shared_ptr<spdlog::logger> security_log()
    {
        if (auto logger = spdlog::get(kSecurityLoggerName))
        {
            return logger;
        }
        return spdlog::default_logger();
    }

} // namespace filegate::server
