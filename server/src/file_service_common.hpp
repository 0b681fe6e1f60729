#pragma once

#include <cstdint>
#include <exception>
#include <filesystem>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

#include "filegate/server/file_service.hpp"

namespace filegate::server::file_service_common
{

    std::int64_t to_unix_time(const std::filesystem::file_time_type &time);

    // Runs one filesystem operation; anything it throws becomes an Internal outcome.
    template <typename Body>
    Outcome guarded(std::string_view operation, std::string_view path, Body &&body)
    {
        try
        {
            return std::forward<Body>(body)();
        }
        catch (const std::exception &ex)
        {
            spdlog::error("{} failed for '{}': {}", operation, path, ex.what());
            return make_failure(ErrorCode::Internal, ex.what());
        }
    }

} // namespace filegate::server::file_service_common
