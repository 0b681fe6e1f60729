#pragma once

#include <chrono>
#include <functional>

namespace filegate::server
{

    using TimePoint = std::chrono::system_clock::time_point;
    using TimeSource = std::function<TimePoint()>;

    inline TimeSource system_time_source()
    {
        return []
        { return std::chrono::system_clock::now(); };
    }

} // namespace filegate::server
