#pragma once

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>

#include "filegate/server/clock.hpp"

namespace filegate::server
{

    // Failed-login counting with a temporary account lockout.
    class LoginThrottle
    {
    public:
        LoginThrottle(std::uint32_t max_failures, std::chrono::seconds lockout,
                      TimeSource now = system_time_source());

        bool is_locked(const std::string &username);

        // Returns true when this failure locked the account.
        bool record_failure(const std::string &username);

        void reset(const std::string &username);

        // Number of accounts with failures or a lockout on record.
        std::size_t tracked() const;

    private:
        std::uint32_t max_failures_;
        std::chrono::seconds lockout_;
        TimeSource now_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, std::uint32_t> failures_;
        std::unordered_map<std::string, TimePoint> locked_until_;
    };

} // namespace filegate::server
