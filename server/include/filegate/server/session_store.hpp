#pragma once

#include <chrono>
#include <cstddef>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "filegate/server/clock.hpp"

namespace filegate::server
{

    struct SessionRecord
    {
        TimePoint expiry;
        std::string username;
    };

    // Bearer-token table shared by every connection. Expired entries are evicted
    // lazily on lookup; there is no background sweep.
    class SessionStore
    {
    public:
        explicit SessionStore(std::chrono::seconds ttl, TimeSource now = system_time_source());

        SessionStore(const SessionStore &) = delete;
        SessionStore &operator=(const SessionStore &) = delete;

        std::string issue(const std::string &username);

        std::optional<std::string> validate(const std::string &token);

        void revoke(const std::string &token);

        std::size_t revoke_user(const std::string &username);

        std::size_t size() const;

    private:
        std::chrono::seconds ttl_;
        TimeSource now_;

        mutable std::mutex mutex_;
        std::unordered_map<std::string, SessionRecord> sessions_;
    };

} // namespace filegate::server
