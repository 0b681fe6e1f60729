#include "filegate/server/login_throttle.hpp"

namespace filegate::server
{

    LoginThrottle::LoginThrottle(std::uint32_t max_failures, std::chrono::seconds lockout, TimeSource now)
        : max_failures_(max_failures == 0 ? 1 : max_failures), lockout_(lockout), now_(std::move(now)) {}

    bool LoginThrottle::is_locked(const std::string &username)
    {
        const auto now = now_();
        std::lock_guard lock(mutex_);
        const auto it = locked_until_.find(username);
        if (it == locked_until_.end())
        {
            return false;
        }
        if (it->second > now)
        {
            return true;
        }
        locked_until_.erase(it);
        failures_.erase(username);
        return false;
    }

    bool LoginThrottle::record_failure(const std::string &username)
    {
        const auto now = now_();
        std::lock_guard lock(mutex_);
        const auto attempts = ++failures_[username];
        if (attempts < max_failures_)
        {
            return false;
        }
        locked_until_[username] = now + lockout_;
        return true;
    }

    void LoginThrottle::reset(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        failures_.erase(username);
        locked_until_.erase(username);
    }

    std::size_t LoginThrottle::tracked() const
    {
        std::lock_guard lock(mutex_);
        return failures_.size();
    }

} // namespace filegate::server
