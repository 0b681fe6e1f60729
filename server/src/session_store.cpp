#include "filegate/server/session_store.hpp"

#include <stdexcept>

#include "filegate/crypto.hpp"

namespace filegate::server
{

    SessionStore::SessionStore(std::chrono::seconds ttl, TimeSource now) : ttl_(ttl), now_(std::move(now))
    {
        if (ttl_.count() <= 0)
        {
            throw std::invalid_argument("Session TTL must be positive");
        }
    }

    std::string SessionStore::issue(const std::string &username)
    {
        const auto expiry = now_() + ttl_;
        std::lock_guard lock(mutex_);
        for (;;)
        {
            auto token = crypto::random_token();
            const auto [it, inserted] = sessions_.try_emplace(token, SessionRecord{.expiry = expiry, .username = username});
            if (inserted)
            {
                return token;
            }
        }
    }

    std::optional<std::string> SessionStore::validate(const std::string &token)
    {
        if (token.empty())
        {
            return std::nullopt;
        }
        const auto now = now_();
        std::lock_guard lock(mutex_);
        const auto it = sessions_.find(token);
        if (it == sessions_.end())
        {
            return std::nullopt;
        }
        if (it->second.expiry < now)
        {
            sessions_.erase(it);
            return std::nullopt;
        }
        return it->second.username;
    }

    void SessionStore::revoke(const std::string &token)
    {
        std::lock_guard lock(mutex_);
        sessions_.erase(token);
    }

    std::size_t SessionStore::revoke_user(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        return std::erase_if(sessions_, [&username](const auto &entry)
                             { return entry.second.username == username; });
    }

    std::size_t SessionStore::size() const
    {
        std::lock_guard lock(mutex_);
        return sessions_.size();
    }

} // namespace filegate::server
