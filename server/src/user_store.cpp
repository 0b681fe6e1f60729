#include "filegate/server/user_store.hpp"

#include <algorithm>
#include <cctype>

#include <nlohmann/json.hpp>

#include "filegate/crypto.hpp"
#include "json_file.hpp"

namespace filegate::server
{

    namespace
    {
        constexpr std::size_t kMaxUsernameLength = 64;
    } // namespace

    bool is_valid_username(const std::string &username)
    {
        if (username.empty() || username.size() > kMaxUsernameLength)
        {
            return false;
        }
        if (username.front() == '.')
        {
            return false;
        }
        return std::all_of(username.begin(), username.end(), [](unsigned char ch)
                           { return std::isalnum(ch) || ch == '_' || ch == '-' || ch == '.'; });
    }

    UserStore::UserStore(std::filesystem::path database_path) : database_path_(std::move(database_path))
    {
        if (database_path_.has_parent_path())
        {
            std::filesystem::create_directories(database_path_.parent_path());
        }
    }

    bool UserStore::verify(const std::string &username, const std::string &password) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        const auto it = users_.find(username);
        if (it == users_.end())
        {
            return false;
        }
        return crypto::verify_password(password, it->second);
    }

    bool UserStore::create_account(const std::string &username, const std::string &password, std::string &message)
    {
        if (!is_valid_username(username))
        {
            message = "Invalid username";
            return false;
        }
        if (password.empty())
        {
            message = "Password is required";
            return false;
        }
        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.contains(username))
        {
            message = "User already exists";
            return false;
        }
        users_.emplace(username, crypto::hash_password(password));
        persist_locked();
        message.clear();
        return true;
    }

    bool UserStore::delete_account(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        load_locked();
        if (users_.erase(username) == 0)
        {
            return false;
        }
        persist_locked();
        return true;
    }

    bool UserStore::contains(const std::string &username) const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        return users_.contains(username);
    }

    std::vector<std::string> UserStore::usernames() const
    {
        std::lock_guard lock(mutex_);
        load_locked();
        std::vector<std::string> names;
        names.reserve(users_.size());
        for (const auto &[user, hash] : users_)
        {
            names.push_back(user);
        }
        std::sort(names.begin(), names.end());
        return names;
    }

    void UserStore::load_locked() const
    {
        if (loaded_)
        {
            return;
        }
        users_.clear();
        if (const auto json = json_file::read(database_path_); json && json->is_object())
        {
            for (const auto &[key, value] : json->items())
            {
                users_[key] = value.get<std::string>();
            }
        }
        loaded_ = true;
    }

    void UserStore::persist_locked() const
    {
        nlohmann::json json = nlohmann::json::object();
        for (const auto &[user, hash] : users_)
        {
            json[user] = hash;
        }
        json_file::write(database_path_, json);
    }

} // namespace filegate::server
