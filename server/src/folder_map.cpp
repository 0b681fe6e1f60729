#include "filegate/server/folder_map.hpp"

#include <stdexcept>

#include <nlohmann/json.hpp>

#include "json_file.hpp"

namespace filegate::server
{

    namespace
    {
        constexpr auto kUsersKey = "users";
    } // namespace

    FolderMap::FolderMap(std::filesystem::path storage_path) : storage_path_(std::move(storage_path))
    {
        ensure_reserved_locked();
    }

    void FolderMap::load()
    {
        const auto json = json_file::read(storage_path_);

        std::map<std::string, std::string> loaded;
        if (json)
        {
            if (!json->is_object() || !json->contains(kUsersKey) || !json->at(kUsersKey).is_object())
            {
                throw std::runtime_error("Folder mapping file has an unexpected layout: " + storage_path_.string());
            }
            for (const auto &[user, folder] : json->at(kUsersKey).items())
            {
                loaded[user] = folder.get<std::string>();
            }
        }

        std::lock_guard lock(mutex_);
        folders_ = std::move(loaded);
        ensure_reserved_locked();
    }

    void FolderMap::save() const
    {
        nlohmann::json users = nlohmann::json::object();
        {
            std::lock_guard lock(mutex_);
            for (const auto &[user, folder] : folders_)
            {
                users[user] = folder;
            }
        }
        json_file::write(storage_path_, nlohmann::json{{kUsersKey, users}});
    }

    std::string FolderMap::lookup(const std::string &username) const
    {
        std::lock_guard lock(mutex_);
        const auto it = folders_.find(username);
        if (it == folders_.end())
        {
            return username;
        }
        return it->second;
    }

    void FolderMap::assign(const std::string &username, std::string folder)
    {
        if (username.empty())
        {
            throw std::invalid_argument("Username must not be empty");
        }
        std::lock_guard lock(mutex_);
        folders_[username] = std::move(folder);
    }

    bool FolderMap::remove(const std::string &username)
    {
        std::lock_guard lock(mutex_);
        if (username == kAdminUser)
        {
            return false;
        }
        return folders_.erase(username) > 0;
    }

    std::map<std::string, std::string> FolderMap::entries() const
    {
        std::lock_guard lock(mutex_);
        return folders_;
    }

    void FolderMap::ensure_reserved_locked()
    {
        folders_.try_emplace(kAdminUser, kRootFolder);
    }

} // namespace filegate::server
