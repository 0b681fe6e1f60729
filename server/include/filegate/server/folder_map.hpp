#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <string>

namespace filegate::server
{

    constexpr auto kAdminUser = "admin";
    // Sandbox subfolder value that denotes the sandbox root itself.
    constexpr auto kRootFolder = "/";

    // username -> sandbox subfolder, persisted as a JSON side file.
    class FolderMap
    {
    public:
        explicit FolderMap(std::filesystem::path storage_path);

        FolderMap(const FolderMap &) = delete;
        FolderMap &operator=(const FolderMap &) = delete;

        void load();
        void save() const;

        // Subfolder assigned to `username`, or the username itself when unmapped.
        std::string lookup(const std::string &username) const;

        void assign(const std::string &username, std::string folder);
        bool remove(const std::string &username);

        std::map<std::string, std::string> entries() const;

    private:
        void ensure_reserved_locked();

        std::filesystem::path storage_path_;

        mutable std::mutex mutex_;
        std::map<std::string, std::string> folders_;
    };

} // namespace filegate::server
