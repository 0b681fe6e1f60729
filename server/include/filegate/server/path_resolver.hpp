#pragma once

#include <filesystem>
#include <string>
#include <string_view>

#include "filegate/error_codes.hpp"
#include "filegate/server/folder_map.hpp"
#include "filegate/server/session_store.hpp"

namespace filegate::server
{

    struct ResolvedPath
    {
        // Ok, Unauthorized (no live session) or Forbidden (sandbox violation).
        ErrorCode code{ErrorCode::Unauthorized};
        std::string username;
        std::filesystem::path path;

        bool ok() const noexcept { return code == ErrorCode::Ok; }
    };

    // True when `candidate` equals `base` or lies below it, compared by whole path segments.
    bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate);

    bool contains_parent_reference(std::string_view client_path);

    // Separators unified to '/', leading and trailing separators removed.
    std::string normalize_client_path(std::string_view client_path);

    class PathResolver
    {
    public:
        // `reserved` names a directory (the server's state directory) that no session may reach,
        // even when it lies inside a sandbox.
        PathResolver(std::filesystem::path root, SessionStore &sessions, const FolderMap &folders,
                     const std::filesystem::path &reserved = {});

        ResolvedPath resolve(const std::string &token, std::string_view client_path) const;

        // Canonical sandbox base of `username` (not created).
        std::filesystem::path user_base(const std::string &username) const;

        bool is_reserved(const std::filesystem::path &candidate) const;

        const std::filesystem::path &root() const noexcept { return root_; }

    private:
        std::filesystem::path root_;
        std::filesystem::path reserved_;
        SessionStore &sessions_;
        const FolderMap &folders_;
    };

} // namespace filegate::server
