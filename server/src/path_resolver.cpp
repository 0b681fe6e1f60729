#include "filegate/server/path_resolver.hpp"

#include <algorithm>
#include <system_error>

namespace filegate::server
{

    namespace
    {

        std::filesystem::path without_trailing_separator(const std::filesystem::path &path)
        {
            auto normal = path.lexically_normal();
            if (!normal.has_filename() && normal.has_relative_path())
            {
                return normal.parent_path();
            }
            return normal;
        }

    } // namespace

    bool is_within(const std::filesystem::path &base, const std::filesystem::path &candidate)
    {
        const auto normal_base = without_trailing_separator(base);
        const auto normal_candidate = without_trailing_separator(candidate);
        const auto [base_it, candidate_it] = std::mismatch(normal_base.begin(), normal_base.end(),
                                                           normal_candidate.begin(), normal_candidate.end());
        return base_it == normal_base.end();
    }

    bool contains_parent_reference(std::string_view client_path)
    {
        return client_path.find("..") != std::string_view::npos;
    }

    std::string normalize_client_path(std::string_view client_path)
    {
        std::string normalized(client_path);
        std::replace(normalized.begin(), normalized.end(), '\\', '/');
        const auto first = normalized.find_first_not_of('/');
        if (first == std::string::npos)
        {
            return {};
        }
        const auto last = normalized.find_last_not_of('/');
        return normalized.substr(first, last - first + 1);
    }

    PathResolver::PathResolver(std::filesystem::path root, SessionStore &sessions, const FolderMap &folders,
                               const std::filesystem::path &reserved)
        : sessions_(sessions), folders_(folders)
    {
        std::filesystem::create_directories(root);
        root_ = without_trailing_separator(std::filesystem::weakly_canonical(std::filesystem::absolute(root)));
        if (!reserved.empty())
        {
            reserved_ =
                without_trailing_separator(std::filesystem::weakly_canonical(std::filesystem::absolute(reserved)));
        }
    }

    bool PathResolver::is_reserved(const std::filesystem::path &candidate) const
    {
        if (reserved_.empty())
        {
            return false;
        }
        std::error_code ec;
        const auto canonical = std::filesystem::weakly_canonical(candidate, ec);
        return is_within(reserved_, ec ? candidate : canonical);
    }

    std::filesystem::path PathResolver::user_base(const std::string &username) const
    {
        const auto folder = normalize_client_path(folders_.lookup(username));
        if (folder.empty())
        {
            return root_;
        }
        return without_trailing_separator(std::filesystem::weakly_canonical(root_ / folder));
    }

    ResolvedPath PathResolver::resolve(const std::string &token, std::string_view client_path) const
    {
        ResolvedPath result;
        const auto username = sessions_.validate(token);
        if (!username)
        {
            result.code = ErrorCode::Unauthorized;
            return result;
        }
        result.username = *username;
        result.code = ErrorCode::Forbidden;

        if (contains_parent_reference(client_path) || client_path.find('\0') != std::string_view::npos)
        {
            return result;
        }

        std::filesystem::path base;
        try
        {
            base = user_base(*username);
        }
        catch (const std::filesystem::filesystem_error &)
        {
            return result;
        }
        if (!is_within(root_, base))
        {
            return result;
        }

        const auto relative = normalize_client_path(client_path);
        std::filesystem::path candidate = base;
        if (!relative.empty())
        {
            std::error_code ec;
            candidate = std::filesystem::weakly_canonical(base / relative, ec);
            if (ec)
            {
                return result;
            }
        }
        if (!is_within(base, candidate) || is_reserved(candidate))
        {
            return result;
        }

        result.code = ErrorCode::Ok;
        result.path = without_trailing_separator(candidate);
        return result;
    }

} // namespace filegate::server
