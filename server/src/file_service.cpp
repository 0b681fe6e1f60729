#include "filegate/server/file_service.hpp"

#include <algorithm>
#include <chrono>
#include <fstream>
#include <stdexcept>
#include <vector>

#include <spdlog/spdlog.h>

#include "filegate/protocol.hpp"
#include "filegate/server/logging.hpp"
#include "file_service_common.hpp"

namespace filegate::server
{

    namespace file_service_common
    {

        std::int64_t to_unix_time(const std::filesystem::file_time_type &time)
        {
            using namespace std::chrono;
            const auto system_time = time_point_cast<seconds>(time - std::filesystem::file_time_type::clock::now() +
                                                              std::chrono::system_clock::now());
            return static_cast<std::int64_t>(system_time.time_since_epoch().count());
        }

    } // namespace file_service_common

    namespace
    {

        bool is_plain_name(const std::string &name)
        {
            if (name.empty() || name == ".")
            {
                return false;
            }
            return name.find_first_of("/\\") == std::string::npos && !contains_parent_reference(name) &&
                   name.find('\0') == std::string::npos;
        }

        protocol::FileItem item_from_entry(const std::filesystem::directory_entry &entry)
        {
            std::error_code ec;
            protocol::FileItem item{};
            item.name = entry.path().filename().string();
            item.is_directory = entry.is_directory(ec);
            if (!item.is_directory)
            {
                const auto size = entry.file_size(ec);
                item.size = ec ? 0 : size;
            }
            const auto modified = entry.last_write_time(ec);
            item.last_modified = ec ? 0 : file_service_common::to_unix_time(modified);
            return item;
        }

    } // namespace

    Outcome make_success(std::string message, nlohmann::json payload)
    {
        Outcome outcome;
        outcome.code = ErrorCode::Ok;
        outcome.message = std::move(message);
        outcome.payload = std::move(payload);
        return outcome;
    }

    Outcome make_failure(ErrorCode code, std::string message)
    {
        Outcome outcome;
        outcome.code = code;
        outcome.message = std::move(message);
        return outcome;
    }

    FileService::FileService(const PathResolver &resolver) : resolver_(resolver) {}

    std::filesystem::path FileService::prepare_sandbox(const std::string &username) const
    {
        auto base = resolver_.user_base(username);
        std::filesystem::create_directories(base);
        return base;
    }

    std::optional<Outcome> FileService::reject_unresolved(const ResolvedPath &resolved, std::string_view operation,
                                                          std::string_view path) const
    {
        if (resolved.ok())
        {
            return std::nullopt;
        }
        if (resolved.code == ErrorCode::Forbidden)
        {
            security_log()->warn("Sandbox violation by '{}' during {}: '{}'", resolved.username, operation, path);
        }
        return make_failure(ErrorCode::Unauthorized, "Unauthorized");
    }

    Outcome FileService::list(const std::string &token, std::string_view path) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "list", path))
        {
            return *rejected;
        }

        return file_service_common::guarded("list", path, [&]
                                            {
            nlohmann::json items = nlohmann::json::array();
            if (!std::filesystem::is_directory(resolved.path))
            {
                return make_success({}, {{"items", items}});
            }

            std::vector<protocol::FileItem> entries;
            for (const auto &entry : std::filesystem::directory_iterator(resolved.path))
            {
                if (!resolver_.is_reserved(entry.path()))
                {
                    entries.push_back(item_from_entry(entry));
                }
            }
            std::sort(entries.begin(), entries.end(), [](const protocol::FileItem &lhs, const protocol::FileItem &rhs)
                      {
                if (lhs.is_directory != rhs.is_directory)
                {
                    return lhs.is_directory;
                }
                return lhs.name < rhs.name; });

            for (const auto &entry : entries)
            {
                items.push_back(nlohmann::json(entry));
            }
            return make_success({}, {{"items", items}}); });
    }

    Outcome FileService::create(const std::string &token, std::string_view path, bool is_directory) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "create", path))
        {
            return *rejected;
        }

        return file_service_common::guarded("create", path, [&]
                                            {
            const auto &target = resolved.path;
            if (is_directory)
            {
                if (std::filesystem::exists(target) && !std::filesystem::is_directory(target))
                {
                    return make_failure(ErrorCode::Conflict, "An item with this name already exists.");
                }
                std::filesystem::create_directories(target);
            }
            else
            {
                if (std::filesystem::exists(std::filesystem::symlink_status(target)))
                {
                    return make_failure(ErrorCode::Conflict, "An item with this name already exists.");
                }
                if (!std::filesystem::is_directory(target.parent_path()))
                {
                    return make_failure(ErrorCode::NotFound, "Parent folder does not exist.");
                }
                std::ofstream file(target, std::ios::binary);
                if (!file.is_open())
                {
                    throw std::runtime_error("Failed to create " + target.filename().string());
                }
            }
            spdlog::debug("{} created by {}: {}", is_directory ? "Directory" : "File", resolved.username,
                          target.filename().string());
            return make_success("Item created successfully."); });
    }

    Outcome FileService::remove(const std::string &token, std::string_view path, bool is_directory) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "delete", path))
        {
            return *rejected;
        }

        return file_service_common::guarded("delete", path, [&]
                                            {
            const auto &target = resolved.path;
            if (target == resolver_.user_base(resolved.username))
            {
                return make_failure(ErrorCode::BadRequest, "The root folder cannot be deleted.");
            }

            // The resolved path follows links; a link named by the client is removed itself.
            const auto relative = normalize_client_path(path);
            const auto slash = relative.rfind('/');
            const auto parent = resolver_.resolve(token, slash == std::string::npos ? std::string{}
                                                                                      : relative.substr(0, slash));
            if (auto rejected = reject_unresolved(parent, "delete", path))
            {
                return *rejected;
            }
            const auto entry = parent.path / (slash == std::string::npos ? relative : relative.substr(slash + 1));
            if (std::filesystem::is_symlink(std::filesystem::symlink_status(entry)))
            {
                if (std::filesystem::is_directory(entry) != is_directory)
                {
                    return make_failure(ErrorCode::BadRequest,
                                        is_directory ? "Target is not a folder" : "Target is a folder");
                }
                std::filesystem::remove(entry);
                spdlog::debug("Link deleted by {}: {}", resolved.username, entry.filename().string());
                return make_success("Item deleted successfully.");
            }

            if (!std::filesystem::exists(std::filesystem::symlink_status(target)))
            {
                return make_failure(ErrorCode::NotFound, "Item not found");
            }
            if (std::filesystem::is_directory(target) != is_directory)
            {
                return make_failure(ErrorCode::BadRequest,
                                    is_directory ? "Target is not a folder" : "Target is a folder");
            }
            if (is_directory)
            {
                std::filesystem::remove_all(target);
            }
            else
            {
                std::filesystem::remove(target);
            }
            spdlog::debug("Item deleted by {}: {}", resolved.username, target.filename().string());
            return make_success("Item deleted successfully."); });
    }

    Outcome FileService::save(const std::string &token, std::string_view path, const std::string &content) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "save", path))
        {
            return *rejected;
        }

        return file_service_common::guarded("save", path, [&]
                                            {
            const auto &target = resolved.path;
            if (std::filesystem::is_directory(target))
            {
                return make_failure(ErrorCode::BadRequest, "Target is a folder");
            }
            if (target.has_parent_path())
            {
                std::filesystem::create_directories(target.parent_path());
            }
            std::ofstream file(target, std::ios::binary | std::ios::trunc);
            if (!file.is_open())
            {
                throw std::runtime_error("Failed to open " + target.filename().string() + " for writing");
            }
            file.write(content.data(), static_cast<std::streamsize>(content.size()));
            if (!file)
            {
                throw std::runtime_error("Failed to write " + target.filename().string());
            }
            spdlog::debug("File saved by {}: {}", resolved.username, target.filename().string());
            return make_success("File saved successfully."); });
    }

    Outcome FileService::rename(const std::string &token, std::string_view path, const std::string &new_name,
                                bool is_directory) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "rename", path))
        {
            return *rejected;
        }
        if (!is_plain_name(new_name))
        {
            return make_failure(ErrorCode::BadRequest, "Invalid new name.");
        }

        return file_service_common::guarded("rename", path, [&]
                                            {
            const auto &source = resolved.path;
            const auto base = resolver_.user_base(resolved.username);
            if (source == base)
            {
                return make_failure(ErrorCode::BadRequest, "The root folder cannot be renamed.");
            }
            if (!std::filesystem::exists(std::filesystem::symlink_status(source)))
            {
                return make_failure(ErrorCode::NotFound, "Item not found");
            }
            if (std::filesystem::is_directory(source) != is_directory)
            {
                return make_failure(ErrorCode::BadRequest,
                                    is_directory ? "Target is not a folder" : "Target is a folder");
            }

            const auto destination = source.parent_path() / new_name;
            if (!is_within(base, std::filesystem::weakly_canonical(destination)) ||
                resolver_.is_reserved(destination))
            {
                security_log()->warn("Sandbox violation by '{}' during rename: '{}' -> '{}'", resolved.username, path,
                                     new_name);
                return make_failure(ErrorCode::Unauthorized, "Unauthorized");
            }
            if (std::filesystem::exists(std::filesystem::symlink_status(destination)))
            {
                return make_failure(ErrorCode::Conflict, "An item with this name already exists.");
            }

            std::filesystem::rename(source, destination);
            spdlog::debug("Item renamed by {}: {} to {}", resolved.username, source.filename().string(), new_name);
            return make_success("Item renamed successfully."); });
    }

} // namespace filegate::server
