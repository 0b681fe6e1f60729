#include "filegate/server/file_service.hpp"

#include <algorithm>
#include <fstream>
#include <stdexcept>

#include <spdlog/spdlog.h>

#include "filegate/server/logging.hpp"
#include "file_service_common.hpp"

namespace filegate::server
{

    namespace
    {

        // Browsers send a bare name, older ones a full client-side path.
        std::string upload_name(const std::string &filename)
        {
            std::string unified = filename;
            std::replace(unified.begin(), unified.end(), '\\', '/');
            const auto slash = unified.find_last_of('/');
            auto name = slash == std::string::npos ? unified : unified.substr(slash + 1);
            if (name == "." || name == ".." || name.find('\0') != std::string::npos)
            {
                return {};
            }
            return name;
        }

    } // namespace

    Outcome FileService::upload(const std::string &token, std::string_view directory,
                                const multipart::MultipartFile &file) const
    {
        const auto resolved = resolver_.resolve(token, directory);
        if (auto rejected = reject_unresolved(resolved, "upload", directory))
        {
            return *rejected;
        }

        const auto name = upload_name(file.filename);
        if (name.empty())
        {
            return make_failure(ErrorCode::BadRequest, "No filename found");
        }

        return file_service_common::guarded("upload", directory, [&]
                                            {
            std::filesystem::create_directories(resolved.path);
            const auto target = resolved.path / name;
            if (!is_within(resolved.path, std::filesystem::weakly_canonical(target)) ||
                resolver_.is_reserved(target))
            {
                security_log()->warn("Sandbox violation by '{}' during upload: '{}'", resolved.username,
                                     target.string());
                return make_failure(ErrorCode::Unauthorized, "Unauthorized");
            }
            if (std::filesystem::is_directory(target))
            {
                return make_failure(ErrorCode::Conflict, "A folder with this name already exists.");
            }

            std::ofstream out(target, std::ios::binary | std::ios::trunc);
            if (!out.is_open())
            {
                throw std::runtime_error("Failed to open " + name + " for writing");
            }
            out.write(file.content.data(), static_cast<std::streamsize>(file.content.size()));
            if (!out)
            {
                throw std::runtime_error("Failed to write " + name);
            }
            spdlog::debug("File uploaded by {}: {} ({} bytes)", resolved.username, name, file.content.size());
            return make_success({}, {{"name", name}, {"size", file.content.size()}}); });
    }

    Outcome FileService::download(const std::string &token, std::string_view path) const
    {
        const auto resolved = resolver_.resolve(token, path);
        if (auto rejected = reject_unresolved(resolved, "download", path))
        {
            return *rejected;
        }

        return file_service_common::guarded("download", path, [&]
                                            {
            if (!std::filesystem::is_regular_file(resolved.path))
            {
                return make_failure(ErrorCode::NotFound, "File not found");
            }
            auto outcome = make_success({}, {{"name", resolved.path.filename().string()}});
            outcome.file = resolved.path;
            return outcome; });
    }

} // namespace filegate::server
