#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

#include "filegate/error_codes.hpp"
#include "filegate/multipart.hpp"
#include "filegate/server/path_resolver.hpp"

namespace filegate::server
{

    // Result of one file operation; the router turns it into an HTTP response.
    struct Outcome
    {
        ErrorCode code{ErrorCode::Ok};
        std::string message;
        nlohmann::json payload{nlohmann::json::object()};
        // Set by download: the file to stream as the response body.
        std::optional<std::filesystem::path> file;

        bool ok() const noexcept { return code == ErrorCode::Ok; }
    };

    Outcome make_success(std::string message = {}, nlohmann::json payload = nlohmann::json::object());
    Outcome make_failure(ErrorCode code, std::string message);

    class FileService
    {
    public:
        explicit FileService(const PathResolver &resolver);

        Outcome list(const std::string &token, std::string_view path) const;
        Outcome upload(const std::string &token, std::string_view directory,
                       const multipart::MultipartFile &file) const;
        Outcome download(const std::string &token, std::string_view path) const;
        Outcome create(const std::string &token, std::string_view path, bool is_directory) const;
        Outcome remove(const std::string &token, std::string_view path, bool is_directory) const;
        Outcome save(const std::string &token, std::string_view path, const std::string &content) const;
        Outcome rename(const std::string &token, std::string_view path, const std::string &new_name,
                       bool is_directory) const;

        // Creates the sandbox directory of `username` and returns it.
        std::filesystem::path prepare_sandbox(const std::string &username) const;

    private:
        std::optional<Outcome> reject_unresolved(const ResolvedPath &resolved, std::string_view operation,
                                                 std::string_view path) const;

        const PathResolver &resolver_;
    };

} // namespace filegate::server
