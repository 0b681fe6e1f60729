#include "filegate/server/router.hpp"

#include <algorithm>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <utility>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include "filegate/mime_types.hpp"
#include "filegate/multipart.hpp"
#include "filegate/protocol.hpp"
#include "filegate/server/logging.hpp"

namespace filegate::server
{

    namespace
    {

        constexpr auto kJsonType = "application/json";
        constexpr auto kHtmlType = "text/html; charset=utf-8";
        constexpr auto kMissingLandingPage =
            "<!DOCTYPE html><html><head><title>FileGate</title></head>"
            "<body><h1>404 - Landing page not found</h1>"
            "<p>Check the landing_page setting of the server.</p></body></html>";

        http::Response json_response(std::uint16_t status, const nlohmann::json &body)
        {
            http::Response response;
            response.status = status;
            response.body = body.dump();
            response.set_header("Content-Type", kJsonType);
            return response;
        }

        // Parses a JSON body into one of the protocol request types.
        template <typename T>
        std::optional<T> parse_body(const http::Request &request, std::string &error)
        {
            try
            {
                return nlohmann::json::parse(request.body).get<T>();
            }
            catch (const protocol::ProtocolError &ex)
            {
                error = ex.what();
            }
            catch (const nlohmann::json::exception &)
            {
                error = "Invalid request format";
            }
            return std::nullopt;
        }

        std::string attachment_name(const std::filesystem::path &path)
        {
            auto name = path.filename().string();
            std::replace_if(
                name.begin(), name.end(), [](char c)
                { return c == '"' || c == '\r' || c == '\n'; },
                '_');
            return name;
        }

    } // namespace

    const RouteEntry *find_route(std::string_view path) noexcept
    {
        const auto it = std::find_if(kRoutes.begin(), kRoutes.end(),
                                     [path](const RouteEntry &entry)
                                     { return entry.path == path; });
        return it == kRoutes.end() ? nullptr : &*it;
    }

    http::Response error_response(ErrorCode code, const std::string &message)
    {
        return json_response(http_status(code), {{"success", false}, {"message", message}});
    }

    http::Response outcome_response(const Outcome &outcome)
    {
        auto body = outcome.payload.is_object() ? outcome.payload : nlohmann::json::object();
        body["success"] = outcome.ok();
        if (!outcome.message.empty())
        {
            body["message"] = outcome.message;
        }
        auto response = json_response(http_status(outcome.code), body);
        if (outcome.code == ErrorCode::Unauthorized)
        {
            response.set_header("WWW-Authenticate", "Bearer");
        }
        return response;
    }

    Router::Router(RouterServices services) : services_(std::move(services)) {}

    http::Response Router::dispatch(const http::Request &request) const
    {
        http::Response response;
        try
        {
            response = route(request);
        }
        catch (const std::exception &ex)
        {
            spdlog::error("Unhandled error for {} {}: {}", request.method, request.path, ex.what());
            response = error_response(ErrorCode::Internal, "Internal server error");
        }
        response.set_header("Access-Control-Allow-Origin", "*");
        return response;
    }

    http::Response Router::route(const http::Request &request) const
    {
        if (request.method == "OPTIONS")
        {
            http::Response response;
            response.set_header("Access-Control-Allow-Methods", "POST, GET, OPTIONS, DELETE");
            response.set_header("Access-Control-Allow-Headers", "Content-Type, Authorization");
            return response;
        }

        const auto *entry = find_route(request.path);
        if (entry == nullptr)
        {
            return error_response(ErrorCode::NotFound, "Not found");
        }

        const auto token = http::bearer_token(request).value_or(std::string{});
        if (entry->requires_auth && !services_.sessions.validate(token))
        {
            auto response = error_response(ErrorCode::Unauthorized, "Unauthorized");
            response.set_header("WWW-Authenticate", "Bearer");
            return response;
        }

        if (request.method != entry->method)
        {
            return error_response(ErrorCode::MethodNotAllowed, "Only " + std::string(entry->method) + " allowed");
        }
        return handle(*entry, request, token);
    }

    http::Response Router::handle(const RouteEntry &entry, const http::Request &request,
                                  const std::string &token) const
    {
        switch (entry.route)
        {
        case Route::LandingPage:
            return landing_page();
        case Route::Login:
            return login(request);
        case Route::Logout:
            return logout(request);
        case Route::List:
            return list(request, token);
        case Route::Upload:
            return upload(request, token);
        case Route::Download:
            return download(request, token);
        case Route::Create:
            return create(request, token);
        case Route::Delete:
            return remove(request, token);
        case Route::Save:
            return save(request, token);
        case Route::Rename:
            return rename(request, token);
        }
        return error_response(ErrorCode::NotFound, "Not found");
    }

    http::Response Router::landing_page() const
    {
        http::Response response;
        std::ifstream file(services_.landing_page, std::ios::binary);
        if (!file.is_open())
        {
            spdlog::error("Landing page not found at {}", services_.landing_page.string());
            response.status = http_status(ErrorCode::NotFound);
            response.body = kMissingLandingPage;
        }
        else
        {
            std::ostringstream contents;
            contents << file.rdbuf();
            response.body = contents.str();
        }
        response.set_header("Content-Type", kHtmlType);
        return response;
    }

    http::Response Router::login(const http::Request &request) const
    {
        std::string error;
        const auto credentials = parse_body<protocol::LoginRequest>(request, error);
        if (!credentials)
        {
            return error_response(ErrorCode::BadRequest, error);
        }

        const auto &username = credentials->username;
        if (services_.throttle.is_locked(username))
        {
            security_log()->warn("Login rejected for locked account '{}'", username);
            return error_response(ErrorCode::Unauthorized, "Too many tries");
        }
        if (!services_.credentials.verify(username, credentials->password))
        {
            security_log()->warn("Failed login for '{}'", username);
            if (services_.credentials.contains(username) && services_.throttle.record_failure(username))
            {
                security_log()->warn("Account '{}' locked after repeated failures", username);
            }
            return error_response(ErrorCode::Unauthorized, "Invalid credentials");
        }

        services_.throttle.reset(username);
        services_.files.prepare_sandbox(username);
        protocol::LoginResponse reply{services_.sessions.issue(username), username};
        spdlog::info("User {} logged in", username);
        return json_response(http_status(ErrorCode::Ok), reply);
    }

    http::Response Router::logout(const http::Request &request) const
    {
        if (const auto token = http::bearer_token(request))
        {
            services_.sessions.revoke(*token);
        }
        return json_response(http_status(ErrorCode::Ok), {{"success", true}});
    }

    http::Response Router::list(const http::Request &request, const std::string &token) const
    {
        const auto path = request.query_param("path").value_or("/");
        return outcome_response(services_.files.list(token, path));
    }

    http::Response Router::upload(const http::Request &request, const std::string &token) const
    {
        const auto directory = request.query_param("path").value_or("/");
        const auto content_type = request.header("content-type").value_or(std::string{});
        const auto file = multipart::parse_multipart(content_type, request.body);
        if (!file)
        {
            return error_response(ErrorCode::BadRequest, "No filename found");
        }
        return outcome_response(services_.files.upload(token, directory, *file));
    }

    http::Response Router::download(const http::Request &request, const std::string &token) const
    {
        const auto path = request.query_param("path");
        if (!path)
        {
            return error_response(ErrorCode::BadRequest, "Path is required.");
        }
        const auto outcome = services_.files.download(token, *path);
        if (!outcome.ok() || !outcome.file)
        {
            return outcome_response(outcome);
        }

        http::Response response;
        response.file = outcome.file;
        response.set_header("Content-Type", std::string(mime_type_for(*outcome.file)));
        response.set_header("Content-Disposition", "attachment; filename=\"" + attachment_name(*outcome.file) + "\"");
        return response;
    }

    http::Response Router::create(const http::Request &request, const std::string &token) const
    {
        if (const auto path = request.query_param("path"); path && !path->empty())
        {
            return outcome_response(services_.files.create(token, *path, true));
        }
        std::string error;
        const auto body = parse_body<protocol::CreateRequest>(request, error);
        if (!body)
        {
            return error_response(ErrorCode::BadRequest, error);
        }
        return outcome_response(services_.files.create(token, body->path, body->is_directory));
    }

    http::Response Router::remove(const http::Request &request, const std::string &token) const
    {
        const auto path = request.query_param("path");
        if (!path)
        {
            return error_response(ErrorCode::BadRequest, "Path is required.");
        }
        const auto is_directory = protocol::parse_flag(request.query_param("isDir").value_or("false"));
        if (!is_directory)
        {
            return error_response(ErrorCode::BadRequest, "Invalid isDir value.");
        }
        return outcome_response(services_.files.remove(token, *path, *is_directory));
    }

    http::Response Router::save(const http::Request &request, const std::string &token) const
    {
        std::string error;
        const auto body = parse_body<protocol::SaveRequest>(request, error);
        if (!body)
        {
            return error_response(ErrorCode::BadRequest, error);
        }
        return outcome_response(services_.files.save(token, body->path, body->content));
    }

    http::Response Router::rename(const http::Request &request, const std::string &token) const
    {
        std::string error;
        const auto body = parse_body<protocol::RenameRequest>(request, error);
        if (!body)
        {
            return error_response(ErrorCode::BadRequest, error);
        }
        return outcome_response(services_.files.rename(token, body->path, body->new_name, body->is_directory));
    }

} // namespace filegate::server
