#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>

#include "filegate/http.hpp"
#include "filegate/server/file_service.hpp"
#include "filegate/server/login_throttle.hpp"
#include "filegate/server/session_store.hpp"
#include "filegate/server/user_store.hpp"

namespace filegate::server
{

    // Everything the router needs, owned by Server and shared by reference.
    struct RouterServices
    {
        SessionStore &sessions;
        FileService &files;
        const CredentialVerifier &credentials;
        LoginThrottle &throttle;
        std::filesystem::path landing_page;
    };

    enum class Route : std::uint8_t
    {
        LandingPage,
        Login,
        Logout,
        List,
        Upload,
        Download,
        Create,
        Delete,
        Save,
        Rename
    };

    struct RouteEntry
    {
        std::string_view path;
        Route route;
        std::string_view method;
        bool requires_auth;
    };

    inline constexpr std::array<RouteEntry, 10> kRoutes{{
        {"/", Route::LandingPage, "GET", false},
        {"/api/login", Route::Login, "POST", false},
        {"/api/logout", Route::Logout, "POST", false},
        {"/api/files/list", Route::List, "GET", true},
        {"/api/files/upload", Route::Upload, "POST", true},
        {"/api/files/download", Route::Download, "GET", true},
        {"/api/files/create", Route::Create, "POST", true},
        {"/api/files/delete", Route::Delete, "POST", true},
        {"/api/files/save", Route::Save, "POST", true},
        {"/api/files/rename", Route::Rename, "POST", true},
    }};

    // Exact match on the decoded path; nullptr when nothing matches.
    const RouteEntry *find_route(std::string_view path) noexcept;

    class Router
    {
    public:
        explicit Router(RouterServices services);

        // Never throws: failures escaping a handler become a 500 response.
        http::Response dispatch(const http::Request &request) const;

    private:
        http::Response route(const http::Request &request) const;
        http::Response handle(const RouteEntry &entry, const http::Request &request,
                              const std::string &token) const;

        http::Response landing_page() const;
        http::Response login(const http::Request &request) const;
        http::Response logout(const http::Request &request) const;
        http::Response list(const http::Request &request, const std::string &token) const;
        http::Response upload(const http::Request &request, const std::string &token) const;
        http::Response download(const http::Request &request, const std::string &token) const;
        http::Response create(const http::Request &request, const std::string &token) const;
        http::Response remove(const http::Request &request, const std::string &token) const;
        http::Response save(const http::Request &request, const std::string &token) const;
        http::Response rename(const http::Request &request, const std::string &token) const;

        RouterServices services_;
    };

    // JSON response `{success:false, message}` with the status of `code`.
    http::Response error_response(ErrorCode code, const std::string &message);

    http::Response outcome_response(const Outcome &outcome);

} // namespace filegate::server
