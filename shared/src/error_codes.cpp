#include "filegate/error_codes.hpp"

#include <array>

namespace filegate
{

    namespace
    {
        struct ErrorCodeDescription
        {
            ErrorCode code;
            std::string_view description;
            std::uint16_t status;
        };

        constexpr std::array<ErrorCodeDescription, 9> kDescriptions{{
            {ErrorCode::Ok, "ok", 200},
            {ErrorCode::BadRequest, "bad_request", 400},
            {ErrorCode::Unauthorized, "unauthorized", 401},
            {ErrorCode::Forbidden, "forbidden", 403},
            {ErrorCode::NotFound, "not_found", 404},
            {ErrorCode::MethodNotAllowed, "method_not_allowed", 405},
            {ErrorCode::Conflict, "conflict", 409},
            {ErrorCode::PayloadTooLarge, "payload_too_large", 413},
            {ErrorCode::Internal, "internal_error", 500},
        }};
    } // namespace

    std::string_view to_string(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.description;
            }
        }
        return "unknown";
    }

    std::uint16_t http_status(ErrorCode code) noexcept
    {
        for (const auto &entry : kDescriptions)
        {
            if (entry.code == code)
            {
                return entry.status;
            }
        }
        return 500;
    }

} // namespace filegate
