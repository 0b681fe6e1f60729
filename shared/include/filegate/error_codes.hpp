/**
 * FileGate - Result codes shared by every layer of the gateway.
 */
#pragma once

#include <cstdint>
#include <string_view>

namespace filegate
{

    enum class ErrorCode : std::uint8_t
    {
        Ok = 0,
        BadRequest = 1,
        Unauthorized = 2,
        Forbidden = 3,
        NotFound = 4,
        MethodNotAllowed = 5,
        Conflict = 6,
        PayloadTooLarge = 7,
        Internal = 8
    };

    std::string_view to_string(ErrorCode code) noexcept;

    // HTTP status line value for a result code.
    std::uint16_t http_status(ErrorCode code) noexcept;

    constexpr bool is_ok(ErrorCode code) noexcept
    {
        return code == ErrorCode::Ok;
    }

} // namespace filegate
