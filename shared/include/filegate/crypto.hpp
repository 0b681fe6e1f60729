/**
 * FileGate - Crypto helpers built on libsodium.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace filegate::crypto
{

    void ensure_sodium_init();

    std::string hash_password(std::string_view password);

    bool verify_password(std::string_view password, std::string_view password_hash);

    // Hex encoding of `byte_count` bytes from the libsodium CSPRNG.
    std::string random_token(std::size_t byte_count = 32);

} // namespace filegate::crypto
