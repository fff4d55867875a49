#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace demonlist::util {

// Lower-case hex SHA-256 of `data`.
std::string Sha256Hex(std::string_view data);

// Lower-case hex HMAC-SHA256 of `data` keyed with `key`.
std::string HmacSha256Hex(std::string_view key, std::string_view data);

// Lower-case hex PBKDF2-HMAC-SHA256 derived key, 32 bytes.
std::string Pbkdf2Sha256Hex(std::string_view password, std::string_view salt, int iterations);

// `count` bytes from the OpenSSL CSPRNG, hex encoded.
std::string RandomHex(std::size_t count);

bool ConstantTimeEquals(std::string_view a, std::string_view b);

} // namespace demonlist::util
