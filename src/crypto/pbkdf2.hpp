#pragma once

#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace ctwallet::crypto {

// PBKDF2-HMAC-SHA512 (RFC 8018). `iterations` must be >= 1.
std::vector<std::uint8_t> Pbkdf2HmacSha512(std::string_view password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len);

}  // namespace ctwallet::crypto
