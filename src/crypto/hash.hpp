#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace ctwallet::crypto {

using Sha256Hash = std::array<std::uint8_t, 32>;
using Sha512Hash = std::array<std::uint8_t, 64>;
using Hash160 = std::array<std::uint8_t, 20>;

// SHA-2 family (backed by liboqs).
Sha256Hash Sha256(std::span<const std::uint8_t> data);
Sha256Hash DoubleSha256(std::span<const std::uint8_t> data);
Sha512Hash Sha512(std::span<const std::uint8_t> data);

// RFC 2104 HMAC over the SHA-2 functions above.
Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);
Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data);

Hash160 Ripemd160(std::span<const std::uint8_t> data);
// RIPEMD160(SHA256(data)), used for P2PKH/P2SH programs and fingerprints.
Hash160 HashOf160(std::span<const std::uint8_t> data);

}  // namespace ctwallet::crypto
