#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include <secp256k1.h>

namespace ctwallet::crypto {

using SecretKey = std::array<std::uint8_t, 32>;
using CompressedPublicKey = std::array<std::uint8_t, 33>;

// Process-wide randomized secp256k1-zkp context. Only const API calls are
// made on it after creation, so it may be shared between threads.
const secp256k1_context* Secp256k1Context();

bool IsValidSecretKey(const SecretKey& key);
std::optional<CompressedPublicKey> PublicKeyFromSecret(const SecretKey& key);
bool ParsePublicKey(std::span<const std::uint8_t> bytes, secp256k1_pubkey* out);

// RFC 6979 ECDSA over a 32-byte digest, ground until R fits in 32 bytes
// without a sign byte (low-R), normalized to low-S, DER encoded.
std::optional<std::vector<std::uint8_t>> SignDigestLowR(const SecretKey& key,
                                                        const std::array<std::uint8_t, 32>& digest);

bool VerifyDerSignature(const CompressedPublicKey& pubkey,
                        const std::array<std::uint8_t, 32>& digest,
                        std::span<const std::uint8_t> der);

}  // namespace ctwallet::crypto
