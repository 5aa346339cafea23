#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

#include "crypto/ec_key.hpp"

namespace ctwallet::crypto {

inline constexpr std::uint32_t kHardenedBit = 0x80000000u;

// BIP-32 extended private key. Secret material is wiped on destruction.
struct ExtendedPrivateKey {
  SecretKey key{};
  std::array<std::uint8_t, 32> chain_code{};
  std::uint8_t depth{0};
  std::uint32_t child_number{0};
  std::array<std::uint8_t, 4> parent_fingerprint{};

  ExtendedPrivateKey() = default;
  ExtendedPrivateKey(const ExtendedPrivateKey&) = default;
  ExtendedPrivateKey& operator=(const ExtendedPrivateKey&) = default;
  ~ExtendedPrivateKey();

  CompressedPublicKey PublicKey() const;
  std::array<std::uint8_t, 4> Fingerprint() const;
};

// Returns false only for the negligible case where IL is zero or >= n.
bool MasterKeyFromSeed(std::span<const std::uint8_t> seed, ExtendedPrivateKey* out);

// CKDpriv. Fails (false) when the derived key is invalid; callers move on
// to the next index per BIP-32.
bool DeriveChild(const ExtendedPrivateKey& parent, std::uint32_t index,
                 ExtendedPrivateKey* out);

bool DerivePath(const ExtendedPrivateKey& root, std::span<const std::uint32_t> path,
                ExtendedPrivateKey* out);

}  // namespace ctwallet::crypto
