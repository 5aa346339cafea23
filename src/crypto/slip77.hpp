#pragma once

#include <array>
#include <cstdint>
#include <span>

#include "crypto/ec_key.hpp"

namespace ctwallet::crypto {

// SLIP-77 deterministic blinding keys. The master blinding key comes from
// the SLIP-21 node labelled "SLIP-0077" and never touches the BIP-32 tree.
class Slip77MasterKey {
 public:
  static Slip77MasterKey FromSeed(std::span<const std::uint8_t> seed);
  static Slip77MasterKey FromBytes(const std::array<std::uint8_t, 32>& bytes);

  Slip77MasterKey(const Slip77MasterKey&) = default;
  Slip77MasterKey& operator=(const Slip77MasterKey&) = default;
  ~Slip77MasterKey();

  // HMAC-SHA256(master, scriptPubKey). Throws std::runtime_error in the
  // negligible case that the digest is not a valid secret key.
  SecretKey BlindingPrivateKey(std::span<const std::uint8_t> script_pubkey) const;
  CompressedPublicKey BlindingPublicKey(std::span<const std::uint8_t> script_pubkey) const;

  const std::array<std::uint8_t, 32>& bytes() const noexcept { return key_; }

 private:
  explicit Slip77MasterKey(const std::array<std::uint8_t, 32>& key) : key_(key) {}

  std::array<std::uint8_t, 32> key_{};
};

}  // namespace ctwallet::crypto
