#pragma once

#include <array>
#include <cstdint>
#include <memory>
#include <span>
#include <string_view>
#include <vector>

#include "config/network.hpp"
#include "consensus/sighash.hpp"
#include "crypto/bip32.hpp"
#include "crypto/ec_key.hpp"
#include "crypto/slip77.hpp"

namespace ctwallet::wallet {

enum class Chain : std::uint32_t {
  kExternal = 0,
  kInternal = 1,
};

inline constexpr std::uint32_t kMaxDerivationIndex = 0x7FFFFFFFu;
inline constexpr std::size_t kMinSeedSize = 16;
inline constexpr std::size_t kMaxSeedSize = 64;

struct DerivedKeyPair {
  Chain chain{Chain::kExternal};
  std::uint32_t index{0};
  crypto::CompressedPublicKey signing_pubkey{};
  std::vector<std::uint8_t> script_pubkey;
  // SLIP-77 key bound to `script_pubkey`, independent of the signing tree.
  crypto::CompressedPublicKey blinding_pubkey{};

  bool operator==(const DerivedKeyPair&) const = default;
};

// Owns the seed and the BIP-32 account key m/49'/coin'/0'. Every method is
// a pure function of the seed, so no locking is needed. Private signing keys
// never leave this class.
class KeyRing {
 public:
  // Throws WalletError(kInvalidSeed) for bad word counts, unknown words or
  // checksum mismatches.
  static std::unique_ptr<KeyRing> FromMnemonic(std::string_view mnemonic,
                                               std::string_view passphrase,
                                               const config::NetworkParams& network);
  // Throws WalletError(kInvalidSeed) unless 16..64 bytes.
  static std::unique_ptr<KeyRing> FromSeed(std::span<const std::uint8_t> seed,
                                           const config::NetworkParams& network);

  ~KeyRing();
  KeyRing(const KeyRing&) = delete;
  KeyRing& operator=(const KeyRing&) = delete;

  // Throws WalletError(kDerivationRange) for index > 2^31 - 1.
  DerivedKeyPair Derive(Chain chain, std::uint32_t index) const;
  std::array<std::uint8_t, 4> MasterFingerprint() const noexcept { return fingerprint_; }

  // DER signature followed by the `hash_type` byte. Throws
  // WalletError(kSigningFailed).
  std::vector<std::uint8_t> SignSighash(Chain chain, std::uint32_t index,
                                        const std::array<std::uint8_t, 32>& sighash,
                                        std::uint32_t hash_type = consensus::kSighashAll) const;

  crypto::SecretKey BlindingPrivateKey(std::span<const std::uint8_t> script_pubkey) const;
  crypto::CompressedPublicKey BlindingPublicKey(std::span<const std::uint8_t> script_pubkey) const;
  const crypto::Slip77MasterKey& blinding_master() const noexcept { return blinding_master_; }

  // Raw seed, for sealing into the encrypted store only.
  std::span<const std::uint8_t> seed() const noexcept { return seed_; }
  const config::NetworkParams& network() const noexcept { return network_; }

 private:
  KeyRing(std::vector<std::uint8_t> seed, const config::NetworkParams& network);

  crypto::ExtendedPrivateKey ChildKey(Chain chain, std::uint32_t index) const;

  std::vector<std::uint8_t> seed_;
  config::NetworkParams network_;
  std::array<crypto::ExtendedPrivateKey, 2> chain_keys_{};
  crypto::Slip77MasterKey blinding_master_;
  std::array<std::uint8_t, 4> fingerprint_{};
};

}  // namespace ctwallet::wallet
