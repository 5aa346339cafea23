#include "wallet/key_ring.hpp"

#include <string>

#include "consensus/sighash.hpp"
#include "crypto/mnemonic.hpp"
#include "script/script.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

constexpr std::uint32_t kPurposeP2shP2wpkh = 49;

crypto::ExtendedPrivateKey DeriveOrThrow(const crypto::ExtendedPrivateKey& root,
                                         std::span<const std::uint32_t> path) {
  crypto::ExtendedPrivateKey out;
  if (!crypto::DerivePath(root, path, &out)) {
    throw WalletError(ErrorCode::kInvalidSeed, "seed yields an invalid derivation path");
  }
  return out;
}

}  // namespace

std::unique_ptr<KeyRing> KeyRing::FromMnemonic(std::string_view mnemonic,
                                               std::string_view passphrase,
                                               const config::NetworkParams& network) {
  auto normalized = crypto::NormalizeMnemonic(mnemonic);
  std::string error;
  if (!crypto::ValidateMnemonic(normalized, &error)) {
    util::SecureWipe(normalized);
    throw WalletError(ErrorCode::kInvalidSeed, "invalid mnemonic: " + error);
  }
  auto seed = crypto::MnemonicSeedFromSentence(normalized, passphrase);
  util::SecureWipe(normalized);
  std::vector<std::uint8_t> seed_bytes(seed.begin(), seed.end());
  util::SecureWipe(seed);
  return std::unique_ptr<KeyRing>(new KeyRing(std::move(seed_bytes), network));
}

std::unique_ptr<KeyRing> KeyRing::FromSeed(std::span<const std::uint8_t> seed,
                                           const config::NetworkParams& network) {
  if (seed.size() < kMinSeedSize || seed.size() > kMaxSeedSize) {
    throw WalletError(ErrorCode::kInvalidSeed,
                      "seed must be 16..64 bytes, got " + std::to_string(seed.size()));
  }
  return std::unique_ptr<KeyRing>(
      new KeyRing(std::vector<std::uint8_t>(seed.begin(), seed.end()), network));
}

KeyRing::KeyRing(std::vector<std::uint8_t> seed, const config::NetworkParams& network)
    : seed_(std::move(seed)),
      network_(network),
      blinding_master_(crypto::Slip77MasterKey::FromSeed(seed_)) {
  crypto::ExtendedPrivateKey master;
  if (!crypto::MasterKeyFromSeed(seed_, &master)) {
    util::SecureWipe(seed_);
    throw WalletError(ErrorCode::kInvalidSeed, "seed yields an invalid master key");
  }
  fingerprint_ = master.Fingerprint();
  const std::array<std::uint32_t, 3> account_path{
      kPurposeP2shP2wpkh | crypto::kHardenedBit,
      network_.bip44_coin_type | crypto::kHardenedBit,
      0 | crypto::kHardenedBit,
  };
  const auto account = DeriveOrThrow(master, account_path);
  for (std::uint32_t chain = 0; chain < chain_keys_.size(); ++chain) {
    const std::array<std::uint32_t, 1> chain_path{chain};
    chain_keys_[chain] = DeriveOrThrow(account, chain_path);
  }
}

KeyRing::~KeyRing() { util::SecureWipe(seed_); }

crypto::ExtendedPrivateKey KeyRing::ChildKey(Chain chain, std::uint32_t index) const {
  if (index > kMaxDerivationIndex) {
    throw WalletError(ErrorCode::kDerivationRange,
                      "derivation index " + std::to_string(index) + " out of range");
  }
  crypto::ExtendedPrivateKey child;
  if (!crypto::DeriveChild(chain_keys_[static_cast<std::uint32_t>(chain)], index, &child)) {
    // Probability below 2^-127; BIP-32 says to skip the index.
    throw WalletError(ErrorCode::kDerivationRange,
                      "index " + std::to_string(index) + " yields an invalid key");
  }
  return child;
}

DerivedKeyPair KeyRing::Derive(Chain chain, std::uint32_t index) const {
  const auto child = ChildKey(chain, index);
  DerivedKeyPair pair;
  pair.chain = chain;
  pair.index = index;
  pair.signing_pubkey = child.PublicKey();
  pair.script_pubkey = script::P2shP2wpkhScriptPubKey(pair.signing_pubkey).data;
  pair.blinding_pubkey = blinding_master_.BlindingPublicKey(pair.script_pubkey);
  return pair;
}

std::vector<std::uint8_t> KeyRing::SignSighash(Chain chain, std::uint32_t index,
                                               const std::array<std::uint8_t, 32>& sighash,
                                               std::uint32_t hash_type) const {
  const auto child = ChildKey(chain, index);
  auto signature = crypto::SignDigestLowR(child.key, sighash);
  if (!signature) {
    throw WalletError(ErrorCode::kSigningFailed,
                      "ecdsa signing failed for index " + std::to_string(index));
  }
  signature->push_back(static_cast<std::uint8_t>(hash_type));
  return *signature;
}

crypto::SecretKey KeyRing::BlindingPrivateKey(std::span<const std::uint8_t> script_pubkey) const {
  return blinding_master_.BlindingPrivateKey(script_pubkey);
}

crypto::CompressedPublicKey KeyRing::BlindingPublicKey(
    std::span<const std::uint8_t> script_pubkey) const {
  return blinding_master_.BlindingPublicKey(script_pubkey);
}

}  // namespace ctwallet::wallet
