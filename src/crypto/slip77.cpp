#include "crypto/slip77.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

std::span<const std::uint8_t> AsBytes(std::string_view text) {
  return {reinterpret_cast<const std::uint8_t*>(text.data()), text.size()};
}

}  // namespace

Slip77MasterKey Slip77MasterKey::FromSeed(std::span<const std::uint8_t> seed) {
  // SLIP-21: root node = HMAC-SHA512("Symmetric key seed", seed), then one
  // child per label keyed by the left half of the parent.
  auto root = HmacSha512(AsBytes("Symmetric key seed"), seed);
  std::vector<std::uint8_t> label{0x00};
  const auto text = AsBytes("SLIP-0077");
  label.insert(label.end(), text.begin(), text.end());
  auto node = HmacSha512(std::span<const std::uint8_t>(root.data(), 32), label);
  std::array<std::uint8_t, 32> key{};
  std::copy(node.begin() + 32, node.end(), key.begin());
  util::SecureWipe(root);
  util::SecureWipe(node);
  Slip77MasterKey out(key);
  util::SecureWipe(key);
  return out;
}

Slip77MasterKey Slip77MasterKey::FromBytes(const std::array<std::uint8_t, 32>& bytes) {
  return Slip77MasterKey(bytes);
}

Slip77MasterKey::~Slip77MasterKey() { util::SecureWipe(key_); }

SecretKey Slip77MasterKey::BlindingPrivateKey(
    std::span<const std::uint8_t> script_pubkey) const {
  SecretKey key = HmacSha256(key_, script_pubkey);
  if (!IsValidSecretKey(key)) {
    util::SecureWipe(key);
    throw std::runtime_error("slip77: derived blinding key out of range");
  }
  return key;
}

CompressedPublicKey Slip77MasterKey::BlindingPublicKey(
    std::span<const std::uint8_t> script_pubkey) const {
  auto priv = BlindingPrivateKey(script_pubkey);
  auto pub = PublicKeyFromSecret(priv);
  util::SecureWipe(priv);
  if (!pub) {
    throw std::runtime_error("slip77: failed to compute blinding pubkey");
  }
  return *pub;
}

}  // namespace ctwallet::crypto
