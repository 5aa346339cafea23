#include "crypto/bip32.hpp"

#include <algorithm>
#include <stdexcept>
#include <string_view>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

constexpr std::string_view kMasterHmacKey = "Bitcoin seed";

void SplitHmacOutput(Sha512Hash& digest, ExtendedPrivateKey* out) {
  std::copy(digest.begin(), digest.begin() + 32, out->key.begin());
  std::copy(digest.begin() + 32, digest.end(), out->chain_code.begin());
  util::SecureWipe(digest);
}

}  // namespace

ExtendedPrivateKey::~ExtendedPrivateKey() {
  util::SecureWipe(key);
  util::SecureWipe(chain_code);
}

CompressedPublicKey ExtendedPrivateKey::PublicKey() const {
  auto pub = PublicKeyFromSecret(key);
  if (!pub) {
    throw std::logic_error("extended key holds an invalid secret");
  }
  return *pub;
}

std::array<std::uint8_t, 4> ExtendedPrivateKey::Fingerprint() const {
  const auto pub = PublicKey();
  const auto id = HashOf160(pub);
  std::array<std::uint8_t, 4> fp{};
  std::copy(id.begin(), id.begin() + 4, fp.begin());
  return fp;
}

bool MasterKeyFromSeed(std::span<const std::uint8_t> seed, ExtendedPrivateKey* out) {
  const std::span<const std::uint8_t> hmac_key(
      reinterpret_cast<const std::uint8_t*>(kMasterHmacKey.data()), kMasterHmacKey.size());
  auto digest = HmacSha512(hmac_key, seed);
  ExtendedPrivateKey master;
  SplitHmacOutput(digest, &master);
  if (!IsValidSecretKey(master.key)) {
    return false;
  }
  *out = master;
  return true;
}

bool DeriveChild(const ExtendedPrivateKey& parent, std::uint32_t index,
                 ExtendedPrivateKey* out) {
  std::vector<std::uint8_t> data;
  data.reserve(37);
  if (index & kHardenedBit) {
    data.push_back(0x00);
    data.insert(data.end(), parent.key.begin(), parent.key.end());
  } else {
    const auto pub = parent.PublicKey();
    data.insert(data.end(), pub.begin(), pub.end());
  }
  data.push_back(static_cast<std::uint8_t>(index >> 24));
  data.push_back(static_cast<std::uint8_t>(index >> 16));
  data.push_back(static_cast<std::uint8_t>(index >> 8));
  data.push_back(static_cast<std::uint8_t>(index));

  auto digest = HmacSha512(parent.chain_code, data);
  util::SecureWipe(data);

  ExtendedPrivateKey child;
  SplitHmacOutput(digest, &child);
  // child = IL + k_par (mod n); the IL half currently sits in child.key.
  SecretKey tweak = child.key;
  child.key = parent.key;
  const bool ok = IsValidSecretKey(tweak) &&
                  secp256k1_ec_seckey_tweak_add(Secp256k1Context(), child.key.data(),
                                                tweak.data()) == 1;
  util::SecureWipe(tweak);
  if (!ok) {
    return false;
  }
  child.depth = static_cast<std::uint8_t>(parent.depth + 1);
  child.child_number = index;
  child.parent_fingerprint = parent.Fingerprint();
  *out = child;
  return true;
}

bool DerivePath(const ExtendedPrivateKey& root, std::span<const std::uint32_t> path,
                ExtendedPrivateKey* out) {
  ExtendedPrivateKey current = root;
  for (const auto index : path) {
    ExtendedPrivateKey next;
    if (!DeriveChild(current, index, &next)) {
      return false;
    }
    current = next;
  }
  *out = current;
  return true;
}

}  // namespace ctwallet::crypto
