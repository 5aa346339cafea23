#include "crypto/ec_key.hpp"

#include <stdexcept>

#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

class ContextHolder {
 public:
  ContextHolder() {
    ctx_ = secp256k1_context_create(SECP256K1_CONTEXT_SIGN | SECP256K1_CONTEXT_VERIFY);
    if (ctx_ == nullptr) {
      throw std::runtime_error("secp256k1_context_create failed");
    }
    auto seed = util::SecureRandomArray<32>();
    if (!secp256k1_context_randomize(ctx_, seed.data())) {
      secp256k1_context_destroy(ctx_);
      throw std::runtime_error("secp256k1_context_randomize failed");
    }
    util::SecureWipe(seed);
  }
  ~ContextHolder() { secp256k1_context_destroy(ctx_); }
  ContextHolder(const ContextHolder&) = delete;
  ContextHolder& operator=(const ContextHolder&) = delete;

  const secp256k1_context* get() const noexcept { return ctx_; }

 private:
  secp256k1_context* ctx_{nullptr};
};

constexpr int kMaxGrindAttempts = 1024;

}  // namespace

const secp256k1_context* Secp256k1Context() {
  static const ContextHolder holder;
  return holder.get();
}

bool IsValidSecretKey(const SecretKey& key) {
  return secp256k1_ec_seckey_verify(Secp256k1Context(), key.data()) == 1;
}

std::optional<CompressedPublicKey> PublicKeyFromSecret(const SecretKey& key) {
  secp256k1_pubkey pubkey;
  if (!secp256k1_ec_pubkey_create(Secp256k1Context(), &pubkey, key.data())) {
    return std::nullopt;
  }
  CompressedPublicKey out{};
  std::size_t len = out.size();
  secp256k1_ec_pubkey_serialize(Secp256k1Context(), out.data(), &len, &pubkey,
                                SECP256K1_EC_COMPRESSED);
  return out;
}

bool ParsePublicKey(std::span<const std::uint8_t> bytes, secp256k1_pubkey* out) {
  return secp256k1_ec_pubkey_parse(Secp256k1Context(), out, bytes.data(), bytes.size()) == 1;
}

std::optional<std::vector<std::uint8_t>> SignDigestLowR(
    const SecretKey& key, const std::array<std::uint8_t, 32>& digest) {
  const auto* ctx = Secp256k1Context();
  secp256k1_ecdsa_signature sig;
  std::array<std::uint8_t, 32> extra{};
  std::array<std::uint8_t, 64> compact{};
  bool low_r = false;
  for (int counter = 0; counter < kMaxGrindAttempts; ++counter) {
    // The first attempt uses plain RFC 6979 so signatures match other wallets.
    const void* ndata = nullptr;
    if (counter > 0) {
      extra[0] = static_cast<std::uint8_t>(counter & 0xFF);
      extra[1] = static_cast<std::uint8_t>((counter >> 8) & 0xFF);
      ndata = extra.data();
    }
    if (!secp256k1_ecdsa_sign(ctx, &sig, digest.data(), key.data(),
                              secp256k1_nonce_function_rfc6979, ndata)) {
      return std::nullopt;
    }
    secp256k1_ecdsa_signature_serialize_compact(ctx, compact.data(), &sig);
    if (compact[0] < 0x80) {
      low_r = true;
      break;
    }
  }
  if (!low_r) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> der(72);
  std::size_t der_len = der.size();
  if (!secp256k1_ecdsa_signature_serialize_der(ctx, der.data(), &der_len, &sig)) {
    return std::nullopt;
  }
  der.resize(der_len);
  return der;
}

bool VerifyDerSignature(const CompressedPublicKey& pubkey,
                        const std::array<std::uint8_t, 32>& digest,
                        std::span<const std::uint8_t> der) {
  const auto* ctx = Secp256k1Context();
  secp256k1_pubkey parsed;
  secp256k1_ecdsa_signature sig;
  if (!secp256k1_ec_pubkey_parse(ctx, &parsed, pubkey.data(), pubkey.size())) {
    return false;
  }
  if (!secp256k1_ecdsa_signature_parse_der(ctx, &sig, der.data(), der.size())) {
    return false;
  }
  return secp256k1_ecdsa_verify(ctx, &sig, digest.data(), &parsed) == 1;
}

}  // namespace ctwallet::crypto
