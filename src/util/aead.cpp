#include "util/aead.hpp"

#include <algorithm>
#include <cstring>
#include <stdexcept>

#include "util/secure_wipe.hpp"

namespace ctwallet::util {

namespace {

inline std::uint32_t Load32Le(const std::uint8_t* in) {
  return static_cast<std::uint32_t>(in[0]) | (static_cast<std::uint32_t>(in[1]) << 8) |
         (static_cast<std::uint32_t>(in[2]) << 16) | (static_cast<std::uint32_t>(in[3]) << 24);
}

inline std::uint64_t Load64Le(const std::uint8_t* in) {
  return static_cast<std::uint64_t>(Load32Le(in)) |
         (static_cast<std::uint64_t>(Load32Le(in + 4)) << 32);
}

inline void Store32Le(std::uint8_t* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

inline void Store64Le(std::uint8_t* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out[i] = static_cast<std::uint8_t>(value >> (8 * i));
  }
}

inline std::uint32_t Rotl32(std::uint32_t v, int n) { return (v << n) | (v >> (32 - n)); }

// ChaCha20 keystream generator (RFC 8439 section 2.3).
class ChaCha20 {
 public:
  ChaCha20(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
           std::uint32_t counter) {
    input_[0] = 0x61707865;
    input_[1] = 0x3320646e;
    input_[2] = 0x79622d32;
    input_[3] = 0x6b206574;
    for (int i = 0; i < 8; ++i) {
      input_[4 + i] = Load32Le(key.data() + 4 * i);
    }
    input_[12] = counter;
    for (int i = 0; i < 3; ++i) {
      input_[13 + i] = Load32Le(nonce.data() + 4 * i);
    }
  }
  ~ChaCha20() {
    SecureWipe(input_.data(), sizeof(input_));
  }

  void NextBlock(std::array<std::uint8_t, 64>* out) {
    std::array<std::uint32_t, 16> x = input_;
    for (int round = 0; round < 10; ++round) {
      Quarter(x, 0, 4, 8, 12);
      Quarter(x, 1, 5, 9, 13);
      Quarter(x, 2, 6, 10, 14);
      Quarter(x, 3, 7, 11, 15);
      Quarter(x, 0, 5, 10, 15);
      Quarter(x, 1, 6, 11, 12);
      Quarter(x, 2, 7, 8, 13);
      Quarter(x, 3, 4, 9, 14);
    }
    for (int i = 0; i < 16; ++i) {
      Store32Le(out->data() + 4 * i, x[i] + input_[i]);
    }
    ++input_[12];
    SecureWipe(x.data(), sizeof(x));
  }

  void Xor(std::span<std::uint8_t> data) {
    std::array<std::uint8_t, 64> block{};
    for (std::size_t offset = 0; offset < data.size(); offset += block.size()) {
      NextBlock(&block);
      const std::size_t chunk = std::min(block.size(), data.size() - offset);
      for (std::size_t i = 0; i < chunk; ++i) {
        data[offset + i] ^= block[i];
      }
    }
    SecureWipe(block);
  }

 private:
  static void Quarter(std::array<std::uint32_t, 16>& x, int a, int b, int c, int d) {
    x[a] += x[b]; x[d] = Rotl32(x[d] ^ x[a], 16);
    x[c] += x[d]; x[b] = Rotl32(x[b] ^ x[c], 12);
    x[a] += x[b]; x[d] = Rotl32(x[d] ^ x[a], 8);
    x[c] += x[d]; x[b] = Rotl32(x[b] ^ x[c], 7);
  }

  std::array<std::uint32_t, 16> input_{};
};

// Poly1305 over 44/44/42-bit limbs. Input must be whole 16-byte blocks; the
// AEAD construction pads every section so no partial block ever reaches it.
class Poly1305 {
 public:
  explicit Poly1305(const std::array<std::uint8_t, 32>& key) {
    const std::uint64_t t0 = Load64Le(key.data());
    const std::uint64_t t1 = Load64Le(key.data() + 8);
    r_[0] = t0 & 0xffc0fffffffULL;
    r_[1] = ((t0 >> 44) | (t1 << 20)) & 0xfffffc0ffffULL;
    r_[2] = (t1 >> 24) & 0x00ffffffc0fULL;
    pad_[0] = Load64Le(key.data() + 16);
    pad_[1] = Load64Le(key.data() + 24);
  }
  ~Poly1305() {
    SecureWipe(r_.data(), sizeof(r_));
    SecureWipe(h_.data(), sizeof(h_));
    SecureWipe(pad_.data(), sizeof(pad_));
  }

  void Blocks(std::span<const std::uint8_t> data) {
    constexpr std::uint64_t kMask44 = 0xfffffffffffULL;
    constexpr std::uint64_t kMask42 = 0x3ffffffffffULL;
    constexpr std::uint64_t kHiBit = 1ULL << 40;
    const std::uint64_t s1 = r_[1] * (5 << 2);
    const std::uint64_t s2 = r_[2] * (5 << 2);
    for (std::size_t offset = 0; offset + 16 <= data.size(); offset += 16) {
      const std::uint64_t t0 = Load64Le(data.data() + offset);
      const std::uint64_t t1 = Load64Le(data.data() + offset + 8);
      h_[0] += t0 & kMask44;
      h_[1] += ((t0 >> 44) | (t1 << 20)) & kMask44;
      h_[2] += ((t1 >> 24) & kMask42) | kHiBit;

      const Uint128 d0 = Mul(h_[0], r_[0]) + Mul(h_[1], s2) + Mul(h_[2], s1);
      Uint128 d1 = Mul(h_[0], r_[1]) + Mul(h_[1], r_[0]) + Mul(h_[2], s2);
      Uint128 d2 = Mul(h_[0], r_[2]) + Mul(h_[1], r_[1]) + Mul(h_[2], r_[0]);

      std::uint64_t c = static_cast<std::uint64_t>(d0 >> 44);
      h_[0] = static_cast<std::uint64_t>(d0) & kMask44;
      d1 += c;
      c = static_cast<std::uint64_t>(d1 >> 44);
      h_[1] = static_cast<std::uint64_t>(d1) & kMask44;
      d2 += c;
      c = static_cast<std::uint64_t>(d2 >> 42);
      h_[2] = static_cast<std::uint64_t>(d2) & kMask42;
      h_[0] += c * 5;
      c = h_[0] >> 44;
      h_[0] &= kMask44;
      h_[1] += c;
    }
  }

  AeadTag Finish() {
    constexpr std::uint64_t kMask44 = 0xfffffffffffULL;
    constexpr std::uint64_t kMask42 = 0x3ffffffffffULL;
    std::uint64_t h0 = h_[0];
    std::uint64_t h1 = h_[1];
    std::uint64_t h2 = h_[2];

    std::uint64_t c = h1 >> 44;
    h1 &= kMask44;
    h2 += c; c = h2 >> 42; h2 &= kMask42;
    h0 += c * 5; c = h0 >> 44; h0 &= kMask44;
    h1 += c; c = h1 >> 44; h1 &= kMask44;
    h2 += c; c = h2 >> 42; h2 &= kMask42;
    h0 += c * 5; c = h0 >> 44; h0 &= kMask44;
    h1 += c;

    // Select h or h - p in constant time.
    std::uint64_t g0 = h0 + 5;
    c = g0 >> 44;
    g0 &= kMask44;
    std::uint64_t g1 = h1 + c;
    c = g1 >> 44;
    g1 &= kMask44;
    std::uint64_t g2 = h2 + c - (1ULL << 42);
    const std::uint64_t keep_g = (g2 >> 63) - 1;
    h0 = (h0 & ~keep_g) | (g0 & keep_g);
    h1 = (h1 & ~keep_g) | (g1 & keep_g);
    h2 = (h2 & ~keep_g) | (g2 & keep_g);

    const std::uint64_t t0 = pad_[0];
    const std::uint64_t t1 = pad_[1];
    h0 += t0 & kMask44;
    c = h0 >> 44;
    h0 &= kMask44;
    h1 += (((t0 >> 44) | (t1 << 20)) & kMask44) + c;
    c = h1 >> 44;
    h1 &= kMask44;
    h2 += ((t1 >> 24) & kMask42) + c;
    h2 &= kMask42;

    AeadTag tag{};
    Store64Le(tag.data(), h0 | (h1 << 44));
    Store64Le(tag.data() + 8, (h1 >> 20) | (h2 << 24));
    return tag;
  }

 private:
  using Uint128 = unsigned __int128;
  static Uint128 Mul(std::uint64_t a, std::uint64_t b) {
    return static_cast<Uint128>(a) * b;
  }

  std::array<std::uint64_t, 3> r_{};
  std::array<std::uint64_t, 3> h_{};
  std::array<std::uint64_t, 2> pad_{};
};

void AppendPadded(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> data) {
  out->insert(out->end(), data.begin(), data.end());
  const std::size_t rem = data.size() % 16;
  if (rem != 0) {
    out->insert(out->end(), 16 - rem, 0);
  }
}

AeadTag ComputeTag(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce,
                   std::span<const std::uint8_t> aad,
                   std::span<const std::uint8_t> ciphertext) {
  std::array<std::uint8_t, 64> block0{};
  ChaCha20(key, nonce, 0).NextBlock(&block0);
  std::array<std::uint8_t, 32> poly_key{};
  std::copy_n(block0.begin(), poly_key.size(), poly_key.begin());
  SecureWipe(block0);

  std::vector<std::uint8_t> mac_data;
  mac_data.reserve(aad.size() + ciphertext.size() + 48);
  AppendPadded(&mac_data, aad);
  AppendPadded(&mac_data, ciphertext);
  std::uint8_t lengths[16];
  Store64Le(lengths, static_cast<std::uint64_t>(aad.size()));
  Store64Le(lengths + 8, static_cast<std::uint64_t>(ciphertext.size()));
  mac_data.insert(mac_data.end(), lengths, lengths + 16);

  Poly1305 mac(poly_key);
  SecureWipe(poly_key);
  mac.Blocks(mac_data);
  return mac.Finish();
}

bool TagsEqual(const AeadTag& a, const AeadTag& b) {
  std::uint8_t diff = 0;
  for (std::size_t i = 0; i < a.size(); ++i) {
    diff |= static_cast<std::uint8_t>(a[i] ^ b[i]);
  }
  return diff == 0;
}

bool ValidKeyAndNonce(std::span<const std::uint8_t> key, std::span<const std::uint8_t> nonce) {
  return key.size() == kChaCha20Poly1305KeySize && nonce.size() == kChaCha20Poly1305NonceSize;
}

}  // namespace

std::vector<std::uint8_t> ChaCha20Poly1305Seal(std::span<const std::uint8_t> key,
                                               std::span<const std::uint8_t> nonce,
                                               std::span<const std::uint8_t> aad,
                                               std::span<const std::uint8_t> plaintext,
                                               AeadTag* tag) {
  if (!ValidKeyAndNonce(key, nonce)) {
    throw std::invalid_argument("invalid key/nonce length");
  }
  std::vector<std::uint8_t> ciphertext(plaintext.begin(), plaintext.end());
  ChaCha20(key, nonce, 1).Xor(ciphertext);
  *tag = ComputeTag(key, nonce, aad, ciphertext);
  return ciphertext;
}

bool ChaCha20Poly1305Open(std::span<const std::uint8_t> key,
                          std::span<const std::uint8_t> nonce,
                          std::span<const std::uint8_t> aad,
                          std::span<const std::uint8_t> ciphertext,
                          const AeadTag& tag,
                          std::vector<std::uint8_t>* plaintext) {
  plaintext->clear();
  if (!ValidKeyAndNonce(key, nonce)) {
    return false;
  }
  if (!TagsEqual(tag, ComputeTag(key, nonce, aad, ciphertext))) {
    return false;
  }
  plaintext->assign(ciphertext.begin(), ciphertext.end());
  ChaCha20(key, nonce, 1).Xor(*plaintext);
  return true;
}

}  // namespace ctwallet::util
