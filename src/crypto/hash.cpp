#include "crypto/hash.hpp"

#include <algorithm>

#include <oqs/sha2.h>

#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

template <typename Digest, std::size_t BlockSize, typename HashFn>
Digest Hmac(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data,
            HashFn hash) {
  std::array<std::uint8_t, BlockSize> normalized{};
  if (key.size() > BlockSize) {
    const auto digest = hash(key);
    std::copy(digest.begin(), digest.end(), normalized.begin());
  } else {
    std::copy(key.begin(), key.end(), normalized.begin());
  }

  std::vector<std::uint8_t> inner(BlockSize + data.size());
  for (std::size_t i = 0; i < BlockSize; ++i) {
    inner[i] = static_cast<std::uint8_t>(normalized[i] ^ 0x36);
  }
  std::copy(data.begin(), data.end(), inner.begin() + BlockSize);
  const Digest inner_hash = hash(inner);

  std::vector<std::uint8_t> outer(BlockSize + inner_hash.size());
  for (std::size_t i = 0; i < BlockSize; ++i) {
    outer[i] = static_cast<std::uint8_t>(normalized[i] ^ 0x5c);
  }
  std::copy(inner_hash.begin(), inner_hash.end(), outer.begin() + BlockSize);
  const Digest result = hash(outer);

  util::SecureWipe(normalized);
  util::SecureWipe(inner);
  util::SecureWipe(outer);
  return result;
}

// --- RIPEMD-160 -------------------------------------------------------------

inline std::uint32_t Rol(std::uint32_t x, int n) { return (x << n) | (x >> (32 - n)); }

inline std::uint32_t F(int round, std::uint32_t x, std::uint32_t y, std::uint32_t z) {
  switch (round) {
    case 0:
      return x ^ y ^ z;
    case 1:
      return (x & y) | (~x & z);
    case 2:
      return (x | ~y) ^ z;
    case 3:
      return (x & z) | (y & ~z);
    default:
      return x ^ (y | ~z);
  }
}

constexpr std::uint32_t kLeftK[5] = {0x00000000, 0x5a827999, 0x6ed9eba1, 0x8f1bbcdc, 0xa953fd4e};
constexpr std::uint32_t kRightK[5] = {0x50a28be6, 0x5c4dd124, 0x6d703ef3, 0x7a6d76e9, 0x00000000};

constexpr int kLeftWord[80] = {
    0, 1, 2,  3,  4,  5,  6,  7,  8,  9,  10, 11, 12, 13, 14, 15,
    7, 4, 13, 1,  10, 6,  15, 3,  12, 0,  9,  5,  2,  14, 11, 8,
    3, 10, 14, 4, 9,  15, 8,  1,  2,  7,  0,  6,  13, 11, 5,  12,
    1, 9, 11, 10, 0,  8,  12, 4,  13, 3,  7,  15, 14, 5,  6,  2,
    4, 0, 5,  9,  7,  12, 2,  10, 14, 1,  3,  8,  11, 6,  15, 13};
constexpr int kRightWord[80] = {
    5,  14, 7,  0, 9, 2,  11, 4,  13, 6,  15, 8,  1,  10, 3,  12,
    6,  11, 3,  7, 0, 13, 5,  10, 14, 15, 8,  12, 4,  9,  1,  2,
    15, 5,  1,  3, 7, 14, 6,  9,  11, 8,  12, 2,  10, 0,  4,  13,
    8,  6,  4,  1, 3, 11, 15, 0,  5,  12, 2,  13, 9,  7,  10, 14,
    12, 15, 10, 4, 1, 5,  8,  7,  6,  2,  13, 14, 0,  3,  9,  11};
constexpr int kLeftShift[80] = {
    11, 14, 15, 12, 5,  8,  7,  9,  11, 13, 14, 15, 6,  7,  9,  8,
    7,  6,  8,  13, 11, 9,  7,  15, 7,  12, 15, 9,  11, 7,  13, 12,
    11, 13, 6,  7,  14, 9,  13, 15, 14, 8,  13, 6,  5,  12, 7,  5,
    11, 12, 14, 15, 14, 15, 9,  8,  9,  14, 5,  6,  8,  6,  5,  12,
    9,  15, 5,  11, 6,  8,  13, 12, 5,  12, 13, 14, 11, 8,  5,  6};
constexpr int kRightShift[80] = {
    8,  9,  9,  11, 13, 15, 15, 5,  7,  7,  8,  11, 14, 14, 12, 6,
    9,  13, 15, 7,  12, 8,  9,  11, 7,  7,  12, 7,  6,  15, 13, 11,
    9,  7,  15, 11, 8,  6,  6,  14, 12, 13, 5,  14, 13, 13, 7,  5,
    15, 5,  8,  11, 14, 14, 6,  14, 6,  9,  12, 9,  12, 5,  15, 8,
    8,  5,  12, 9,  12, 5,  14, 6,  8,  13, 6,  5,  15, 13, 11, 11};

void Ripemd160Compress(std::array<std::uint32_t, 5>* state, const std::uint8_t block[64]) {
  std::uint32_t x[16];
  for (int i = 0; i < 16; ++i) {
    x[i] = static_cast<std::uint32_t>(block[4 * i]) |
           (static_cast<std::uint32_t>(block[4 * i + 1]) << 8) |
           (static_cast<std::uint32_t>(block[4 * i + 2]) << 16) |
           (static_cast<std::uint32_t>(block[4 * i + 3]) << 24);
  }
  auto& h = *state;
  std::uint32_t al = h[0], bl = h[1], cl = h[2], dl = h[3], el = h[4];
  std::uint32_t ar = h[0], br = h[1], cr = h[2], dr = h[3], er = h[4];
  for (int j = 0; j < 80; ++j) {
    const int round = j / 16;
    std::uint32_t t = Rol(al + F(round, bl, cl, dl) + x[kLeftWord[j]] + kLeftK[round],
                          kLeftShift[j]) + el;
    al = el;
    el = dl;
    dl = Rol(cl, 10);
    cl = bl;
    bl = t;

    t = Rol(ar + F(4 - round, br, cr, dr) + x[kRightWord[j]] + kRightK[round],
            kRightShift[j]) + er;
    ar = er;
    er = dr;
    dr = Rol(cr, 10);
    cr = br;
    br = t;
  }
  const std::uint32_t t = h[1] + cl + dr;
  h[1] = h[2] + dl + er;
  h[2] = h[3] + el + ar;
  h[3] = h[4] + al + br;
  h[4] = h[0] + bl + cr;
  h[0] = t;
}

}  // namespace

Sha256Hash Sha256(std::span<const std::uint8_t> data) {
  Sha256Hash out{};
  OQS_SHA2_sha256(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash DoubleSha256(std::span<const std::uint8_t> data) {
  const auto first = Sha256(data);
  return Sha256(first);
}

Sha512Hash Sha512(std::span<const std::uint8_t> data) {
  Sha512Hash out{};
  OQS_SHA2_sha512(out.data(), data.data(), data.size());
  return out;
}

Sha256Hash HmacSha256(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  return Hmac<Sha256Hash, 64>(key, data,
                              [](std::span<const std::uint8_t> in) { return Sha256(in); });
}

Sha512Hash HmacSha512(std::span<const std::uint8_t> key, std::span<const std::uint8_t> data) {
  return Hmac<Sha512Hash, 128>(key, data,
                               [](std::span<const std::uint8_t> in) { return Sha512(in); });
}

Hash160 Ripemd160(std::span<const std::uint8_t> data) {
  std::array<std::uint32_t, 5> state = {0x67452301, 0xefcdab89, 0x98badcfe, 0x10325476,
                                        0xc3d2e1f0};
  std::vector<std::uint8_t> msg(data.begin(), data.end());
  const std::uint64_t bit_len = static_cast<std::uint64_t>(data.size()) * 8;
  msg.push_back(0x80);
  while (msg.size() % 64 != 56) {
    msg.push_back(0);
  }
  for (int i = 0; i < 8; ++i) {
    msg.push_back(static_cast<std::uint8_t>(bit_len >> (8 * i)));
  }
  for (std::size_t offset = 0; offset < msg.size(); offset += 64) {
    Ripemd160Compress(&state, msg.data() + offset);
  }
  Hash160 out{};
  for (int i = 0; i < 5; ++i) {
    for (int b = 0; b < 4; ++b) {
      out[4 * i + b] = static_cast<std::uint8_t>(state[i] >> (8 * b));
    }
  }
  return out;
}

Hash160 HashOf160(std::span<const std::uint8_t> data) {
  const auto sha = Sha256(data);
  return Ripemd160(sha);
}

}  // namespace ctwallet::crypto
