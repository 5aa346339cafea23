#include "crypto/pbkdf2.hpp"

#include <algorithm>
#include <stdexcept>

#include "crypto/hash.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

std::vector<std::uint8_t> Pbkdf2HmacSha512(std::string_view password,
                                           std::span<const std::uint8_t> salt,
                                           std::uint32_t iterations,
                                           std::size_t dk_len) {
  if (iterations == 0) {
    throw std::invalid_argument("PBKDF2 iterations must be >= 1");
  }
  const std::span<const std::uint8_t> key(
      reinterpret_cast<const std::uint8_t*>(password.data()), password.size());
  std::vector<std::uint8_t> out;
  out.reserve(dk_len);
  std::vector<std::uint8_t> block_input(salt.begin(), salt.end());
  block_input.resize(salt.size() + 4);

  for (std::uint32_t block = 1; out.size() < dk_len; ++block) {
    block_input[salt.size() + 0] = static_cast<std::uint8_t>(block >> 24);
    block_input[salt.size() + 1] = static_cast<std::uint8_t>(block >> 16);
    block_input[salt.size() + 2] = static_cast<std::uint8_t>(block >> 8);
    block_input[salt.size() + 3] = static_cast<std::uint8_t>(block);

    Sha512Hash u = HmacSha512(key, block_input);
    Sha512Hash t = u;
    for (std::uint32_t i = 1; i < iterations; ++i) {
      u = HmacSha512(key, u);
      for (std::size_t j = 0; j < t.size(); ++j) {
        t[j] ^= u[j];
      }
    }
    const std::size_t take = std::min(t.size(), dk_len - out.size());
    out.insert(out.end(), t.begin(), t.begin() + static_cast<std::ptrdiff_t>(take));
    util::SecureWipe(u);
    util::SecureWipe(t);
  }
  util::SecureWipe(block_input);
  return out;
}

}  // namespace ctwallet::crypto
