#pragma once

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ctwallet::util {

struct Argon2idParams {
  std::uint32_t t_cost{3};           // iterations
  std::uint32_t m_cost_kib{65536};   // memory in KiB
  std::uint32_t parallelism{1};      // lanes
};

// Upper bounds accepted from configuration and from sealed-store headers.
inline constexpr std::uint32_t kMaxArgon2idT = 10;
inline constexpr std::uint32_t kMaxArgon2idMemoryKiB = 1024u * 1024u;  // 1 GiB
inline constexpr std::uint32_t kMaxArgon2idParallelism = 8;

bool CheckArgon2idParams(const Argon2idParams& params, std::string* error = nullptr);

// Derive `key_size` bytes with Argon2id.
bool DeriveKeyArgon2id(std::string_view password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::size_t key_size,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error = nullptr);

}  // namespace ctwallet::util
