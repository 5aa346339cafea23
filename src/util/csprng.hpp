#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ctwallet::util {

// Fills `out` from the operating system CSPRNG.
bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error = nullptr);

// Throwing variants for callers that cannot continue without randomness
// (keys, blinders, nonces, salts).
void FillSecureRandomBytesOrThrow(std::span<std::uint8_t> out);
std::vector<std::uint8_t> SecureRandomBytes(std::size_t size);

template <std::size_t N>
std::array<std::uint8_t, N> SecureRandomArray() {
  std::array<std::uint8_t, N> out{};
  FillSecureRandomBytesOrThrow(out);
  return out;
}

// Uniform value in [0, bound). `bound` must be non-zero.
std::uint64_t SecureRandomBelow(std::uint64_t bound);

}  // namespace ctwallet::util
