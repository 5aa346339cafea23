#pragma once

#include <cstdint>

namespace ctwallet::primitives {

using Amount = std::uint64_t;  // Base units (satoshi for L-BTC).

inline constexpr Amount kSatoshisPerCoin = 100'000'000ULL;
inline constexpr Amount kMaxMoney = 21'000'000ULL * kSatoshisPerCoin;
// Policy-asset outputs at or below this value are not relayed.
inline constexpr Amount kDustThreshold = 546;

inline constexpr bool MoneyRange(Amount value) noexcept { return value <= kMaxMoney; }

inline bool CheckedAdd(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b) || a > kMaxMoney - b) {
    return false;
  }
  if (out) {
    *out = a + b;
  }
  return true;
}

inline bool CheckedSub(Amount a, Amount b, Amount* out) noexcept {
  if (!MoneyRange(a) || !MoneyRange(b) || b > a) {
    return false;
  }
  if (out) {
    *out = a - b;
  }
  return true;
}

}  // namespace ctwallet::primitives
