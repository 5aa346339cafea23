#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace ctwallet::wallet {

enum class ErrorCode {
  kInvalidSeed,
  kDerivationRange,
  kAuthenticationFailed,
  kStoreCorrupt,
  kNotFound,
  kStoreIo,
  kNetworkTimeout,
  kNetworkDisconnected,
  kServerInconsistent,
  kProtocolError,
  kReorgDetected,
  kInsufficientFunds,
  kBlindingError,
  kFeeEstimationDivergence,
  kSigningFailed,
  kInvalidAddress,
  kInvalidAmount,
  kInvalidRequest,
  kInvalidConfig,
  kCancelled,
};

std::string_view ErrorCodeName(ErrorCode code);

// Per-asset detail attached to funding failures.
struct AssetShortfall {
  primitives::AssetId asset{};
  primitives::Amount required{0};
  primitives::Amount available{0};
};

class WalletError : public std::runtime_error {
 public:
  WalletError(ErrorCode code, const std::string& message);
  WalletError(ErrorCode code, const std::string& message, std::vector<AssetShortfall> shortfalls);

  ErrorCode code() const noexcept { return code_; }
  const std::vector<AssetShortfall>& shortfalls() const noexcept { return shortfalls_; }

  // Transport failures and in-flight reorgs may succeed on a later attempt.
  bool IsRetryable() const noexcept;

 private:
  ErrorCode code_;
  std::vector<AssetShortfall> shortfalls_;
};

}  // namespace ctwallet::wallet
