#include "wallet/errors.hpp"

#include <utility>

namespace ctwallet::wallet {

std::string_view ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kInvalidSeed:
      return "InvalidSeed";
    case ErrorCode::kDerivationRange:
      return "DerivationRangeError";
    case ErrorCode::kAuthenticationFailed:
      return "AuthenticationFailed";
    case ErrorCode::kStoreCorrupt:
      return "StoreCorrupt";
    case ErrorCode::kNotFound:
      return "NotFound";
    case ErrorCode::kStoreIo:
      return "StoreIo";
    case ErrorCode::kNetworkTimeout:
      return "NetworkTimeout";
    case ErrorCode::kNetworkDisconnected:
      return "NetworkDisconnected";
    case ErrorCode::kServerInconsistent:
      return "ServerInconsistent";
    case ErrorCode::kProtocolError:
      return "ProtocolError";
    case ErrorCode::kReorgDetected:
      return "ReorgDetected";
    case ErrorCode::kInsufficientFunds:
      return "InsufficientFunds";
    case ErrorCode::kBlindingError:
      return "BlindingError";
    case ErrorCode::kFeeEstimationDivergence:
      return "FeeEstimationDivergence";
    case ErrorCode::kSigningFailed:
      return "SigningFailed";
    case ErrorCode::kInvalidAddress:
      return "InvalidAddress";
    case ErrorCode::kInvalidAmount:
      return "InvalidAmount";
    case ErrorCode::kInvalidRequest:
      return "InvalidRequest";
    case ErrorCode::kInvalidConfig:
      return "InvalidConfig";
    case ErrorCode::kCancelled:
      return "Cancelled";
  }
  return "Unknown";
}

WalletError::WalletError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

WalletError::WalletError(ErrorCode code, const std::string& message,
                         std::vector<AssetShortfall> shortfalls)
    : std::runtime_error(message), code_(code), shortfalls_(std::move(shortfalls)) {}

bool WalletError::IsRetryable() const noexcept {
  return code_ == ErrorCode::kNetworkTimeout || code_ == ErrorCode::kNetworkDisconnected ||
         code_ == ErrorCode::kReorgDetected;
}

}  // namespace ctwallet::wallet
