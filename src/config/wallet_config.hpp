#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>

#include "config/network.hpp"
#include "crypto/kdf.hpp"
#include "nlohmann/json.hpp"
#include "util/logging.hpp"

namespace ctwallet::config {

struct SyncConfig {
  std::uint32_t gap_limit{20};
  std::size_t max_parallel_requests{8};
  std::chrono::milliseconds request_timeout{10'000};
  std::uint32_t max_transport_attempts{3};
  std::chrono::milliseconds retry_backoff{200};
  // Rounds a scripthash may disagree with its own history before the
  // server is declared inconsistent.
  std::uint32_t max_status_attempts{3};
};

struct TxConfig {
  int ct_exponent{0};
  int ct_bits{52};
  // Satoshi per 1000 virtual bytes.
  std::uint64_t default_fee_rate{100};
};

struct LogConfig {
  util::LogLevel level{util::LogLevel::kInfo};
  std::string file;
  std::uintmax_t max_bytes{0};
  std::size_t max_files{0};
};

struct WalletConfig {
  NetworkParams network{ParamsFor(NetworkType::kLiquid)};
  // Passed through to the transport; the wallet never opens sockets itself.
  std::string electrum_url;
  bool tls{false};
  bool validate_domain{true};
  // Empty keeps the wallet in memory only.
  std::filesystem::path store_path;
  crypto::KdfParams kdf{};
  SyncConfig sync{};
  TxConfig tx{};
  LogConfig log{};

  const primitives::AssetId& PolicyAsset() const;
};

// Throws wallet::WalletError(kInvalidConfig) on any invalid field.
WalletConfig WalletConfigFromJson(const nlohmann::json& json);
WalletConfig LoadWalletConfig(const std::filesystem::path& path);
void ValidateWalletConfig(const WalletConfig& config);

// Applies the log section to the process logger.
void ApplyLogConfig(const LogConfig& log);

}  // namespace ctwallet::config
