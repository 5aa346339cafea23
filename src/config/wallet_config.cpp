#include "config/wallet_config.hpp"

#include <fstream>
#include <limits>
#include <stdexcept>

#include "util/hex.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::config {

namespace {

using wallet::ErrorCode;
using wallet::WalletError;

[[noreturn]] void Invalid(const std::string& message) {
  throw WalletError(ErrorCode::kInvalidConfig, "config: " + message);
}

template <typename T>
T Read(const nlohmann::json& object, const char* key, T fallback) {
  if (!object.contains(key)) {
    return fallback;
  }
  try {
    return object.at(key).get<T>();
  } catch (const nlohmann::json::exception&) {
    Invalid(std::string("field '") + key + "' has the wrong type");
  }
}

const nlohmann::json& Section(const nlohmann::json& root, const char* key) {
  static const nlohmann::json kEmpty = nlohmann::json::object();
  if (!root.contains(key)) {
    return kEmpty;
  }
  const auto& section = root.at(key);
  if (!section.is_object()) {
    Invalid(std::string("section '") + key + "' must be an object");
  }
  return section;
}

std::uint32_t ReadU32(const nlohmann::json& object, const char* key, std::uint32_t fallback) {
  const auto value = Read<std::int64_t>(object, key, fallback);
  if (value < 0 || value > std::numeric_limits<std::uint32_t>::max()) {
    Invalid(std::string("field '") + key + "' out of range");
  }
  return static_cast<std::uint32_t>(value);
}

}  // namespace

const primitives::AssetId& WalletConfig::PolicyAsset() const {
  if (!network.policy_asset) {
    throw WalletError(ErrorCode::kInvalidConfig, "config: policy asset not configured");
  }
  return *network.policy_asset;
}

WalletConfig WalletConfigFromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    Invalid("top-level value must be an object");
  }
  WalletConfig cfg;

  const auto network_name = Read<std::string>(json, "network", "liquid");
  const auto network = NetworkFromString(network_name);
  if (!network) {
    Invalid("unknown network '" + network_name + "'");
  }
  cfg.network = ParamsFor(*network);
  if (json.contains("policy_asset")) {
    const auto hex = Read<std::string>(json, "policy_asset", "");
    auto asset = util::ParseHash256Hex(hex);
    if (!asset) {
      Invalid("policy_asset must be 64 hex characters");
    }
    cfg.network.policy_asset = *asset;
  }

  cfg.electrum_url = Read<std::string>(json, "electrum_url", "");
  cfg.tls = Read<bool>(json, "tls", cfg.tls);
  cfg.validate_domain = Read<bool>(json, "validate_domain", cfg.validate_domain);
  cfg.store_path = Read<std::string>(json, "store_path", "");

  const auto& kdf = Section(json, "kdf");
  const auto algorithm_name = Read<std::string>(kdf, "algorithm", "argon2id");
  const auto algorithm = crypto::KdfAlgorithmFromString(algorithm_name);
  if (!algorithm) {
    Invalid("unknown kdf algorithm '" + algorithm_name + "'");
  }
  cfg.kdf.algorithm = *algorithm;
  cfg.kdf.argon2.t_cost = ReadU32(kdf, "t_cost", cfg.kdf.argon2.t_cost);
  cfg.kdf.argon2.m_cost_kib = ReadU32(kdf, "m_cost_kib", cfg.kdf.argon2.m_cost_kib);
  cfg.kdf.argon2.parallelism = ReadU32(kdf, "parallelism", cfg.kdf.argon2.parallelism);
  cfg.kdf.pbkdf2_iterations = ReadU32(kdf, "iterations", cfg.kdf.pbkdf2_iterations);

  const auto& sync = Section(json, "sync");
  cfg.sync.gap_limit = ReadU32(sync, "gap_limit", cfg.sync.gap_limit);
  cfg.sync.max_parallel_requests =
      ReadU32(sync, "max_parallel_requests", static_cast<std::uint32_t>(cfg.sync.max_parallel_requests));
  cfg.sync.request_timeout = std::chrono::milliseconds(
      ReadU32(sync, "request_timeout_ms", static_cast<std::uint32_t>(cfg.sync.request_timeout.count())));
  cfg.sync.max_transport_attempts =
      ReadU32(sync, "max_transport_attempts", cfg.sync.max_transport_attempts);
  cfg.sync.retry_backoff = std::chrono::milliseconds(
      ReadU32(sync, "retry_backoff_ms", static_cast<std::uint32_t>(cfg.sync.retry_backoff.count())));
  cfg.sync.max_status_attempts = ReadU32(sync, "max_status_attempts", cfg.sync.max_status_attempts);

  const auto& tx = Section(json, "tx");
  cfg.tx.ct_exponent = Read<int>(tx, "ct_exponent", cfg.tx.ct_exponent);
  cfg.tx.ct_bits = Read<int>(tx, "ct_bits", cfg.tx.ct_bits);
  cfg.tx.default_fee_rate = Read<std::uint64_t>(tx, "default_fee_rate", cfg.tx.default_fee_rate);

  const auto& log = Section(json, "log");
  try {
    cfg.log.level = util::ParseLogLevel(Read<std::string>(log, "level", "info"));
  } catch (const std::invalid_argument& ex) {
    Invalid(ex.what());
  }
  cfg.log.file = Read<std::string>(log, "file", "");
  cfg.log.max_bytes = Read<std::uint64_t>(log, "max_bytes", 0);
  cfg.log.max_files = ReadU32(log, "max_files", 0);

  ValidateWalletConfig(cfg);
  return cfg;
}

WalletConfig LoadWalletConfig(const std::filesystem::path& path) {
  std::ifstream in(path);
  if (!in) {
    Invalid("cannot open " + path.string());
  }
  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error& ex) {
    Invalid(std::string("parse error: ") + ex.what());
  }
  return WalletConfigFromJson(json);
}

void ValidateWalletConfig(const WalletConfig& config) {
  if (!config.network.policy_asset) {
    Invalid("policy_asset is required on " + config.network.name);
  }
  std::string error;
  if (!crypto::CheckKdfParams(config.kdf, &error)) {
    Invalid(error);
  }
  if (config.sync.gap_limit == 0) {
    Invalid("sync.gap_limit must be positive");
  }
  if (config.sync.max_parallel_requests == 0) {
    Invalid("sync.max_parallel_requests must be positive");
  }
  if (config.sync.request_timeout.count() <= 0) {
    Invalid("sync.request_timeout_ms must be positive");
  }
  if (config.sync.max_transport_attempts == 0 || config.sync.max_status_attempts == 0) {
    Invalid("sync attempt limits must be positive");
  }
  if (config.tx.ct_bits < 1 || config.tx.ct_bits > 64) {
    Invalid("tx.ct_bits must be within 1..64");
  }
  if (config.tx.ct_exponent < -1 || config.tx.ct_exponent > 18) {
    Invalid("tx.ct_exponent must be within -1..18");
  }
  if (config.tx.default_fee_rate == 0) {
    Invalid("tx.default_fee_rate must be positive");
  }
}

void ApplyLogConfig(const LogConfig& log) {
  auto& logger = util::GetLogger();
  logger.Configure(log.level, log.max_bytes, log.max_files);
  if (!log.file.empty()) {
    logger.EnableFile(log.file);
  }
}

}  // namespace ctwallet::config
