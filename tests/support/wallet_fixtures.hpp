#pragma once

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>

#include "config/network.hpp"
#include "config/wallet_config.hpp"
#include "crypto/confidential.hpp"
#include "crypto/ec_key.hpp"
#include "crypto/kdf.hpp"
#include "primitives/transaction.hpp"
#include "util/csprng.hpp"
#include "wallet/address_book.hpp"

namespace ctwallet::test {

inline constexpr const char* kTestMnemonic =
    "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
    "about";
inline constexpr const char* kOtherMnemonic =
    "legal winner thank year wave sausage worth useful legal winner thank yellow";

inline primitives::AssetId TestPolicyAsset() {
  primitives::AssetId asset{};
  asset.fill(0x5a);
  return asset;
}

inline primitives::AssetId TestIssuedAsset() {
  primitives::AssetId asset{};
  asset.fill(0xc3);
  return asset;
}

// Regtest wallet with a cheap KDF and fast retries. An empty path keeps the
// store in memory.
inline config::WalletConfig RegtestConfig(const std::filesystem::path& store_path = {}) {
  config::WalletConfig cfg;
  cfg.network = config::ParamsFor(config::NetworkType::kElementsRegtest);
  cfg.network.policy_asset = TestPolicyAsset();
  cfg.store_path = store_path;
  cfg.kdf.algorithm = crypto::KdfAlgorithm::kPbkdf2Sha512;
  cfg.kdf.pbkdf2_iterations = 1000;
  cfg.sync.gap_limit = 5;
  cfg.sync.max_parallel_requests = 4;
  cfg.sync.retry_backoff = std::chrono::milliseconds(1);
  return cfg;
}

inline crypto::BlindingFactor RandomScalar() {
  crypto::BlindingFactor out{};
  do {
    util::FillSecureRandomBytesOrThrow(out);
  } while (!crypto::IsValidSecretKey(out));
  return out;
}

// A transaction from a foreign input paying `value` of `asset` to
// `address`. `salt` keeps txids distinct. Confidential outputs are blinded
// to the address's blinding key.
inline primitives::Transaction MakeFundingTx(const crypto::ConfidentialEngine& engine,
                                             const wallet::Address& address,
                                             const primitives::AssetId& asset,
                                             primitives::Amount value, std::uint8_t salt,
                                             bool confidential = true) {
  primitives::Transaction tx;
  primitives::TxIn in;
  in.prevout.txid.fill(salt);
  in.prevout.index = salt;
  in.script_sig = {0x51};
  tx.vin.push_back(in);

  primitives::TxOut out;
  out.script_pubkey = address.script_pubkey;
  if (confidential) {
    crypto::UnblindedOutput secrets;
    secrets.asset = asset;
    secrets.value = value;
    secrets.asset_blinder = RandomScalar();
    secrets.value_blinder = RandomScalar();
    const crypto::SurjectionInput source{asset, {},
                                         primitives::ConfidentialAsset::FromExplicit(asset)};
    std::string error;
    if (!crypto::BlindTxOut(engine, secrets, address.blinding_pubkey,
                            std::span<const crypto::SurjectionInput>(&source, 1), 0, 52, &out,
                            &error)) {
      throw std::runtime_error("funding: " + error);
    }
  } else {
    out.asset = primitives::ConfidentialAsset::FromExplicit(asset);
    out.value = primitives::ConfidentialValue::FromAmount(value);
  }
  tx.vout.push_back(std::move(out));

  primitives::TxOut fee;
  fee.asset = primitives::ConfidentialAsset::FromExplicit(TestPolicyAsset());
  fee.value = primitives::ConfidentialValue::FromAmount(250);
  tx.vout.push_back(std::move(fee));
  return tx;
}

}  // namespace ctwallet::test
