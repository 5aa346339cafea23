#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "crypto/ec_key.hpp"
#include "primitives/transaction.hpp"

namespace ctwallet::crypto {

using primitives::Amount;
using primitives::AssetId;
using primitives::BlindingFactor;

// Secrets recovered from (or used to build) one confidential output.
// Explicit outputs carry zero blinders.
struct UnblindedOutput {
  AssetId asset{};
  Amount value{0};
  BlindingFactor asset_blinder{};
  BlindingFactor value_blinder{};

  bool operator==(const UnblindedOutput&) const = default;
};

struct RangeProofRequest {
  Amount value{0};
  primitives::ConfidentialValue value_commitment{};
  primitives::ConfidentialAsset asset_commitment{};
  BlindingFactor value_blinder{};
  std::array<std::uint8_t, 32> nonce{};
  // asset || asset blinder, recoverable by whoever can rebuild `nonce`.
  std::array<std::uint8_t, 64> message{};
  std::vector<std::uint8_t> extra_commit{};
  std::uint64_t min_value{1};
  int exponent{0};
  int bits{52};
};

struct SurjectionInput {
  AssetId asset{};
  BlindingFactor asset_blinder{};
  primitives::ConfidentialAsset commitment{};
};

struct SurjectionRequest {
  AssetId output_asset{};
  BlindingFactor output_asset_blinder{};
  primitives::ConfidentialAsset output_commitment{};
  std::vector<SurjectionInput> inputs{};
};

// Asset/value commitment pair as it appears on an input or output.
struct CommittedAmount {
  primitives::ConfidentialAsset asset{};
  primitives::ConfidentialValue value{};
};

// Opaque capability over the commitment and proof primitives. The wallet
// logic only ever talks to this interface.
class ConfidentialEngine {
 public:
  virtual ~ConfidentialEngine() = default;

  virtual std::optional<primitives::ConfidentialAsset> CommitAsset(
      const AssetId& asset, const BlindingFactor& asset_blinder) const = 0;
  virtual std::optional<primitives::ConfidentialValue> CommitValue(
      Amount value, const BlindingFactor& value_blinder,
      const primitives::ConfidentialAsset& asset_commitment) const = 0;

  // Entries are inputs first, then outputs. Overwrites the last value
  // blinder so the commitments balance. Fails if the result is degenerate.
  virtual bool BalanceFinalBlinder(std::span<const Amount> values,
                                   std::span<const BlindingFactor> asset_blinders,
                                   std::span<BlindingFactor> value_blinders,
                                   std::size_t input_count) const = 0;

  virtual std::optional<std::vector<std::uint8_t>> ProveRange(
      const RangeProofRequest& request) const = 0;
  virtual std::optional<std::vector<std::uint8_t>> ProveSurjection(
      const SurjectionRequest& request) const = 0;

  // Rewinds the range proof with `blinding_key` and checks that the
  // recovered secrets reproduce both commitments.
  virtual std::optional<UnblindedOutput> Unblind(const primitives::TxOut& output,
                                                 const SecretKey& blinding_key) const = 0;

  virtual bool VerifyBalance(std::span<const CommittedAmount> inputs,
                             std::span<const CommittedAmount> outputs) const = 0;
  virtual bool VerifyRangeProof(const primitives::TxOut& output) const = 0;
  virtual bool VerifySurjectionProof(
      const primitives::TxOut& output,
      std::span<const primitives::ConfidentialAsset> input_assets) const = 0;

  // SHA-256 of the ECDH secret, itself hashed once more as Elements does.
  virtual std::optional<std::array<std::uint8_t, 32>> SharedNonce(
      const CompressedPublicKey& pubkey, const SecretKey& key) const = 0;
};

// Blinds an output whose script is already set: commits asset and value,
// attaches a fresh ephemeral nonce key and both proofs.
bool BlindTxOut(const ConfidentialEngine& engine, const UnblindedOutput& secrets,
                const CompressedPublicKey& blinding_pubkey,
                std::span<const SurjectionInput> inputs, int exponent, int bits,
                primitives::TxOut* output, std::string* error = nullptr);

// Recovers secrets for explicit outputs directly and for confidential ones
// via `Unblind`.
std::optional<UnblindedOutput> UnblindTxOut(const ConfidentialEngine& engine,
                                            const primitives::TxOut& output,
                                            const SecretKey& blinding_key);

}  // namespace ctwallet::crypto
