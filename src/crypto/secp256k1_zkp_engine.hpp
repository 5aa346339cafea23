#pragma once

#include "crypto/confidential.hpp"

namespace ctwallet::crypto {

// ConfidentialEngine backed by libsecp256k1-zkp (generator, Pedersen,
// Borromean range proofs, surjection proofs).
class Secp256k1ZkpEngine final : public ConfidentialEngine {
 public:
  std::optional<primitives::ConfidentialAsset> CommitAsset(
      const AssetId& asset, const BlindingFactor& asset_blinder) const override;
  std::optional<primitives::ConfidentialValue> CommitValue(
      Amount value, const BlindingFactor& value_blinder,
      const primitives::ConfidentialAsset& asset_commitment) const override;
  bool BalanceFinalBlinder(std::span<const Amount> values,
                           std::span<const BlindingFactor> asset_blinders,
                           std::span<BlindingFactor> value_blinders,
                           std::size_t input_count) const override;
  std::optional<std::vector<std::uint8_t>> ProveRange(
      const RangeProofRequest& request) const override;
  std::optional<std::vector<std::uint8_t>> ProveSurjection(
      const SurjectionRequest& request) const override;
  std::optional<UnblindedOutput> Unblind(const primitives::TxOut& output,
                                         const SecretKey& blinding_key) const override;
  bool VerifyBalance(std::span<const CommittedAmount> inputs,
                     std::span<const CommittedAmount> outputs) const override;
  bool VerifyRangeProof(const primitives::TxOut& output) const override;
  bool VerifySurjectionProof(
      const primitives::TxOut& output,
      std::span<const primitives::ConfidentialAsset> input_assets) const override;
  std::optional<std::array<std::uint8_t, 32>> SharedNonce(
      const CompressedPublicKey& pubkey, const SecretKey& key) const override;
};

}  // namespace ctwallet::crypto
