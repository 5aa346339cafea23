#include "crypto/confidential.hpp"

#include <algorithm>

#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

bool Fail(std::string* error, const char* message) {
  if (error) *error = message;
  return false;
}

}  // namespace

bool BlindTxOut(const ConfidentialEngine& engine, const UnblindedOutput& secrets,
                const CompressedPublicKey& blinding_pubkey,
                std::span<const SurjectionInput> inputs, int exponent, int bits,
                primitives::TxOut* output, std::string* error) {
  if (inputs.empty()) {
    return Fail(error, "no surjection inputs");
  }
  auto asset_commitment = engine.CommitAsset(secrets.asset, secrets.asset_blinder);
  if (!asset_commitment) {
    return Fail(error, "asset commitment failed");
  }
  auto value_commitment = engine.CommitValue(secrets.value, secrets.value_blinder, *asset_commitment);
  if (!value_commitment) {
    return Fail(error, "value commitment failed");
  }

  SecretKey ephemeral{};
  do {
    util::FillSecureRandomBytesOrThrow(ephemeral);
  } while (!IsValidSecretKey(ephemeral));
  const auto ephemeral_pub = PublicKeyFromSecret(ephemeral);
  auto nonce = engine.SharedNonce(blinding_pubkey, ephemeral);
  util::SecureWipe(ephemeral);
  if (!ephemeral_pub || !nonce) {
    return Fail(error, "ecdh with blinding key failed");
  }

  RangeProofRequest range;
  range.value = secrets.value;
  range.value_commitment = *value_commitment;
  range.asset_commitment = *asset_commitment;
  range.value_blinder = secrets.value_blinder;
  range.nonce = *nonce;
  std::copy(secrets.asset.begin(), secrets.asset.end(), range.message.begin());
  std::copy(secrets.asset_blinder.begin(), secrets.asset_blinder.end(), range.message.begin() + 32);
  range.extra_commit = output->script_pubkey;
  range.exponent = exponent;
  range.bits = bits;
  auto range_proof = engine.ProveRange(range);
  util::SecureWipe(*nonce);
  if (!range_proof) {
    return Fail(error, "range proof generation failed");
  }

  SurjectionRequest surjection;
  surjection.output_asset = secrets.asset;
  surjection.output_asset_blinder = secrets.asset_blinder;
  surjection.output_commitment = *asset_commitment;
  surjection.inputs.assign(inputs.begin(), inputs.end());
  auto surjection_proof = engine.ProveSurjection(surjection);
  if (!surjection_proof) {
    return Fail(error, "surjection proof generation failed");
  }

  output->asset = std::move(*asset_commitment);
  output->value = std::move(*value_commitment);
  output->nonce.bytes.assign(ephemeral_pub->begin(), ephemeral_pub->end());
  output->witness.range_proof = std::move(*range_proof);
  output->witness.surjection_proof = std::move(*surjection_proof);
  return true;
}

std::optional<UnblindedOutput> UnblindTxOut(const ConfidentialEngine& engine,
                                            const primitives::TxOut& output,
                                            const SecretKey& blinding_key) {
  if (output.asset.IsExplicit() && output.value.IsExplicit()) {
    UnblindedOutput secrets;
    secrets.asset = *output.asset.Explicit();
    secrets.value = *output.value.Explicit();
    return secrets;
  }
  if (!output.value.IsCommitment() || !output.nonce.IsPublicKey() ||
      output.witness.range_proof.empty()) {
    return std::nullopt;
  }
  return engine.Unblind(output, blinding_key);
}

}  // namespace ctwallet::crypto
