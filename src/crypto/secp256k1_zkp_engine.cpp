#include "crypto/secp256k1_zkp_engine.hpp"

#include <algorithm>
#include <cstring>

#include <secp256k1_ecdh.h>
#include <secp256k1_generator.h>
#include <secp256k1_rangeproof.h>
#include <secp256k1_surjectionproof.h>

#include "crypto/hash.hpp"
#include "util/csprng.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

constexpr std::size_t kMaxRangeProofSize = 5134;
constexpr std::size_t kMaxSurjectionInputs = 3;
constexpr std::size_t kSurjectionIterations = 100;

bool ToGenerator(const primitives::ConfidentialAsset& asset, secp256k1_generator* gen) {
  const auto* ctx = Secp256k1Context();
  if (asset.IsExplicit()) {
    return secp256k1_generator_generate(ctx, gen, asset.bytes.data() + 1) == 1;
  }
  if (asset.IsCommitment()) {
    return secp256k1_generator_parse(ctx, gen, asset.bytes.data()) == 1;
  }
  return false;
}

bool ToCommitment(const primitives::ConfidentialValue& value, const secp256k1_generator& gen,
                  secp256k1_pedersen_commitment* commit) {
  const auto* ctx = Secp256k1Context();
  if (value.IsExplicit()) {
    static const BlindingFactor kZero{};
    return secp256k1_pedersen_commit(ctx, commit, kZero.data(), *value.Explicit(), &gen) == 1;
  }
  if (value.IsCommitment()) {
    return secp256k1_pedersen_commitment_parse(ctx, commit, value.bytes.data()) == 1;
  }
  return false;
}

bool ToCommitment(const CommittedAmount& amount, secp256k1_pedersen_commitment* commit) {
  secp256k1_generator gen;
  return ToGenerator(amount.asset, &gen) && ToCommitment(amount.value, gen, commit);
}

}  // namespace

std::optional<primitives::ConfidentialAsset> Secp256k1ZkpEngine::CommitAsset(
    const AssetId& asset, const BlindingFactor& asset_blinder) const {
  const auto* ctx = Secp256k1Context();
  secp256k1_generator gen;
  if (!secp256k1_generator_generate_blinded(ctx, &gen, asset.data(), asset_blinder.data())) {
    return std::nullopt;
  }
  primitives::ConfidentialAsset out;
  out.bytes.resize(33);
  secp256k1_generator_serialize(ctx, out.bytes.data(), &gen);
  return out;
}

std::optional<primitives::ConfidentialValue> Secp256k1ZkpEngine::CommitValue(
    Amount value, const BlindingFactor& value_blinder,
    const primitives::ConfidentialAsset& asset_commitment) const {
  const auto* ctx = Secp256k1Context();
  secp256k1_generator gen;
  secp256k1_pedersen_commitment commit;
  if (!ToGenerator(asset_commitment, &gen) ||
      !secp256k1_pedersen_commit(ctx, &commit, value_blinder.data(), value, &gen)) {
    return std::nullopt;
  }
  primitives::ConfidentialValue out;
  out.bytes.resize(33);
  secp256k1_pedersen_commitment_serialize(ctx, out.bytes.data(), &commit);
  return out;
}

bool Secp256k1ZkpEngine::BalanceFinalBlinder(std::span<const Amount> values,
                                             std::span<const BlindingFactor> asset_blinders,
                                             std::span<BlindingFactor> value_blinders,
                                             std::size_t input_count) const {
  const std::size_t total = values.size();
  if (total == 0 || asset_blinders.size() != total || value_blinders.size() != total ||
      input_count >= total) {
    return false;
  }
  std::vector<const unsigned char*> abf_ptrs(total);
  std::vector<unsigned char*> vbf_ptrs(total);
  for (std::size_t i = 0; i < total; ++i) {
    abf_ptrs[i] = asset_blinders[i].data();
    vbf_ptrs[i] = value_blinders[i].data();
  }
  if (!secp256k1_pedersen_blind_generator_blind_sum(Secp256k1Context(), values.data(),
                                                    abf_ptrs.data(), vbf_ptrs.data(), total,
                                                    input_count)) {
    return false;
  }
  // A zero final blinder cannot be used to commit.
  return IsValidSecretKey(value_blinders.back());
}

std::optional<std::vector<std::uint8_t>> Secp256k1ZkpEngine::ProveRange(
    const RangeProofRequest& request) const {
  const auto* ctx = Secp256k1Context();
  secp256k1_generator gen;
  secp256k1_pedersen_commitment commit;
  if (!ToGenerator(request.asset_commitment, &gen) ||
      !ToCommitment(request.value_commitment, gen, &commit)) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> proof(kMaxRangeProofSize);
  std::size_t proof_len = proof.size();
  if (!secp256k1_rangeproof_sign(ctx, proof.data(), &proof_len, request.min_value, &commit,
                                 request.value_blinder.data(), request.nonce.data(),
                                 request.exponent, request.bits, request.value,
                                 request.message.data(), request.message.size(),
                                 request.extra_commit.data(), request.extra_commit.size(),
                                 &gen)) {
    return std::nullopt;
  }
  proof.resize(proof_len);
  return proof;
}

std::optional<std::vector<std::uint8_t>> Secp256k1ZkpEngine::ProveSurjection(
    const SurjectionRequest& request) const {
  const auto* ctx = Secp256k1Context();
  const std::size_t n = request.inputs.size();
  if (n == 0) {
    return std::nullopt;
  }
  std::vector<secp256k1_fixed_asset_tag> fixed_tags(n);
  std::vector<secp256k1_generator> ephemeral_tags(n);
  for (std::size_t i = 0; i < n; ++i) {
    const auto& input = request.inputs[i];
    std::memcpy(fixed_tags[i].data, input.asset.data(), 32);
    if (!ToGenerator(input.commitment, &ephemeral_tags[i])) {
      return std::nullopt;
    }
  }
  secp256k1_fixed_asset_tag output_tag;
  std::memcpy(output_tag.data, request.output_asset.data(), 32);
  secp256k1_generator output_generator;
  if (!ToGenerator(request.output_commitment, &output_generator)) {
    return std::nullopt;
  }

  auto seed = util::SecureRandomArray<32>();
  secp256k1_surjectionproof proof;
  std::size_t input_index = 0;
  const std::size_t iterations = secp256k1_surjectionproof_initialize(
      ctx, &proof, &input_index, fixed_tags.data(), n, std::min(kMaxSurjectionInputs, n),
      &output_tag, kSurjectionIterations, seed.data());
  if (iterations == 0) {
    return std::nullopt;
  }
  if (!secp256k1_surjectionproof_generate(ctx, &proof, ephemeral_tags.data(), n, &output_generator,
                                          input_index,
                                          request.inputs[input_index].asset_blinder.data(),
                                          request.output_asset_blinder.data())) {
    return std::nullopt;
  }
  if (!secp256k1_surjectionproof_verify(ctx, &proof, ephemeral_tags.data(), n, &output_generator)) {
    return std::nullopt;
  }
  std::vector<std::uint8_t> out(secp256k1_surjectionproof_serialized_size(ctx, &proof));
  std::size_t out_len = out.size();
  if (!secp256k1_surjectionproof_serialize(ctx, out.data(), &out_len, &proof)) {
    return std::nullopt;
  }
  out.resize(out_len);
  return out;
}

std::optional<UnblindedOutput> Secp256k1ZkpEngine::Unblind(const primitives::TxOut& output,
                                                           const SecretKey& blinding_key) const {
  const auto* ctx = Secp256k1Context();
  if (!output.nonce.IsPublicKey() || output.witness.range_proof.empty()) {
    return std::nullopt;
  }
  CompressedPublicKey ephemeral{};
  std::copy(output.nonce.bytes.begin(), output.nonce.bytes.end(), ephemeral.begin());
  auto nonce = SharedNonce(ephemeral, blinding_key);
  if (!nonce) {
    return std::nullopt;
  }

  secp256k1_generator gen;
  secp256k1_pedersen_commitment commit;
  if (!ToGenerator(output.asset, &gen) || !ToCommitment(output.value, gen, &commit)) {
    return std::nullopt;
  }

  UnblindedOutput secrets;
  std::array<std::uint8_t, 4096> message{};
  std::size_t message_len = message.size();
  std::uint64_t min_value = 0;
  std::uint64_t max_value = 0;
  const int ok = secp256k1_rangeproof_rewind(
      ctx, secrets.value_blinder.data(), &secrets.value, message.data(), &message_len,
      nonce->data(), &min_value, &max_value, &commit, output.witness.range_proof.data(),
      output.witness.range_proof.size(), output.script_pubkey.data(), output.script_pubkey.size(),
      &gen);
  util::SecureWipe(*nonce);
  if (!ok || message_len < 64) {
    return std::nullopt;
  }
  std::copy(message.begin(), message.begin() + 32, secrets.asset.begin());
  std::copy(message.begin() + 32, message.begin() + 64, secrets.asset_blinder.begin());
  util::SecureWipe(message);

  // The recovered secrets must reproduce what is on chain.
  const auto asset_commitment = output.asset.IsExplicit()
                                    ? std::optional<primitives::ConfidentialAsset>(output.asset)
                                    : CommitAsset(secrets.asset, secrets.asset_blinder);
  if (!asset_commitment || *asset_commitment != output.asset) {
    return std::nullopt;
  }
  if (output.asset.IsExplicit() && *output.asset.Explicit() != secrets.asset) {
    return std::nullopt;
  }
  const auto value_commitment = CommitValue(secrets.value, secrets.value_blinder, output.asset);
  if (!value_commitment || *value_commitment != output.value) {
    return std::nullopt;
  }
  return secrets;
}

bool Secp256k1ZkpEngine::VerifyBalance(std::span<const CommittedAmount> inputs,
                                       std::span<const CommittedAmount> outputs) const {
  std::vector<secp256k1_pedersen_commitment> in_commits(inputs.size());
  std::vector<secp256k1_pedersen_commitment> out_commits;
  out_commits.reserve(outputs.size());
  for (std::size_t i = 0; i < inputs.size(); ++i) {
    if (!ToCommitment(inputs[i], &in_commits[i])) {
      return false;
    }
  }
  for (const auto& output : outputs) {
    // Explicit zero-value outputs contribute nothing.
    if (output.value.IsExplicit() && *output.value.Explicit() == 0) {
      continue;
    }
    secp256k1_pedersen_commitment commit;
    if (!ToCommitment(output, &commit)) {
      return false;
    }
    out_commits.push_back(commit);
  }
  std::vector<const secp256k1_pedersen_commitment*> in_ptrs;
  std::vector<const secp256k1_pedersen_commitment*> out_ptrs;
  for (const auto& c : in_commits) in_ptrs.push_back(&c);
  for (const auto& c : out_commits) out_ptrs.push_back(&c);
  return secp256k1_pedersen_verify_tally(Secp256k1Context(), in_ptrs.data(), in_ptrs.size(),
                                         out_ptrs.data(), out_ptrs.size()) == 1;
}

bool Secp256k1ZkpEngine::VerifyRangeProof(const primitives::TxOut& output) const {
  secp256k1_generator gen;
  secp256k1_pedersen_commitment commit;
  if (!output.value.IsCommitment() || !ToGenerator(output.asset, &gen) ||
      !ToCommitment(output.value, gen, &commit)) {
    return false;
  }
  std::uint64_t min_value = 0;
  std::uint64_t max_value = 0;
  return secp256k1_rangeproof_verify(Secp256k1Context(), &min_value, &max_value, &commit,
                                     output.witness.range_proof.data(),
                                     output.witness.range_proof.size(),
                                     output.script_pubkey.data(), output.script_pubkey.size(),
                                     &gen) == 1;
}

bool Secp256k1ZkpEngine::VerifySurjectionProof(
    const primitives::TxOut& output,
    std::span<const primitives::ConfidentialAsset> input_assets) const {
  const auto* ctx = Secp256k1Context();
  if (input_assets.empty() || output.witness.surjection_proof.empty()) {
    return false;
  }
  std::vector<secp256k1_generator> input_tags(input_assets.size());
  for (std::size_t i = 0; i < input_assets.size(); ++i) {
    if (!ToGenerator(input_assets[i], &input_tags[i])) {
      return false;
    }
  }
  secp256k1_generator output_tag;
  if (!ToGenerator(output.asset, &output_tag)) {
    return false;
  }
  secp256k1_surjectionproof proof;
  if (!secp256k1_surjectionproof_parse(ctx, &proof, output.witness.surjection_proof.data(),
                                       output.witness.surjection_proof.size())) {
    return false;
  }
  return secp256k1_surjectionproof_verify(ctx, &proof, input_tags.data(), input_tags.size(),
                                          &output_tag) == 1;
}

std::optional<std::array<std::uint8_t, 32>> Secp256k1ZkpEngine::SharedNonce(
    const CompressedPublicKey& pubkey, const SecretKey& key) const {
  secp256k1_pubkey parsed;
  if (!ParsePublicKey(pubkey, &parsed)) {
    return std::nullopt;
  }
  std::array<std::uint8_t, 32> shared{};
  if (!secp256k1_ecdh(Secp256k1Context(), shared.data(), &parsed, key.data(), nullptr, nullptr)) {
    return std::nullopt;
  }
  auto nonce = Sha256(shared);
  util::SecureWipe(shared);
  return nonce;
}

}  // namespace ctwallet::crypto
