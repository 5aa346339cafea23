#include "consensus/sighash.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"

namespace ctwallet::consensus {

namespace {

using primitives::serialize::WriteConfidentialAsset;
using primitives::serialize::WriteConfidentialNonce;
using primitives::serialize::WriteConfidentialValue;
using primitives::serialize::WriteUint32;
using primitives::serialize::WriteVarBytes;

void AppendIssuance(std::vector<std::uint8_t>* buffer, const primitives::AssetIssuance& issuance) {
  buffer->insert(buffer->end(), issuance.blinding_nonce.begin(), issuance.blinding_nonce.end());
  buffer->insert(buffer->end(), issuance.entropy.begin(), issuance.entropy.end());
  WriteConfidentialValue(buffer, issuance.amount);
  WriteConfidentialValue(buffer, issuance.inflation_keys);
}

std::array<std::uint8_t, 32> HashPrevouts(const primitives::Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(tx.vin.size() * (32 + 4));
  for (const auto& input : tx.vin) {
    buffer.insert(buffer.end(), input.prevout.txid.begin(), input.prevout.txid.end());
    WriteUint32(&buffer, input.prevout.index);
  }
  return crypto::DoubleSha256(buffer);
}

std::array<std::uint8_t, 32> HashSequences(const primitives::Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  buffer.reserve(tx.vin.size() * 4);
  for (const auto& input : tx.vin) {
    WriteUint32(&buffer, input.sequence);
  }
  return crypto::DoubleSha256(buffer);
}

std::array<std::uint8_t, 32> HashIssuances(const primitives::Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  for (const auto& input : tx.vin) {
    if (input.HasIssuance()) {
      AppendIssuance(&buffer, input.issuance);
    } else {
      buffer.push_back(0x00);
    }
  }
  return crypto::DoubleSha256(buffer);
}

void AppendOutput(std::vector<std::uint8_t>* buffer, const primitives::TxOut& output) {
  WriteConfidentialAsset(buffer, output.asset);
  WriteConfidentialValue(buffer, output.value);
  WriteConfidentialNonce(buffer, output.nonce);
  WriteVarBytes(buffer, output.script_pubkey);
}

std::array<std::uint8_t, 32> HashOutputs(const primitives::Transaction& tx) {
  std::vector<std::uint8_t> buffer;
  for (const auto& output : tx.vout) {
    AppendOutput(&buffer, output);
  }
  return crypto::DoubleSha256(buffer);
}

std::array<std::uint8_t, 32> HashSingleOutput(const primitives::TxOut& output) {
  std::vector<std::uint8_t> buffer;
  AppendOutput(&buffer, output);
  return crypto::DoubleSha256(buffer);
}

}  // namespace

std::array<std::uint8_t, 32> ComputeSegwitV0Sighash(const primitives::Transaction& tx,
                                                    std::size_t input_index,
                                                    std::span<const std::uint8_t> script_code,
                                                    const primitives::ConfidentialValue& spent_value,
                                                    std::uint32_t hash_type) {
  if (input_index >= tx.vin.size()) {
    throw std::runtime_error("sighash input index out of range");
  }
  const std::uint32_t base_type = hash_type & ~kSighashAnyoneCanPay;
  if (base_type != kSighashAll && base_type != kSighashSingle) {
    throw std::runtime_error("unsupported sighash type " + std::to_string(hash_type));
  }
  if (spent_value.IsNull()) {
    throw std::runtime_error("sighash requires the spent output amount");
  }
  const bool anyone_can_pay = (hash_type & kSighashAnyoneCanPay) != 0;
  const std::array<std::uint8_t, 32> zero{};
  const auto hash_prevouts = anyone_can_pay ? zero : HashPrevouts(tx);
  const auto hash_sequences =
      anyone_can_pay || base_type == kSighashSingle ? zero : HashSequences(tx);
  const auto hash_issuances = anyone_can_pay ? zero : HashIssuances(tx);
  // SINGLE past the last output commits to no outputs at all.
  auto hash_outputs = zero;
  if (base_type == kSighashAll) {
    hash_outputs = HashOutputs(tx);
  } else if (input_index < tx.vout.size()) {
    hash_outputs = HashSingleOutput(tx.vout[input_index]);
  }

  std::vector<std::uint8_t> preimage;
  preimage.reserve(256);
  WriteUint32(&preimage, tx.version);
  preimage.insert(preimage.end(), hash_prevouts.begin(), hash_prevouts.end());
  preimage.insert(preimage.end(), hash_sequences.begin(), hash_sequences.end());
  preimage.insert(preimage.end(), hash_issuances.begin(), hash_issuances.end());

  const auto& input = tx.vin[input_index];
  preimage.insert(preimage.end(), input.prevout.txid.begin(), input.prevout.txid.end());
  WriteUint32(&preimage, input.prevout.index);
  WriteVarBytes(&preimage, script_code);
  WriteConfidentialValue(&preimage, spent_value);
  WriteUint32(&preimage, input.sequence);
  if (input.HasIssuance()) {
    AppendIssuance(&preimage, input.issuance);
  }
  preimage.insert(preimage.end(), hash_outputs.begin(), hash_outputs.end());
  WriteUint32(&preimage, tx.lock_time);
  WriteUint32(&preimage, hash_type);
  return crypto::DoubleSha256(preimage);
}

}  // namespace ctwallet::consensus
