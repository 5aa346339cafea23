#include "primitives/serialize.hpp"

#include <algorithm>
#include <limits>

namespace ctwallet::primitives::serialize {

namespace {

constexpr std::uint32_t kOutpointIssuanceFlag = 0x80000000u;
constexpr std::uint32_t kOutpointPeginFlag = 0x40000000u;
constexpr std::uint32_t kOutpointIndexMask = 0x3fffffffu;
constexpr std::uint64_t kMinInputBytes = 32 + 4 + 1 + 4;
constexpr std::uint64_t kMinOutputBytes = 1 + 1 + 1 + 1;
constexpr std::uint64_t kMaxWitnessItems = 1024;

bool Require(const std::vector<std::uint8_t>& data, std::size_t offset, std::size_t needed) {
  return offset <= data.size() && needed <= data.size() - offset;
}

bool Fail(std::string* error, const char* message) {
  if (error) *error = message;
  return false;
}

void WriteCommitment(std::vector<std::uint8_t>* out, const std::vector<std::uint8_t>& bytes) {
  if (bytes.empty()) {
    out->push_back(0x00);
  } else {
    out->insert(out->end(), bytes.begin(), bytes.end());
  }
}

// Reads one confidential field. `explicit_size` is the total explicit
// encoding length including the prefix byte.
bool ReadCommitment(const std::vector<std::uint8_t>& data, std::size_t* offset,
                    std::size_t explicit_size, std::uint8_t prefix_a, std::uint8_t prefix_b,
                    std::vector<std::uint8_t>* bytes) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[*offset];
  std::size_t size = 0;
  if (prefix == 0x00) {
    bytes->clear();
    ++*offset;
    return true;
  }
  if (prefix == 0x01 || prefix == 0xff) {
    size = explicit_size;
  } else if (prefix == prefix_a || prefix == prefix_b) {
    size = 33;
  } else {
    return false;
  }
  if (!Require(data, *offset, size)) return false;
  bytes->assign(data.begin() + *offset, data.begin() + *offset + size);
  *offset += size;
  return true;
}

void WriteStack(std::vector<std::uint8_t>* out, const WitnessStack& stack) {
  WriteVarInt(out, stack.size());
  for (const auto& item : stack) {
    WriteVarBytes(out, item);
  }
}

bool ReadStack(const std::vector<std::uint8_t>& data, std::size_t* offset, WitnessStack* stack) {
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count) || count > kMaxWitnessItems) return false;
  stack->resize(static_cast<std::size_t>(count));
  for (auto& item : *stack) {
    if (!ReadVarBytes(data, offset, &item)) return false;
  }
  return true;
}

void SerializeInputs(const Transaction& tx, std::vector<std::uint8_t>* out) {
  WriteVarInt(out, tx.vin.size());
  for (const auto& in : tx.vin) {
    out->insert(out->end(), in.prevout.txid.begin(), in.prevout.txid.end());
    std::uint32_t index = in.prevout.index;
    if (!in.prevout.IsNull()) {
      if (in.HasIssuance()) index |= kOutpointIssuanceFlag;
      if (in.is_pegin) index |= kOutpointPeginFlag;
    }
    WriteUint32(out, index);
    WriteVarBytes(out, in.script_sig);
    WriteUint32(out, in.sequence);
    if (in.HasIssuance()) {
      out->insert(out->end(), in.issuance.blinding_nonce.begin(), in.issuance.blinding_nonce.end());
      out->insert(out->end(), in.issuance.entropy.begin(), in.issuance.entropy.end());
      WriteConfidentialValue(out, in.issuance.amount);
      WriteConfidentialValue(out, in.issuance.inflation_keys);
    }
  }
}

void SerializeOutputs(const Transaction& tx, std::vector<std::uint8_t>* out) {
  WriteVarInt(out, tx.vout.size());
  for (const auto& txout : tx.vout) {
    WriteConfidentialAsset(out, txout.asset);
    WriteConfidentialValue(out, txout.value);
    WriteConfidentialNonce(out, txout.nonce);
    WriteVarBytes(out, txout.script_pubkey);
  }
}

void SerializeWitness(const Transaction& tx, std::vector<std::uint8_t>* out) {
  for (const auto& in : tx.vin) {
    WriteVarBytes(out, in.witness.issuance_amount_rangeproof);
    WriteVarBytes(out, in.witness.inflation_keys_rangeproof);
    WriteStack(out, in.witness.script_witness);
    WriteStack(out, in.witness.pegin_witness);
  }
  for (const auto& txout : tx.vout) {
    WriteVarBytes(out, txout.witness.surjection_proof);
    WriteVarBytes(out, txout.witness.range_proof);
  }
}

bool DeserializeInputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                       Transaction* tx) {
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count)) return false;
  if (count > (data.size() - *offset) / kMinInputBytes) return false;
  tx->vin.resize(static_cast<std::size_t>(count));
  for (auto& in : tx->vin) {
    if (!Require(data, *offset, in.prevout.txid.size())) return false;
    std::copy_n(data.begin() + *offset, in.prevout.txid.size(), in.prevout.txid.begin());
    *offset += in.prevout.txid.size();
    std::uint32_t index = 0;
    if (!ReadUint32(data, offset, &index)) return false;
    bool has_issuance = false;
    if (index != std::numeric_limits<std::uint32_t>::max()) {
      has_issuance = (index & kOutpointIssuanceFlag) != 0;
      in.is_pegin = (index & kOutpointPeginFlag) != 0;
      index &= kOutpointIndexMask;
    }
    in.prevout.index = index;
    if (!ReadVarBytes(data, offset, &in.script_sig)) return false;
    if (!ReadUint32(data, offset, &in.sequence)) return false;
    if (has_issuance) {
      auto& issuance = in.issuance;
      if (!Require(data, *offset, 64)) return false;
      std::copy_n(data.begin() + *offset, 32, issuance.blinding_nonce.begin());
      std::copy_n(data.begin() + *offset + 32, 32, issuance.entropy.begin());
      *offset += 64;
      if (!ReadCommitment(data, offset, 9, ConfidentialValue::kCommitmentPrefixA,
                          ConfidentialValue::kCommitmentPrefixB, &issuance.amount.bytes) ||
          !ReadCommitment(data, offset, 9, ConfidentialValue::kCommitmentPrefixA,
                          ConfidentialValue::kCommitmentPrefixB,
                          &issuance.inflation_keys.bytes)) {
        return false;
      }
      if (issuance.IsNull()) return false;
    }
  }
  return true;
}

bool DeserializeOutputs(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        Transaction* tx) {
  std::uint64_t count = 0;
  if (!ReadVarInt(data, offset, &count)) return false;
  if (count > (data.size() - *offset) / kMinOutputBytes) return false;
  tx->vout.resize(static_cast<std::size_t>(count));
  for (auto& txout : tx->vout) {
    if (!ReadCommitment(data, offset, 33, ConfidentialAsset::kCommitmentPrefixA,
                        ConfidentialAsset::kCommitmentPrefixB, &txout.asset.bytes) ||
        !ReadCommitment(data, offset, 9, ConfidentialValue::kCommitmentPrefixA,
                        ConfidentialValue::kCommitmentPrefixB, &txout.value.bytes) ||
        !ReadCommitment(data, offset, 33, 0x02, 0x03, &txout.nonce.bytes) ||
        !ReadVarBytes(data, offset, &txout.script_pubkey)) {
      return false;
    }
  }
  return true;
}

bool DeserializeWitness(const std::vector<std::uint8_t>& data, std::size_t* offset,
                        Transaction* tx) {
  for (auto& in : tx->vin) {
    if (!ReadVarBytes(data, offset, &in.witness.issuance_amount_rangeproof) ||
        !ReadVarBytes(data, offset, &in.witness.inflation_keys_rangeproof) ||
        !ReadStack(data, offset, &in.witness.script_witness) ||
        !ReadStack(data, offset, &in.witness.pegin_witness)) {
      return false;
    }
  }
  for (auto& txout : tx->vout) {
    if (!ReadVarBytes(data, offset, &txout.witness.surjection_proof) ||
        !ReadVarBytes(data, offset, &txout.witness.range_proof)) {
      return false;
    }
  }
  return true;
}

}  // namespace

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value) {
  for (int i = 0; i < 4; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value) {
  for (int i = 0; i < 8; ++i) {
    out->push_back(static_cast<std::uint8_t>((value >> (i * 8)) & 0xFF));
  }
}

void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value) {
  if (value < 0xFD) {
    out->push_back(static_cast<std::uint8_t>(value));
  } else if (value <= 0xFFFF) {
    out->push_back(0xFD);
    out->push_back(static_cast<std::uint8_t>(value & 0xFFu));
    out->push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
  } else if (value <= 0xFFFFFFFF) {
    out->push_back(0xFE);
    WriteUint32(out, static_cast<std::uint32_t>(value));
  } else {
    out->push_back(0xFF);
    WriteUint64(out, value);
  }
}

void WriteVarBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes) {
  WriteVarInt(out, bytes.size());
  out->insert(out->end(), bytes.begin(), bytes.end());
}

bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint32_t* value) {
  if (!Require(data, *offset, 4)) return false;
  *value = static_cast<std::uint32_t>(data[*offset]) |
           (static_cast<std::uint32_t>(data[*offset + 1]) << 8) |
           (static_cast<std::uint32_t>(data[*offset + 2]) << 16) |
           (static_cast<std::uint32_t>(data[*offset + 3]) << 24);
  *offset += 4;
  return true;
}

bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 8)) return false;
  std::uint64_t result = 0;
  for (int i = 0; i < 8; ++i) {
    result |= static_cast<std::uint64_t>(data[*offset + i]) << (8 * i);
  }
  *value = result;
  *offset += 8;
  return true;
}

bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset, std::uint64_t* value) {
  if (!Require(data, *offset, 1)) return false;
  const std::uint8_t prefix = data[(*offset)++];
  if (prefix < 0xFD) {
    *value = prefix;
    return true;
  }
  if (prefix == 0xFD) {
    if (!Require(data, *offset, 2)) return false;
    const std::uint64_t v16 = static_cast<std::uint64_t>(data[*offset]) |
                              (static_cast<std::uint64_t>(data[*offset + 1]) << 8);
    *offset += 2;
    if (v16 < 0xFD) return false;
    *value = v16;
    return true;
  }
  if (prefix == 0xFE) {
    std::uint32_t tmp = 0;
    if (!ReadUint32(data, offset, &tmp) || tmp <= 0xFFFFu) return false;
    *value = tmp;
    return true;
  }
  std::uint64_t tmp = 0;
  if (!ReadUint64(data, offset, &tmp) || tmp <= 0xFFFFFFFFULL) return false;
  *value = tmp;
  return true;
}

bool ReadVarBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
                  std::vector<std::uint8_t>* bytes) {
  std::uint64_t size = 0;
  if (!ReadVarInt(data, offset, &size) ||
      size > static_cast<std::uint64_t>(std::numeric_limits<std::size_t>::max()) ||
      !Require(data, *offset, static_cast<std::size_t>(size))) {
    return false;
  }
  const auto len = static_cast<std::size_t>(size);
  bytes->assign(data.begin() + *offset, data.begin() + *offset + len);
  *offset += len;
  return true;
}

void WriteConfidentialAsset(std::vector<std::uint8_t>* out, const ConfidentialAsset& asset) {
  WriteCommitment(out, asset.bytes);
}

void WriteConfidentialValue(std::vector<std::uint8_t>* out, const ConfidentialValue& value) {
  WriteCommitment(out, value.bytes);
}

void WriteConfidentialNonce(std::vector<std::uint8_t>* out, const ConfidentialNonce& nonce) {
  WriteCommitment(out, nonce.bytes);
}

void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness) {
  const bool has_witness = include_witness && tx.HasWitness();
  WriteUint32(out, tx.version);
  out->push_back(has_witness ? 0x01 : 0x00);
  SerializeInputs(tx, out);
  SerializeOutputs(tx, out);
  WriteUint32(out, tx.lock_time);
  if (has_witness) {
    SerializeWitness(tx, out);
  }
}

bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            Transaction* tx, std::string* error) {
  std::size_t cursor = *offset;
  Transaction candidate;
  if (!ReadUint32(data, &cursor, &candidate.version)) {
    return Fail(error, "truncated version");
  }
  if (!Require(data, cursor, 1)) {
    return Fail(error, "truncated flags");
  }
  const std::uint8_t flags = data[cursor++];
  if (flags > 0x01) {
    return Fail(error, "unknown transaction flags");
  }
  if (!DeserializeInputs(data, &cursor, &candidate)) {
    return Fail(error, "malformed inputs");
  }
  if (!DeserializeOutputs(data, &cursor, &candidate)) {
    return Fail(error, "malformed outputs");
  }
  if (!ReadUint32(data, &cursor, &candidate.lock_time)) {
    return Fail(error, "truncated lock time");
  }
  if (flags == 0x01) {
    if (!DeserializeWitness(data, &cursor, &candidate)) {
      return Fail(error, "malformed witness");
    }
    if (!candidate.HasWitness()) {
      return Fail(error, "witness flag set with empty witness");
    }
  }
  *tx = std::move(candidate);
  *offset = cursor;
  return true;
}

TxSerializeSizes MeasureTransactionSizes(const Transaction& tx) {
  std::vector<std::uint8_t> base;
  SerializeTransaction(tx, &base, /*include_witness=*/false);
  std::vector<std::uint8_t> full;
  SerializeTransaction(tx, &full, /*include_witness=*/true);
  TxSerializeSizes sizes;
  sizes.base_size = base.size();
  sizes.total_size = full.size();
  sizes.witness_size = full.size() - base.size();
  return sizes;
}

}  // namespace ctwallet::primitives::serialize
