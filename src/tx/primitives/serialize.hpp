#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

#include "primitives/transaction.hpp"

namespace ctwallet::primitives::serialize {

void WriteUint32(std::vector<std::uint8_t>* out, std::uint32_t value);
void WriteUint64(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarInt(std::vector<std::uint8_t>* out, std::uint64_t value);
void WriteVarBytes(std::vector<std::uint8_t>* out, std::span<const std::uint8_t> bytes);
bool ReadUint32(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint32_t* value);
bool ReadUint64(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
// Rejects non-canonical encodings.
bool ReadVarInt(const std::vector<std::uint8_t>& data, std::size_t* offset,
                std::uint64_t* value);
bool ReadVarBytes(const std::vector<std::uint8_t>& data, std::size_t* offset,
                  std::vector<std::uint8_t>* bytes);

// Confidential asset/value/nonce wire encodings (null = single 0x00 byte).
void WriteConfidentialAsset(std::vector<std::uint8_t>* out, const ConfidentialAsset& asset);
void WriteConfidentialValue(std::vector<std::uint8_t>* out, const ConfidentialValue& value);
void WriteConfidentialNonce(std::vector<std::uint8_t>* out, const ConfidentialNonce& nonce);

struct TxSerializeSizes {
  std::size_t base_size{0};
  std::size_t witness_size{0};
  std::size_t total_size{0};

  std::size_t Weight() const noexcept { return base_size * 3 + total_size; }
  std::size_t VirtualSize() const noexcept { return (Weight() + 3) / 4; }
};

// Elements layout: version, flags byte, inputs, outputs, lock time, then the
// input and output witnesses when the flags byte is 1.
void SerializeTransaction(const Transaction& tx, std::vector<std::uint8_t>* out,
                          bool include_witness = true);
bool DeserializeTransaction(const std::vector<std::uint8_t>& data, std::size_t* offset,
                            Transaction* tx, std::string* error = nullptr);
TxSerializeSizes MeasureTransactionSizes(const Transaction& tx);

}  // namespace ctwallet::primitives::serialize
