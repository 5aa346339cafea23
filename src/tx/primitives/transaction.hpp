#pragma once

#include <algorithm>
#include <compare>
#include <cstdint>
#include <limits>
#include <optional>
#include <vector>

#include "primitives/amount.hpp"
#include "primitives/hash.hpp"

namespace ctwallet::primitives {

struct OutPoint {
  Hash256 txid{};
  std::uint32_t index{0};

  auto operator<=>(const OutPoint& other) const = default;

  [[nodiscard]] bool IsNull() const noexcept {
    return std::all_of(txid.begin(), txid.end(), [](std::uint8_t b) { return b == 0; }) &&
           index == std::numeric_limits<std::uint32_t>::max();
  }
};

// Confidential fields keep their exact wire encoding; an empty vector is the
// null encoding (single 0x00 byte on the wire).
struct ConfidentialAsset {
  static constexpr std::uint8_t kExplicitPrefix = 0x01;
  static constexpr std::uint8_t kCommitmentPrefixA = 0x0a;
  static constexpr std::uint8_t kCommitmentPrefixB = 0x0b;

  std::vector<std::uint8_t> bytes;

  bool operator==(const ConfidentialAsset&) const = default;
  [[nodiscard]] bool IsNull() const noexcept { return bytes.empty(); }
  [[nodiscard]] bool IsExplicit() const noexcept {
    return bytes.size() == 33 && bytes[0] == kExplicitPrefix;
  }
  [[nodiscard]] bool IsCommitment() const noexcept {
    return bytes.size() == 33 &&
           (bytes[0] == kCommitmentPrefixA || bytes[0] == kCommitmentPrefixB);
  }
  [[nodiscard]] std::optional<AssetId> Explicit() const {
    if (!IsExplicit()) return std::nullopt;
    AssetId id{};
    std::copy(bytes.begin() + 1, bytes.end(), id.begin());
    return id;
  }
  static ConfidentialAsset FromExplicit(const AssetId& id) {
    ConfidentialAsset out;
    out.bytes.reserve(33);
    out.bytes.push_back(kExplicitPrefix);
    out.bytes.insert(out.bytes.end(), id.begin(), id.end());
    return out;
  }
};

struct ConfidentialValue {
  static constexpr std::uint8_t kExplicitPrefix = 0x01;
  static constexpr std::uint8_t kCommitmentPrefixA = 0x08;
  static constexpr std::uint8_t kCommitmentPrefixB = 0x09;

  std::vector<std::uint8_t> bytes;

  bool operator==(const ConfidentialValue&) const = default;
  [[nodiscard]] bool IsNull() const noexcept { return bytes.empty(); }
  [[nodiscard]] bool IsExplicit() const noexcept {
    return bytes.size() == 9 && bytes[0] == kExplicitPrefix;
  }
  [[nodiscard]] bool IsCommitment() const noexcept {
    return bytes.size() == 33 &&
           (bytes[0] == kCommitmentPrefixA || bytes[0] == kCommitmentPrefixB);
  }
  // Explicit amounts are big-endian on the wire.
  [[nodiscard]] std::optional<Amount> Explicit() const {
    if (!IsExplicit()) return std::nullopt;
    Amount value = 0;
    for (std::size_t i = 1; i < 9; ++i) {
      value = (value << 8) | bytes[i];
    }
    return value;
  }
  static ConfidentialValue FromAmount(Amount value) {
    ConfidentialValue out;
    out.bytes.resize(9);
    out.bytes[0] = kExplicitPrefix;
    for (int i = 0; i < 8; ++i) {
      out.bytes[8 - i] = static_cast<std::uint8_t>(value >> (8 * i));
    }
    return out;
  }
};

struct ConfidentialNonce {
  std::vector<std::uint8_t> bytes;

  bool operator==(const ConfidentialNonce&) const = default;
  [[nodiscard]] bool IsNull() const noexcept { return bytes.empty(); }
  [[nodiscard]] bool IsPublicKey() const noexcept {
    return bytes.size() == 33 && (bytes[0] == 0x02 || bytes[0] == 0x03);
  }
};

struct AssetIssuance {
  Hash256 blinding_nonce{};
  Hash256 entropy{};
  ConfidentialValue amount{};
  ConfidentialValue inflation_keys{};

  bool operator==(const AssetIssuance&) const = default;
  [[nodiscard]] bool IsNull() const noexcept {
    return amount.IsNull() && inflation_keys.IsNull();
  }
};

using WitnessStack = std::vector<std::vector<std::uint8_t>>;

struct TxInWitness {
  std::vector<std::uint8_t> issuance_amount_rangeproof{};
  std::vector<std::uint8_t> inflation_keys_rangeproof{};
  WitnessStack script_witness{};
  WitnessStack pegin_witness{};

  bool operator==(const TxInWitness&) const = default;
  [[nodiscard]] bool IsNull() const noexcept {
    return issuance_amount_rangeproof.empty() && inflation_keys_rangeproof.empty() &&
           script_witness.empty() && pegin_witness.empty();
  }
};

struct TxIn {
  OutPoint prevout{};
  std::vector<std::uint8_t> script_sig{};
  std::uint32_t sequence{0xFFFFFFFF};
  bool is_pegin{false};
  AssetIssuance issuance{};
  TxInWitness witness{};

  bool operator==(const TxIn&) const = default;
  [[nodiscard]] bool HasIssuance() const noexcept { return !issuance.IsNull(); }
};

struct TxOutWitness {
  std::vector<std::uint8_t> surjection_proof{};
  std::vector<std::uint8_t> range_proof{};

  bool operator==(const TxOutWitness&) const = default;
  [[nodiscard]] bool IsNull() const noexcept {
    return surjection_proof.empty() && range_proof.empty();
  }
};

struct TxOut {
  ConfidentialAsset asset{};
  ConfidentialValue value{};
  ConfidentialNonce nonce{};
  std::vector<std::uint8_t> script_pubkey{};
  TxOutWitness witness{};

  bool operator==(const TxOut&) const = default;
  // Elements fee outputs carry an empty script with explicit asset/value.
  [[nodiscard]] bool IsFee() const noexcept {
    return script_pubkey.empty() && asset.IsExplicit() && value.IsExplicit();
  }
};

struct Transaction {
  std::uint32_t version{2};
  std::vector<TxIn> vin{};
  std::vector<TxOut> vout{};
  std::uint32_t lock_time{0};

  bool operator==(const Transaction&) const = default;
  [[nodiscard]] bool IsCoinbase() const noexcept {
    return vin.size() == 1 && vin.front().prevout.IsNull();
  }
  [[nodiscard]] bool HasWitness() const noexcept {
    return std::any_of(vin.begin(), vin.end(), [](const TxIn& in) { return !in.witness.IsNull(); }) ||
           std::any_of(vout.begin(), vout.end(),
                       [](const TxOut& out) { return !out.witness.IsNull(); });
  }
};

}  // namespace ctwallet::primitives
