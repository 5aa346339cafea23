#pragma once

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <vector>

#include "crypto/confidential.hpp"
#include "primitives/transaction.hpp"
#include "wallet/key_ring.hpp"

namespace ctwallet::wallet {

// Electrum heights: > 0 confirmed, 0 in mempool, -1 in mempool with
// unconfirmed parents.
struct HistoryEntry {
  primitives::Hash256 txid{};
  std::int32_t height{0};

  bool operator==(const HistoryEntry&) const = default;
};

struct ScripthashState {
  Chain chain{Chain::kExternal};
  std::uint32_t index{0};
  // Last status the server reported and we reconciled; nullopt means
  // "empty history" or, after a reorg, "must refetch".
  std::optional<std::string> status;
  std::vector<HistoryEntry> history;

  bool operator==(const ScripthashState&) const = default;
};

struct OwnedOutput {
  Chain chain{Chain::kExternal};
  std::uint32_t index{0};
  crypto::UnblindedOutput secrets{};

  bool operator==(const OwnedOutput&) const = default;
};

struct TipInfo {
  std::int32_t height{-1};
  primitives::Hash256 hash{};

  bool operator==(const TipInfo&) const = default;
};

// Spendable view of one owned output.
struct Utxo {
  primitives::OutPoint outpoint{};
  Chain chain{Chain::kExternal};
  std::uint32_t index{0};
  primitives::TxOut txout{};
  crypto::UnblindedOutput secrets{};
  std::int32_t height{0};
};

// Everything sync has learnt. Ordered containers keep the serialized form
// canonical so two snapshots can be compared byte for byte.
struct ChainState {
  std::map<std::string, ScripthashState> scripthashes;
  std::map<primitives::Hash256, std::int32_t> tx_heights;
  std::map<primitives::Hash256, primitives::Transaction> transactions;
  std::map<primitives::OutPoint, OwnedOutput> owned_outputs;
  std::map<std::int32_t, primitives::Hash256> block_hashes;
  TipInfo tip{};
  std::array<std::uint32_t, 2> first_unused{0, 0};
  // Assets tried when recovering our own liquidex maker outputs.
  std::set<primitives::AssetId> liquidex_assets;

  bool operator==(const ChainState&) const = default;

  std::vector<std::uint8_t> Serialize() const;
  // Throws WalletError(kStoreCorrupt).
  static ChainState Deserialize(const std::vector<std::uint8_t>& data, std::size_t* offset);
};

// Owned outputs not spent by any known wallet transaction, sorted by value
// descending then outpoint.
std::vector<Utxo> ComputeUtxos(const ChainState& state);

// Plaintext sealed into the encrypted store.
struct StoreSnapshot {
  std::vector<std::uint8_t> seed;
  std::string network;
  ChainState state;

  std::vector<std::uint8_t> Serialize() const;
  // Throws WalletError(kStoreCorrupt).
  static StoreSnapshot Deserialize(std::span<const std::uint8_t> plaintext);
};

}  // namespace ctwallet::wallet
