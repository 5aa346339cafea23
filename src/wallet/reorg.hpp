#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>

#include "wallet/chain_state.hpp"

namespace ctwallet::wallet {

// What the server currently says about the chain: its tip and the block
// hash at every height we had recorded.
struct ChainFacts {
  TipInfo tip{};
  std::map<std::int32_t, primitives::Hash256> block_hashes;
};

struct ReorgOutcome {
  ChainState state;
  // Heights whose recorded data was dropped.
  std::set<std::int32_t> invalidated_heights;
  std::optional<std::int32_t> fork_height;
};

// Pure transition. A recorded height diverges when the server reports a
// different hash for it or when it lies above the new tip. Everything at or
// above the lowest divergent height becomes unconfirmed, its block hashes
// are dropped, and the status of every affected scripthash is cleared so
// the next fetch pass re-downloads its history.
ReorgOutcome ApplyChainFacts(const ChainState& old_state, const ChainFacts& facts);

}  // namespace ctwallet::wallet
