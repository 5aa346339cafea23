#pragma once

#include <map>
#include <vector>

#include "wallet/chain_state.hpp"

namespace ctwallet::wallet {

struct CoinSelection {
  std::vector<Utxo> inputs;
  std::map<primitives::AssetId, primitives::Amount> input_totals;
};

// Largest-first selection, independently per asset. Candidates are visited
// by value descending, ties broken by ascending outpoint, and accumulated
// until the asset's target is covered, so the result is the fewest inputs
// that can cover each target and is fully deterministic.
//
// Throws WalletError(kInsufficientFunds) listing every asset whose target
// could not be covered; kInvalidAmount if a total overflows.
CoinSelection SelectCoins(const std::vector<Utxo>& candidates,
                          const std::map<primitives::AssetId, primitives::Amount>& targets);

// Orders utxos the way SelectCoins visits them.
void SortForSelection(std::vector<Utxo>* utxos);

}  // namespace ctwallet::wallet
