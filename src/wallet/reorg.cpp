#include "wallet/reorg.hpp"

namespace ctwallet::wallet {

ReorgOutcome ApplyChainFacts(const ChainState& old_state, const ChainFacts& facts) {
  ReorgOutcome outcome;
  outcome.state = old_state;
  auto& state = outcome.state;

  for (const auto& [height, hash] : old_state.block_hashes) {
    const auto it = facts.block_hashes.find(height);
    const bool above_tip = height > facts.tip.height;
    const bool mismatch = it != facts.block_hashes.end() && it->second != hash;
    if (above_tip || mismatch) {
      outcome.fork_height = height;
      break;  // std::map iterates in ascending height order.
    }
  }
  // The old tip itself may have been replaced without any wallet activity
  // recorded at that height.
  if (!outcome.fork_height && old_state.tip.height >= 0) {
    const auto it = facts.block_hashes.find(old_state.tip.height);
    if (it != facts.block_hashes.end() && it->second != old_state.tip.hash) {
      outcome.fork_height = old_state.tip.height;
    } else if (old_state.tip.height > facts.tip.height) {
      outcome.fork_height = facts.tip.height + 1;
    }
  }

  if (outcome.fork_height) {
    const auto fork = *outcome.fork_height;
    for (auto it = state.block_hashes.lower_bound(fork); it != state.block_hashes.end();) {
      outcome.invalidated_heights.insert(it->first);
      it = state.block_hashes.erase(it);
    }
    for (auto& [txid, height] : state.tx_heights) {
      if (height >= fork) {
        outcome.invalidated_heights.insert(height);
        height = 0;
      }
    }
    for (auto& [scripthash, entry] : state.scripthashes) {
      bool touched = false;
      for (auto& item : entry.history) {
        if (item.height >= fork) {
          item.height = 0;
          touched = true;
        }
      }
      if (touched) {
        entry.status.reset();
      }
    }
  }

  state.tip = facts.tip;
  return outcome;
}

}  // namespace ctwallet::wallet
