#include "wallet/coin_selection.hpp"

#include <algorithm>

#include "util/hex.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

void SortForSelection(std::vector<Utxo>* utxos) {
  std::sort(utxos->begin(), utxos->end(), [](const Utxo& a, const Utxo& b) {
    if (a.secrets.value != b.secrets.value) {
      return a.secrets.value > b.secrets.value;
    }
    return a.outpoint < b.outpoint;
  });
}

CoinSelection SelectCoins(const std::vector<Utxo>& candidates,
                          const std::map<primitives::AssetId, primitives::Amount>& targets) {
  std::map<primitives::AssetId, std::vector<Utxo>> by_asset;
  for (const auto& utxo : candidates) {
    if (targets.count(utxo.secrets.asset) != 0) {
      by_asset[utxo.secrets.asset].push_back(utxo);
    }
  }

  CoinSelection selection;
  std::vector<AssetShortfall> shortfalls;
  for (const auto& [asset, target] : targets) {
    auto& pool = by_asset[asset];
    SortForSelection(&pool);
    primitives::Amount accumulated = 0;
    primitives::Amount available = 0;
    std::size_t taken = 0;
    for (const auto& utxo : pool) {
      primitives::Amount next = 0;
      if (!primitives::CheckedAdd(available, utxo.secrets.value, &next)) {
        throw WalletError(ErrorCode::kInvalidAmount, "input total out of range");
      }
      available = next;
      if (accumulated < target) {
        accumulated = next;
        ++taken;
      }
    }
    if (accumulated < target) {
      shortfalls.push_back(AssetShortfall{asset, target, available});
      continue;
    }
    selection.inputs.insert(selection.inputs.end(), pool.begin(),
                            pool.begin() + static_cast<std::ptrdiff_t>(taken));
    selection.input_totals[asset] = accumulated;
  }
  if (!shortfalls.empty()) {
    std::string message = "insufficient funds for asset";
    for (const auto& shortfall : shortfalls) {
      message += " " + util::HexEncodeReversed(shortfall.asset) + " (need " +
                 std::to_string(shortfall.required) + ", have " +
                 std::to_string(shortfall.available) + ")";
    }
    throw WalletError(ErrorCode::kInsufficientFunds, message, std::move(shortfalls));
  }
  return selection;
}

}  // namespace ctwallet::wallet
