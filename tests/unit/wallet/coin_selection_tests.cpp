#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <map>
#include <vector>

#include "wallet/coin_selection.hpp"
#include "wallet/errors.hpp"
#include "wallet_fixtures.hpp"

namespace {

using namespace ctwallet;
using wallet::Utxo;

Utxo Coin(const primitives::AssetId& asset, primitives::Amount value, std::uint8_t txid_byte,
          std::uint32_t vout = 0) {
  Utxo utxo;
  utxo.outpoint.txid.fill(txid_byte);
  utxo.outpoint.index = vout;
  utxo.secrets.asset = asset;
  utxo.secrets.value = value;
  return utxo;
}

bool TestLargestFirst() {
  const auto policy = test::TestPolicyAsset();
  const std::vector<Utxo> candidates = {
      Coin(policy, 100, 0x01), Coin(policy, 300, 0x05), Coin(policy, 500, 0x09),
      Coin(policy, 300, 0x03)};
  const auto selection = wallet::SelectCoins(candidates, {{policy, 550}});
  if (selection.inputs.size() != 2) {
    std::cerr << "expected 2 inputs, got " << selection.inputs.size() << "\n";
    return false;
  }
  if (selection.inputs[0].secrets.value != 500 || selection.inputs[1].outpoint.txid[0] != 0x03) {
    std::cerr << "inputs not taken largest first with outpoint tie-break\n";
    return false;
  }
  if (selection.input_totals.at(policy) != 800) {
    std::cerr << "input total mismatch\n";
    return false;
  }
  const auto exact = wallet::SelectCoins(candidates, {{policy, 500}});
  if (exact.inputs.size() != 1) {
    std::cerr << "selection took more than needed\n";
    return false;
  }
  return true;
}

bool TestPerAsset() {
  const auto policy = test::TestPolicyAsset();
  const auto issued = test::TestIssuedAsset();
  const std::vector<Utxo> candidates = {Coin(policy, 1000, 0x01), Coin(issued, 40, 0x02),
                                        Coin(issued, 70, 0x03), Coin(issued, 5, 0x04)};
  const auto selection = wallet::SelectCoins(candidates, {{policy, 10}, {issued, 100}});
  if (selection.inputs.size() != 3 || selection.input_totals.at(policy) != 1000 ||
      selection.input_totals.at(issued) != 110) {
    std::cerr << "multi-asset selection mismatch\n";
    return false;
  }
  const auto only_issued = wallet::SelectCoins(candidates, {{issued, 1}});
  if (only_issued.inputs.size() != 1 || only_issued.input_totals.count(policy) != 0) {
    std::cerr << "unrelated asset selected\n";
    return false;
  }
  return true;
}

bool TestShortfall() {
  const auto policy = test::TestPolicyAsset();
  const auto issued = test::TestIssuedAsset();
  const std::vector<Utxo> candidates = {Coin(policy, 700, 0x01), Coin(policy, 500, 0x02)};
  try {
    wallet::SelectCoins(candidates, {{policy, 2000}, {issued, 1}});
  } catch (const wallet::WalletError& ex) {
    if (ex.code() != wallet::ErrorCode::kInsufficientFunds || ex.shortfalls().size() != 2) {
      std::cerr << "unexpected error: " << ex.what() << "\n";
      return false;
    }
    for (const auto& shortfall : ex.shortfalls()) {
      const bool ok = shortfall.asset == policy
                          ? shortfall.required == 2000 && shortfall.available == 1200
                          : shortfall.required == 1 && shortfall.available == 0;
      if (!ok) {
        std::cerr << "shortfall detail mismatch\n";
        return false;
      }
    }
    return true;
  }
  std::cerr << "insufficient funds not reported\n";
  return false;
}

bool TestOverflow() {
  const auto policy = test::TestPolicyAsset();
  const std::vector<Utxo> candidates = {Coin(policy, primitives::kMaxMoney, 0x01),
                                        Coin(policy, 1, 0x02)};
  try {
    wallet::SelectCoins(candidates, {{policy, 10}});
  } catch (const wallet::WalletError& ex) {
    return ex.code() == wallet::ErrorCode::kInvalidAmount;
  }
  std::cerr << "overflowing total accepted\n";
  return false;
}

bool TestSortOrder() {
  const auto policy = test::TestPolicyAsset();
  std::vector<Utxo> utxos = {Coin(policy, 5, 0x02, 1), Coin(policy, 9, 0x07),
                             Coin(policy, 5, 0x02, 0)};
  wallet::SortForSelection(&utxos);
  if (utxos[0].secrets.value != 9 || utxos[1].outpoint.index != 0 || utxos[2].outpoint.index != 1) {
    std::cerr << "SortForSelection order mismatch\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestLargestFirst();
  ok &= TestPerAsset();
  ok &= TestShortfall();
  ok &= TestOverflow();
  ok &= TestSortOrder();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
