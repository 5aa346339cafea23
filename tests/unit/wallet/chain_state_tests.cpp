#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "primitives/transaction.hpp"
#include "primitives/txid.hpp"
#include "wallet/chain_state.hpp"
#include "wallet/errors.hpp"
#include "wallet_fixtures.hpp"

namespace {

using namespace ctwallet;
using wallet::ChainState;
using wallet::Chain;

primitives::TxOut ExplicitOut(primitives::Amount value, std::uint8_t script_tag) {
  primitives::TxOut out;
  out.asset = primitives::ConfidentialAsset::FromExplicit(test::TestPolicyAsset());
  out.value = primitives::ConfidentialValue::FromAmount(value);
  out.script_pubkey = {0xa9, 0x14};
  out.script_pubkey.insert(out.script_pubkey.end(), 20, script_tag);
  out.script_pubkey.push_back(0x87);
  return out;
}

wallet::OwnedOutput Owned(Chain chain, std::uint32_t index, primitives::Amount value) {
  wallet::OwnedOutput owned;
  owned.chain = chain;
  owned.index = index;
  owned.secrets.asset = test::TestPolicyAsset();
  owned.secrets.value = value;
  return owned;
}

// Funding tx with three owned outputs, and a spend of its first output.
ChainState SampleState() {
  primitives::Transaction funding;
  primitives::TxIn foreign;
  foreign.prevout.txid.fill(0x42);
  funding.vin.push_back(foreign);
  funding.vout = {ExplicitOut(500, 1), ExplicitOut(900, 2), ExplicitOut(900, 3)};
  const auto funding_id = primitives::ComputeTxId(funding);

  primitives::Transaction spend;
  primitives::TxIn in;
  in.prevout = {funding_id, 0};
  spend.vin.push_back(in);
  spend.vout = {ExplicitOut(100, 4)};
  const auto spend_id = primitives::ComputeTxId(spend);

  ChainState state;
  state.transactions[funding_id] = funding;
  state.transactions[spend_id] = spend;
  state.tx_heights[funding_id] = 120;
  state.tx_heights[spend_id] = 0;
  state.owned_outputs[{funding_id, 0}] = Owned(Chain::kExternal, 0, 500);
  state.owned_outputs[{funding_id, 1}] = Owned(Chain::kExternal, 1, 900);
  state.owned_outputs[{funding_id, 2}] = Owned(Chain::kExternal, 2, 900);
  state.owned_outputs[{spend_id, 0}] = Owned(Chain::kInternal, 0, 100);

  wallet::ScripthashState entry;
  entry.chain = Chain::kExternal;
  entry.index = 0;
  entry.status = std::string(64, 'a');
  entry.history = {{funding_id, 120}, {spend_id, 0}};
  state.scripthashes["ab" + std::string(62, '0')] = entry;
  wallet::ScripthashState empty;
  empty.chain = Chain::kInternal;
  empty.index = 5;
  state.scripthashes["cd" + std::string(62, '0')] = empty;

  primitives::Hash256 block{};
  block.fill(0x07);
  state.block_hashes[120] = block;
  state.tip.height = 125;
  state.tip.hash.fill(0x09);
  state.first_unused = {3, 1};
  primitives::AssetId wanted{};
  wanted.fill(0x5a);
  state.liquidex_assets.insert(wanted);
  return state;
}

bool TestRoundTrip() {
  const auto state = SampleState();
  const auto bytes = state.Serialize();
  std::size_t offset = 0;
  const auto decoded = ChainState::Deserialize(bytes, &offset);
  if (offset != bytes.size() || !(decoded == state)) {
    std::cerr << "chain state round trip mismatch\n";
    return false;
  }
  if (decoded.Serialize() != bytes) {
    std::cerr << "serialization is not canonical\n";
    return false;
  }

  wallet::StoreSnapshot snapshot;
  snapshot.seed = std::vector<std::uint8_t>(64, 0x33);
  snapshot.network = "elements-regtest";
  snapshot.state = state;
  const auto restored = wallet::StoreSnapshot::Deserialize(snapshot.Serialize());
  if (restored.seed != snapshot.seed || restored.network != snapshot.network ||
      !(restored.state == state)) {
    std::cerr << "snapshot round trip mismatch\n";
    return false;
  }
  return true;
}

bool TestCorruption() {
  const auto bytes = SampleState().Serialize();
  bool ok = true;
  for (const std::size_t cut : {std::size_t{0}, std::size_t{5}, bytes.size() / 2, bytes.size() - 1}) {
    const std::vector<std::uint8_t> truncated(bytes.begin(), bytes.begin() + cut);
    std::size_t offset = 0;
    try {
      ChainState::Deserialize(truncated, &offset);
      std::cerr << "truncation at " << cut << " accepted\n";
      ok = false;
    } catch (const wallet::WalletError& ex) {
      if (ex.code() != wallet::ErrorCode::kStoreCorrupt) {
        std::cerr << "truncation at " << cut << ": " << ex.what() << "\n";
        ok = false;
      }
    }
  }

  wallet::StoreSnapshot snapshot;
  snapshot.seed = std::vector<std::uint8_t>(16, 0x01);
  snapshot.network = "liquid";
  snapshot.state = SampleState();
  const auto whole = snapshot.Serialize();
  // Cuts past the seed fail while the chain state is being read.
  for (const std::size_t cut : {std::size_t{1}, std::size_t{20}, whole.size() - 1}) {
    const std::vector<std::uint8_t> truncated(whole.begin(), whole.begin() + cut);
    try {
      wallet::StoreSnapshot::Deserialize(truncated);
      std::cerr << "snapshot truncated at " << cut << " accepted\n";
      ok = false;
    } catch (const wallet::WalletError& ex) {
      if (ex.code() != wallet::ErrorCode::kStoreCorrupt) {
        std::cerr << "snapshot truncated at " << cut << ": " << ex.what() << "\n";
        ok = false;
      }
    }
  }

  snapshot.state = ChainState{};
  auto plaintext = snapshot.Serialize();
  plaintext.push_back(0x00);
  try {
    wallet::StoreSnapshot::Deserialize(plaintext);
    std::cerr << "trailing bytes accepted\n";
    ok = false;
  } catch (const wallet::WalletError& ex) {
    if (ex.code() != wallet::ErrorCode::kStoreCorrupt) {
      std::cerr << "trailing bytes: " << ex.what() << "\n";
      ok = false;
    }
  }
  return ok;
}

bool TestUtxos() {
  const auto state = SampleState();
  const auto utxos = wallet::ComputeUtxos(state);
  if (utxos.size() != 3) {
    std::cerr << "expected 3 utxos, got " << utxos.size() << "\n";
    return false;
  }
  if (utxos[0].secrets.value != 900 || utxos[1].secrets.value != 900 ||
      utxos[2].secrets.value != 100) {
    std::cerr << "utxos not ordered by value\n";
    return false;
  }
  if (utxos[0].outpoint.index != 1 || utxos[1].outpoint.index != 2) {
    std::cerr << "equal values not ordered by outpoint\n";
    return false;
  }
  if (utxos[0].height != 120 || utxos[2].height != 0 || utxos[2].chain != Chain::kInternal) {
    std::cerr << "utxo metadata mismatch\n";
    return false;
  }
  if (utxos[1].txout.script_pubkey != ExplicitOut(900, 3).script_pubkey) {
    std::cerr << "utxo carries the wrong output\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestRoundTrip();
  ok &= TestCorruption();
  ok &= TestUtxos();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
