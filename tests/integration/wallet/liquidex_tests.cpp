#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <set>
#include <span>
#include <string>
#include <system_error>
#include <vector>

#include "consensus/sighash.hpp"
#include "crypto/confidential.hpp"
#include "crypto/ec_key.hpp"
#include "fake_electrum.hpp"
#include "script/script.hpp"
#include "wallet/errors.hpp"
#include "wallet/liquidex.hpp"
#include "wallet/wallet_context.hpp"
#include "wallet_fixtures.hpp"

namespace {

using namespace ctwallet;
using wallet::Chain;
using wallet::ErrorCode;
using wallet::LiquidexProposal;
using wallet::WalletContext;
using wallet::WalletError;

constexpr primitives::Amount kMakerFunding = 100'000;
constexpr primitives::Amount kTakerIssued = 60'000;
constexpr primitives::Amount kTakerPolicy = 20'000;
constexpr primitives::Amount kAsked = 50'000;

bool ExpectError(ErrorCode expected, const std::function<void()>& fn, const char* label) {
  try {
    fn();
  } catch (const WalletError& ex) {
    if (ex.code() == expected) {
      return true;
    }
    std::cerr << label << ": unexpected error " << ex.what() << "\n";
    return false;
  }
  std::cerr << label << ": no error raised\n";
  return false;
}

primitives::OutPoint Fund(WalletContext& wallet, test::FakeElectrum& server, std::uint32_t index,
                          const primitives::AssetId& asset, primitives::Amount value,
                          std::uint8_t salt, std::map<primitives::OutPoint, primitives::TxOut>* spent) {
  const auto address = wallet.addresses().AddressFor(Chain::kExternal, index);
  const auto funding = test::MakeFundingTx(wallet.engine(), address, asset, value, salt);
  const auto txid = server.AddTransaction(funding);
  server.AddHistory(address.scripthash, txid, 100);
  (*spent)[primitives::OutPoint{txid, 0}] = funding.vout[0];
  return primitives::OutPoint{txid, 0};
}

bool SignatureVerifies(const primitives::Transaction& tx, std::size_t index,
                       const primitives::ConfidentialValue& spent_value, std::uint32_t hash_type) {
  const auto& stack = tx.vin[index].witness.script_witness;
  if (stack.size() != 2 || stack[1].size() != 33 || stack[0].back() != hash_type) {
    return false;
  }
  crypto::CompressedPublicKey pubkey{};
  std::copy(stack[1].begin(), stack[1].end(), pubkey.begin());
  const auto sighash = consensus::ComputeSegwitV0Sighash(tx, index, script::P2wpkhScriptCode(pubkey),
                                                         spent_value, hash_type);
  return crypto::VerifyDerSignature(pubkey, sighash,
                                    std::span<const std::uint8_t>(stack[0].data(), stack[0].size() - 1));
}

bool CheckSwap(const crypto::ConfidentialEngine& engine, const LiquidexProposal& offer,
               const wallet::SignedTransaction& built,
               const std::map<primitives::OutPoint, primitives::TxOut>& spent) {
  const auto& tx = built.tx;
  const auto& maker_out = offer.tx.vout[0];
  if (tx.vin.empty() || !(tx.vin[0] == offer.tx.vin[0]) || tx.vout.empty() ||
      tx.vout[0].asset != maker_out.asset || tx.vout[0].value != maker_out.value ||
      tx.vout[0].nonce != maker_out.nonce || tx.vout[0].script_pubkey != maker_out.script_pubkey) {
    std::cerr << "maker pair moved or changed\n";
    return false;
  }
  if (std::find(built.spent.begin(), built.spent.end(), offer.tx.vin[0].prevout) !=
      built.spent.end()) {
    std::cerr << "maker input listed as ours\n";
    return false;
  }
  std::vector<crypto::CommittedAmount> inputs;
  std::vector<primitives::ConfidentialAsset> input_assets;
  for (const auto& in : tx.vin) {
    const auto& prev = spent.at(in.prevout);
    inputs.push_back(crypto::CommittedAmount{prev.asset, prev.value});
    input_assets.push_back(prev.asset);
  }
  std::vector<crypto::CommittedAmount> outputs;
  for (const auto& out : tx.vout) {
    outputs.push_back(crypto::CommittedAmount{out.asset, out.value});
  }
  if (!engine.VerifyBalance(inputs, outputs)) {
    std::cerr << "swap does not balance\n";
    return false;
  }
  for (std::size_t i = 0; i + 1 < tx.vout.size(); ++i) {
    if (!engine.VerifyRangeProof(tx.vout[i]) ||
        !engine.VerifySurjectionProof(tx.vout[i], input_assets)) {
      std::cerr << "proofs of output " << i << " do not verify\n";
      return false;
    }
  }
  if (!SignatureVerifies(tx, 0, spent.at(tx.vin[0].prevout).value, wallet::kLiquidexSighash)) {
    std::cerr << "maker signature broken by the taker's additions\n";
    return false;
  }
  for (std::size_t i = 1; i < tx.vin.size(); ++i) {
    if (!SignatureVerifies(tx, i, spent.at(tx.vin[i].prevout).value, consensus::kSighashAll)) {
      std::cerr << "taker input " << i << " signature does not verify\n";
      return false;
    }
  }
  if (built.fee != wallet::FeeForVsize(built.fee_rate, built.vsize)) {
    std::cerr << "swap fee " << built.fee << " does not match vsize " << built.vsize << "\n";
    return false;
  }
  return true;
}

bool TestMakeAndTake(const std::filesystem::path& root) {
  const auto policy = test::TestPolicyAsset();
  const auto issued = test::TestIssuedAsset();
  const auto maker_cfg = test::RegtestConfig(root / "maker.ctws");
  auto maker = WalletContext::Create(maker_cfg, test::kTestMnemonic, "", "maker");
  auto taker = WalletContext::Create(test::RegtestConfig(), test::kOtherMnemonic, "", "taker");
  test::FakeElectrum server;
  server.SetTip(105);
  std::map<primitives::OutPoint, primitives::TxOut> spent;
  const auto maker_utxo = Fund(*maker, server, 0, policy, kMakerFunding, 0x61, &spent);
  Fund(*taker, server, 0, issued, kTakerIssued, 0x62, &spent);
  Fund(*taker, server, 1, policy, kTakerPolicy, 0x63, &spent);
  maker->Sync(server);
  taker->Sync(server);

  bool ok = true;
  ok &= ExpectError(ErrorCode::kInvalidAmount,
                    [&] { maker->LiquidexMake({maker_utxo, issued, 0.0}); }, "zero rate");
  ok &= ExpectError(ErrorCode::kInvalidAmount,
                    [&] { maker->LiquidexMake({maker_utxo, issued, std::nan("")}); }, "nan rate");
  ok &= ExpectError(ErrorCode::kInvalidRequest,
                    [&] { maker->LiquidexMake({primitives::OutPoint{maker_utxo.txid, 1}, issued, 1.0}); },
                    "utxo we do not own");

  // An offer the taker cannot fund leaves the taker untouched.
  const auto greedy = maker->LiquidexMake({maker_utxo, issued, 10.0});
  maker->ReleaseLiquidex(greedy);
  if (maker->reservations().IsReserved(maker_utxo)) {
    std::cerr << "released offer still holds its utxo\n";
    ok = false;
  }
  const auto taker_before = taker->Snapshot().first_unused;
  ok &= ExpectError(ErrorCode::kInsufficientFunds, [&] { taker->LiquidexTake(greedy); },
                    "offer asking more than the taker holds");
  if (!taker->reservations().Snapshot().empty() || taker->Snapshot().first_unused != taker_before ||
      taker->addresses().FirstUnusedIndex(Chain::kExternal) != taker_before[0]) {
    std::cerr << "failed take left reservations or used addresses\n";
    ok = false;
  }

  const auto proposal = maker->LiquidexMake({maker_utxo, issued, 0.5});
  if (proposal.output.asset != issued || proposal.output.value != kAsked ||
      proposal.input.value != kMakerFunding || !maker->reservations().IsReserved(maker_utxo)) {
    std::cerr << "offer terms wrong or utxo not reserved\n";
    ok = false;
  }
  if (maker->Snapshot().first_unused[0] != 3) {
    std::cerr << "maker receive addresses not persisted as used\n";
    ok = false;
  }
  ok &= ExpectError(ErrorCode::kInvalidRequest,
                    [&] { maker->LiquidexMake({maker_utxo, issued, 0.5}); },
                    "second offer on a reserved utxo");
  ok &= ExpectError(ErrorCode::kInsufficientFunds,
                    [&] { maker->Build(wallet::BuildRequest{{wallet::Recipient{
                              taker->ReceiveAddress().confidential, policy, 10'000}}}); },
                    "spending the offered utxo");

  const auto offer = LiquidexProposal::FromJson(proposal.ToJson());
  const auto taker_receive = taker->ReceiveAddress();
  const auto built = taker->LiquidexTake(offer);
  ok &= CheckSwap(taker->engine(), offer, built, spent);
  if (built.tx.vin.size() != 3 || built.spent.size() != 2 || built.change.size() != 2) {
    std::cerr << "unexpected swap shape: " << built.tx.vin.size() << " in, "
              << built.change.size() << " change\n";
    ok = false;
  }
  for (const auto& change : built.change) {
    const auto& secrets = built.output_secrets[change.vout];
    const auto expected = change.asset == issued ? kTakerIssued - kAsked
                                                 : kTakerPolicy - built.fee;
    if (change.vout == 0 || secrets.asset != change.asset || change.amount != expected) {
      std::cerr << "change output " << change.vout << " wrong\n";
      ok = false;
    }
  }
  const auto received = std::find_if(built.tx.vout.begin(), built.tx.vout.end(),
                                     [&](const primitives::TxOut& out) {
                                       return out.script_pubkey == taker_receive.script_pubkey;
                                     });
  const auto opened =
      received == built.tx.vout.end()
          ? std::nullopt
          : crypto::UnblindTxOut(taker->engine(), *received,
                                 taker->keys().BlindingPrivateKey(taker_receive.script_pubkey));
  if (!opened || opened->asset != policy || opened->value != kMakerFunding) {
    std::cerr << "taker cannot unblind what it bought\n";
    ok = false;
  }
  if (taker->Snapshot().first_unused[0] != taker_receive.index + 1) {
    std::cerr << "taker receive address not persisted as used\n";
    ok = false;
  }

  // The swap confirms; the maker only sees its output once the asset is listed.
  server.SetTip(106);
  const auto swap_id = server.AddTransaction(built.tx);
  const auto maker_receive = maker->addresses().FindByScript(proposal.tx.vout[0].script_pubkey);
  if (!maker_receive) {
    std::cerr << "offer output does not pay the maker\n";
    return false;
  }
  server.AddHistory(maker->addresses().AddressFor(Chain::kExternal, 0).scripthash, swap_id, 106);
  server.AddHistory(maker_receive->scripthash, swap_id, 106);
  maker->Sync(server);
  if (maker->Balance().count(issued) != 0 || maker->Balance().at(policy) != 0) {
    std::cerr << "maker balance wrong before listing the asset\n";
    ok = false;
  }
  if (!maker->LiquidexAssetsInsert(issued) || maker->LiquidexAssetsInsert(issued)) {
    std::cerr << "asset list insert did not report membership\n";
    ok = false;
  }
  if (maker->Balance()[issued] != kAsked) {
    std::cerr << "maker output not recovered after listing the asset\n";
    ok = false;
  }

  const auto reopened = WalletContext::Open(maker_cfg, "maker");
  if (reopened->LiquidexAssets() != std::set<primitives::AssetId>{issued} ||
      reopened->Balance()[issued] != kAsked) {
    std::cerr << "asset list or recovered output lost on reopen\n";
    ok = false;
  }

  // A restored maker lists the asset first and recovers the output by syncing.
  auto restored = WalletContext::Create(test::RegtestConfig(), test::kTestMnemonic, "", "restored");
  restored->LiquidexAssetsInsert(issued);
  restored->Sync(server);
  if (restored->Balance()[issued] != kAsked) {
    std::cerr << "sync did not recover the maker output\n";
    ok = false;
  }
  if (!restored->LiquidexAssetsRemove(issued) || restored->LiquidexAssetsRemove(issued) ||
      !restored->LiquidexAssets().empty()) {
    std::cerr << "asset list remove did not report membership\n";
    ok = false;
  }
  return ok;
}

}  // namespace

int main() {
  try {
    const std::filesystem::path test_root =
        std::filesystem::temp_directory_path() / "ctwallet_liquidex_tests";
    std::error_code cleanup_ec;
    std::filesystem::remove_all(test_root, cleanup_ec);
    std::filesystem::create_directories(test_root);

    struct ScopedCleanup {
      std::filesystem::path root;
      ~ScopedCleanup() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
      }
    } cleanup{test_root};

    return TestMakeAndTake(test_root) ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "liquidex integration tests failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
