#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <stdexcept>
#include <vector>

#include "consensus/sighash.hpp"
#include "primitives/transaction.hpp"
#include "script/script.hpp"

namespace {

using namespace ctwallet;

primitives::Transaction BuildTransaction() {
  primitives::Transaction tx;
  tx.version = 2;
  tx.lock_time = 0x01020304;
  tx.vin.resize(2);
  tx.vout.resize(2);

  auto& in0 = tx.vin[0];
  in0.prevout.txid.fill(0x11);
  in0.prevout.index = 1;
  in0.sequence = 0xFFFFFFFE;

  auto& in1 = tx.vin[1];
  in1.prevout.txid.fill(0x22);
  in1.prevout.txid[0] = 0xAB;
  in1.prevout.index = 7;
  in1.sequence = 0xFFFFFFFD;

  primitives::AssetId asset{};
  asset.fill(0x5a);
  tx.vout[0].asset = primitives::ConfidentialAsset::FromExplicit(asset);
  tx.vout[0].value = primitives::ConfidentialValue::FromAmount(70'000);
  tx.vout[0].script_pubkey = {0xa9, 0x14};
  tx.vout[0].script_pubkey.insert(tx.vout[0].script_pubkey.end(), 20, 0x33);
  tx.vout[0].script_pubkey.push_back(0x87);
  tx.vout[1].asset = primitives::ConfidentialAsset::FromExplicit(asset);
  tx.vout[1].value = primitives::ConfidentialValue::FromAmount(300);
  return tx;
}

}  // namespace

int main() {
  const auto tx = BuildTransaction();
  std::vector<std::uint8_t> pubkey(33, 0x07);
  pubkey[0] = 0x03;
  const auto script_code = script::P2wpkhScriptCode(pubkey);
  const auto spent = primitives::ConfidentialValue::FromAmount(100'000);

  const auto base = consensus::ComputeSegwitV0Sighash(tx, 0, script_code, spent);
  if (consensus::ComputeSegwitV0Sighash(tx, 0, script_code, spent) != base) {
    std::cerr << "sighash is not deterministic\n";
    return EXIT_FAILURE;
  }
  if (consensus::ComputeSegwitV0Sighash(tx, 1, script_code, spent) == base) {
    std::cerr << "sighash ignores the input index\n";
    return EXIT_FAILURE;
  }
  if (consensus::ComputeSegwitV0Sighash(
          tx, 0, script_code, primitives::ConfidentialValue::FromAmount(100'001)) == base) {
    std::cerr << "sighash ignores the spent amount\n";
    return EXIT_FAILURE;
  }

  // Signatures do not commit to scriptSigs or witnesses.
  {
    auto signed_tx = tx;
    signed_tx.vin[0].script_sig = script::P2shP2wpkhScriptSig(pubkey);
    signed_tx.vin[1].witness.script_witness = {{0x30, 0x01}, pubkey};
    if (consensus::ComputeSegwitV0Sighash(signed_tx, 0, script_code, spent) != base) {
      std::cerr << "sighash changed with scriptSig/witness\n";
      return EXIT_FAILURE;
    }
  }

  {
    auto changed = tx;
    changed.vout[1].value = primitives::ConfidentialValue::FromAmount(301);
    if (consensus::ComputeSegwitV0Sighash(changed, 0, script_code, spent) == base) {
      std::cerr << "sighash ignores outputs\n";
      return EXIT_FAILURE;
    }
  }
  {
    auto changed = tx;
    changed.vin[1].sequence = 0;
    if (consensus::ComputeSegwitV0Sighash(changed, 0, script_code, spent) == base) {
      std::cerr << "sighash ignores other sequences\n";
      return EXIT_FAILURE;
    }
  }
  {
    auto changed = tx;
    changed.lock_time = 0;
    if (consensus::ComputeSegwitV0Sighash(changed, 0, script_code, spent) == base) {
      std::cerr << "sighash ignores lock time\n";
      return EXIT_FAILURE;
    }
  }

  // SINGLE|ANYONECANPAY commits to its own input and the output at the same
  // index only, so others can add inputs and outputs after signing.
  constexpr auto kSingleAnyone = consensus::kSighashSingle | consensus::kSighashAnyoneCanPay;
  const auto single = consensus::ComputeSegwitV0Sighash(tx, 0, script_code, spent, kSingleAnyone);
  if (single == base) {
    std::cerr << "sighash ignores the hash type\n";
    return EXIT_FAILURE;
  }
  {
    auto extended = tx;
    extended.vin[1].prevout.index = 9;
    extended.vin[1].sequence = 0;
    extended.vout[1].value = primitives::ConfidentialValue::FromAmount(299);
    extended.vin.push_back(extended.vin[1]);
    extended.vout.push_back(extended.vout[1]);
    if (consensus::ComputeSegwitV0Sighash(extended, 0, script_code, spent, kSingleAnyone) !=
        single) {
      std::cerr << "single|anyonecanpay commits to foreign inputs or outputs\n";
      return EXIT_FAILURE;
    }
  }
  {
    auto changed = tx;
    changed.vout[0].value = primitives::ConfidentialValue::FromAmount(69'999);
    if (consensus::ComputeSegwitV0Sighash(changed, 0, script_code, spent, kSingleAnyone) ==
        single) {
      std::cerr << "single|anyonecanpay ignores its paired output\n";
      return EXIT_FAILURE;
    }
  }
  {
    // SINGLE without ANYONECANPAY still commits to every prevout.
    const auto plain_single =
        consensus::ComputeSegwitV0Sighash(tx, 0, script_code, spent, consensus::kSighashSingle);
    auto changed = tx;
    changed.vin[1].prevout.index = 8;
    if (consensus::ComputeSegwitV0Sighash(changed, 0, script_code, spent,
                                          consensus::kSighashSingle) == plain_single) {
      std::cerr << "sighash single ignores other prevouts\n";
      return EXIT_FAILURE;
    }
  }
  {
    // Input 2 has no paired output; the outputs hash is all zero.
    auto wide = tx;
    wide.vin.push_back(tx.vin[1]);
    const auto unpaired = consensus::ComputeSegwitV0Sighash(wide, 2, script_code, spent,
                                                            kSingleAnyone);
    wide.vout.pop_back();
    if (consensus::ComputeSegwitV0Sighash(wide, 2, script_code, spent, kSingleAnyone) !=
        unpaired) {
      std::cerr << "unpaired single input commits to outputs\n";
      return EXIT_FAILURE;
    }
  }
  bool rejected = false;
  try {
    consensus::ComputeSegwitV0Sighash(tx, 0, script_code, spent, 0x02);
  } catch (const std::runtime_error&) {
    rejected = true;
  }
  if (!rejected) {
    std::cerr << "sighash none accepted\n";
    return EXIT_FAILURE;
  }

  return EXIT_SUCCESS;
}
