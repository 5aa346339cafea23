#include <cstdint>
#include <iostream>
#include <string>
#include <vector>

#include "primitives/serialize.hpp"
#include "primitives/transaction.hpp"
#include "primitives/txid.hpp"

namespace {

using namespace ctwallet::primitives;

Transaction BuildTransaction() {
  Transaction tx;
  tx.version = 2;
  tx.lock_time = 150;

  TxIn in0;
  in0.prevout.txid.fill(0x11);
  in0.prevout.index = 1;
  in0.script_sig = {0x16, 0x00, 0x14};
  in0.script_sig.insert(in0.script_sig.end(), 20, 0xAB);
  in0.sequence = 0xFFFFFFFD;
  in0.witness.script_witness = {std::vector<std::uint8_t>(71, 0x30),
                                std::vector<std::uint8_t>(33, 0x02)};
  tx.vin.push_back(in0);

  TxIn in1;
  in1.prevout.txid.fill(0x22);
  in1.prevout.index = 0;
  tx.vin.push_back(in1);

  AssetId asset{};
  asset.fill(0x5a);

  TxOut blinded;
  blinded.asset.bytes.assign(33, 0x44);
  blinded.asset.bytes[0] = ConfidentialAsset::kCommitmentPrefixA;
  blinded.value.bytes.assign(33, 0x55);
  blinded.value.bytes[0] = ConfidentialValue::kCommitmentPrefixB;
  blinded.nonce.bytes.assign(33, 0x66);
  blinded.nonce.bytes[0] = 0x03;
  blinded.script_pubkey = {0xa9, 0x14};
  blinded.script_pubkey.insert(blinded.script_pubkey.end(), 20, 0x77);
  blinded.script_pubkey.push_back(0x87);
  blinded.witness.range_proof.assign(300, 0x88);
  blinded.witness.surjection_proof.assign(67, 0x99);
  tx.vout.push_back(blinded);

  TxOut fee;
  fee.asset = ConfidentialAsset::FromExplicit(asset);
  fee.value = ConfidentialValue::FromAmount(1234);
  tx.vout.push_back(fee);
  return tx;
}

}  // namespace

int main() {
  using namespace ctwallet::primitives;
  const auto tx = BuildTransaction();

  {
    const auto value = ConfidentialValue::FromAmount(0x0102);
    const std::vector<std::uint8_t> expected = {0x01, 0, 0, 0, 0, 0, 0, 0x01, 0x02};
    if (value.bytes != expected || value.Explicit().value_or(0) != 0x0102) {
      std::cerr << "explicit values must be big-endian\n";
      return 1;
    }
  }

  if (!tx.vout[1].IsFee() || tx.vout[0].IsFee()) {
    std::cerr << "fee output detection failed\n";
    return 1;
  }

  std::vector<std::uint8_t> full;
  serialize::SerializeTransaction(tx, &full);
  std::vector<std::uint8_t> stripped;
  serialize::SerializeTransaction(tx, &stripped, false);
  if (full.size() <= stripped.size() || full[4] != 0x01 || stripped[4] != 0x00) {
    std::cerr << "witness flag byte not written as expected\n";
    return 1;
  }

  {
    Transaction decoded;
    std::size_t offset = 0;
    std::string error;
    if (!serialize::DeserializeTransaction(full, &offset, &decoded, &error) ||
        offset != full.size()) {
      std::cerr << "decode failed: " << error << "\n";
      return 1;
    }
    if (!(decoded == tx)) {
      std::cerr << "decoded transaction differs\n";
      return 1;
    }
  }

  {
    const auto sizes = serialize::MeasureTransactionSizes(tx);
    if (sizes.base_size != stripped.size() || sizes.total_size != full.size() ||
        sizes.Weight() != stripped.size() * 3 + full.size() ||
        sizes.VirtualSize() != (sizes.Weight() + 3) / 4) {
      std::cerr << "size accounting mismatch\n";
      return 1;
    }
  }

  // The txid ignores witness data; the wtxid does not.
  {
    auto resigned = tx;
    resigned.vin[0].witness.script_witness[0][5] ^= 0x01;
    if (ComputeTxId(resigned) != ComputeTxId(tx)) {
      std::cerr << "txid depends on witness\n";
      return 1;
    }
    if (ComputeWTxId(resigned) == ComputeWTxId(tx)) {
      std::cerr << "wtxid ignores witness\n";
      return 1;
    }
    auto changed = tx;
    changed.lock_time += 1;
    if (ComputeTxId(changed) == ComputeTxId(tx)) {
      std::cerr << "txid ignores lock time\n";
      return 1;
    }
  }

  {
    Hash256 txid{};
    txid[0] = 0xAB;
    const auto hex = TxIdToHex(txid);
    if (hex.size() != 64 || hex.substr(62) != "ab") {
      std::cerr << "txid hex is not byte-reversed\n";
      return 1;
    }
  }

  // Truncated or mangled encodings are rejected.
  {
    auto truncated = full;
    truncated.resize(full.size() - 10);
    Transaction decoded;
    std::size_t offset = 0;
    if (serialize::DeserializeTransaction(truncated, &offset, &decoded)) {
      std::cerr << "truncated transaction accepted\n";
      return 1;
    }
    auto bad_flags = full;
    bad_flags[4] = 0x02;
    offset = 0;
    if (serialize::DeserializeTransaction(bad_flags, &offset, &decoded)) {
      std::cerr << "unknown flags accepted\n";
      return 1;
    }
  }

  return 0;
}
