#include "wallet/chain_state.hpp"

#include <algorithm>
#include <set>

#include "primitives/serialize.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

namespace ser = primitives::serialize;

constexpr std::uint8_t kSnapshotSchema = 2;

[[noreturn]] void Corrupt(const std::string& what) {
  throw WalletError(ErrorCode::kStoreCorrupt, "wallet snapshot: " + what);
}

void WriteHash(std::vector<std::uint8_t>* out, const primitives::Hash256& hash) {
  out->insert(out->end(), hash.begin(), hash.end());
}

void WriteString(std::vector<std::uint8_t>* out, const std::string& text) {
  ser::WriteVarBytes(out, std::span<const std::uint8_t>(
                              reinterpret_cast<const std::uint8_t*>(text.data()), text.size()));
}

void WriteInt32(std::vector<std::uint8_t>* out, std::int32_t value) {
  ser::WriteUint32(out, static_cast<std::uint32_t>(value));
}

// Cursor over a plaintext buffer; every read failure is fatal.
class Reader {
 public:
  Reader(const std::vector<std::uint8_t>& data, std::size_t* offset)
      : data_(data), offset_(offset) {}

  std::uint8_t Byte() {
    if (*offset_ >= data_.size()) Corrupt("truncated");
    return data_[(*offset_)++];
  }
  std::uint32_t U32() {
    std::uint32_t value = 0;
    if (!ser::ReadUint32(data_, offset_, &value)) Corrupt("truncated");
    return value;
  }
  std::uint64_t U64() {
    std::uint64_t value = 0;
    if (!ser::ReadUint64(data_, offset_, &value)) Corrupt("truncated");
    return value;
  }
  std::int32_t I32() { return static_cast<std::int32_t>(U32()); }
  std::uint64_t Count() {
    std::uint64_t value = 0;
    if (!ser::ReadVarInt(data_, offset_, &value) || value > data_.size()) Corrupt("bad count");
    return value;
  }
  std::vector<std::uint8_t> Bytes() {
    std::vector<std::uint8_t> out;
    if (!ser::ReadVarBytes(data_, offset_, &out)) Corrupt("truncated");
    return out;
  }
  std::string String() {
    const auto bytes = Bytes();
    return std::string(bytes.begin(), bytes.end());
  }
  std::array<std::uint8_t, 32> Hash() {
    if (*offset_ > data_.size() || data_.size() - *offset_ < 32) Corrupt("truncated");
    std::array<std::uint8_t, 32> out{};
    std::copy_n(data_.begin() + *offset_, 32, out.begin());
    *offset_ += 32;
    return out;
  }
  Chain ReadChain() {
    const auto value = Byte();
    if (value > 1) Corrupt("bad chain");
    return static_cast<Chain>(value);
  }

 private:
  const std::vector<std::uint8_t>& data_;
  std::size_t* offset_;
};

}  // namespace

std::vector<std::uint8_t> ChainState::Serialize() const {
  std::vector<std::uint8_t> out;
  ser::WriteVarInt(&out, scripthashes.size());
  for (const auto& [scripthash, entry] : scripthashes) {
    WriteString(&out, scripthash);
    out.push_back(static_cast<std::uint8_t>(entry.chain));
    ser::WriteUint32(&out, entry.index);
    out.push_back(entry.status ? 1 : 0);
    if (entry.status) {
      WriteString(&out, *entry.status);
    }
    ser::WriteVarInt(&out, entry.history.size());
    for (const auto& item : entry.history) {
      WriteHash(&out, item.txid);
      WriteInt32(&out, item.height);
    }
  }
  ser::WriteVarInt(&out, tx_heights.size());
  for (const auto& [txid, height] : tx_heights) {
    WriteHash(&out, txid);
    WriteInt32(&out, height);
  }
  ser::WriteVarInt(&out, transactions.size());
  for (const auto& [txid, tx] : transactions) {
    WriteHash(&out, txid);
    std::vector<std::uint8_t> raw;
    ser::SerializeTransaction(tx, &raw);
    ser::WriteVarBytes(&out, raw);
  }
  ser::WriteVarInt(&out, owned_outputs.size());
  for (const auto& [outpoint, owned] : owned_outputs) {
    WriteHash(&out, outpoint.txid);
    ser::WriteUint32(&out, outpoint.index);
    out.push_back(static_cast<std::uint8_t>(owned.chain));
    ser::WriteUint32(&out, owned.index);
    WriteHash(&out, owned.secrets.asset);
    ser::WriteUint64(&out, owned.secrets.value);
    WriteHash(&out, owned.secrets.asset_blinder);
    WriteHash(&out, owned.secrets.value_blinder);
  }
  ser::WriteVarInt(&out, block_hashes.size());
  for (const auto& [height, hash] : block_hashes) {
    WriteInt32(&out, height);
    WriteHash(&out, hash);
  }
  WriteInt32(&out, tip.height);
  WriteHash(&out, tip.hash);
  ser::WriteUint32(&out, first_unused[0]);
  ser::WriteUint32(&out, first_unused[1]);
  ser::WriteVarInt(&out, liquidex_assets.size());
  for (const auto& asset : liquidex_assets) {
    WriteHash(&out, asset);
  }
  return out;
}

ChainState ChainState::Deserialize(const std::vector<std::uint8_t>& data, std::size_t* offset) {
  Reader in(data, offset);
  ChainState state;
  for (auto n = in.Count(); n > 0; --n) {
    auto scripthash = in.String();
    ScripthashState entry;
    entry.chain = in.ReadChain();
    entry.index = in.U32();
    if (in.Byte() != 0) {
      entry.status = in.String();
    }
    for (auto h = in.Count(); h > 0; --h) {
      HistoryEntry item;
      item.txid = in.Hash();
      item.height = in.I32();
      entry.history.push_back(item);
    }
    state.scripthashes.emplace(std::move(scripthash), std::move(entry));
  }
  for (auto n = in.Count(); n > 0; --n) {
    const auto txid = in.Hash();
    state.tx_heights[txid] = in.I32();
  }
  for (auto n = in.Count(); n > 0; --n) {
    const auto txid = in.Hash();
    const auto raw = in.Bytes();
    std::size_t tx_offset = 0;
    primitives::Transaction tx;
    if (!ser::DeserializeTransaction(raw, &tx_offset, &tx) || tx_offset != raw.size()) {
      Corrupt("bad transaction");
    }
    state.transactions.emplace(txid, std::move(tx));
  }
  for (auto n = in.Count(); n > 0; --n) {
    primitives::OutPoint outpoint;
    outpoint.txid = in.Hash();
    outpoint.index = in.U32();
    OwnedOutput owned;
    owned.chain = in.ReadChain();
    owned.index = in.U32();
    owned.secrets.asset = in.Hash();
    owned.secrets.value = in.U64();
    owned.secrets.asset_blinder = in.Hash();
    owned.secrets.value_blinder = in.Hash();
    state.owned_outputs.emplace(outpoint, owned);
  }
  for (auto n = in.Count(); n > 0; --n) {
    const auto height = in.I32();
    state.block_hashes[height] = in.Hash();
  }
  state.tip.height = in.I32();
  state.tip.hash = in.Hash();
  state.first_unused[0] = in.U32();
  state.first_unused[1] = in.U32();
  for (auto n = in.Count(); n > 0; --n) {
    state.liquidex_assets.insert(in.Hash());
  }
  return state;
}

std::vector<Utxo> ComputeUtxos(const ChainState& state) {
  std::set<primitives::OutPoint> spent;
  for (const auto& [txid, tx] : state.transactions) {
    for (const auto& in : tx.vin) {
      spent.insert(in.prevout);
    }
  }
  std::vector<Utxo> utxos;
  for (const auto& [outpoint, owned] : state.owned_outputs) {
    if (spent.count(outpoint) != 0) {
      continue;
    }
    const auto tx_it = state.transactions.find(outpoint.txid);
    if (tx_it == state.transactions.end() || outpoint.index >= tx_it->second.vout.size()) {
      continue;
    }
    Utxo utxo;
    utxo.outpoint = outpoint;
    utxo.chain = owned.chain;
    utxo.index = owned.index;
    utxo.txout = tx_it->second.vout[outpoint.index];
    utxo.secrets = owned.secrets;
    const auto height_it = state.tx_heights.find(outpoint.txid);
    utxo.height = height_it == state.tx_heights.end() ? 0 : height_it->second;
    utxos.push_back(std::move(utxo));
  }
  std::sort(utxos.begin(), utxos.end(), [](const Utxo& a, const Utxo& b) {
    if (a.secrets.value != b.secrets.value) return a.secrets.value > b.secrets.value;
    return a.outpoint < b.outpoint;
  });
  return utxos;
}

std::vector<std::uint8_t> StoreSnapshot::Serialize() const {
  std::vector<std::uint8_t> out;
  out.push_back(kSnapshotSchema);
  ser::WriteVarBytes(&out, seed);
  WriteString(&out, network);
  const auto body = state.Serialize();
  out.insert(out.end(), body.begin(), body.end());
  return out;
}

StoreSnapshot StoreSnapshot::Deserialize(std::span<const std::uint8_t> plaintext) {
  std::vector<std::uint8_t> data(plaintext.begin(), plaintext.end());
  const util::WipeOnExit wipe_data(data);
  std::size_t offset = 0;
  Reader in(data, &offset);
  if (in.Byte() != kSnapshotSchema) {
    Corrupt("unknown schema");
  }
  StoreSnapshot snapshot;
  snapshot.seed = in.Bytes();
  try {
    snapshot.network = in.String();
    snapshot.state = ChainState::Deserialize(data, &offset);
    if (offset != data.size()) {
      Corrupt("trailing bytes");
    }
  } catch (...) {
    util::SecureWipe(snapshot.seed);
    throw;
  }
  return snapshot;
}

}  // namespace ctwallet::wallet
