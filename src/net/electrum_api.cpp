#include "net/electrum_api.hpp"

#include <limits>
#include <string>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::net {

namespace {

using wallet::ErrorCode;
using wallet::WalletError;

[[noreturn]] void Malformed(const std::string& method, const std::string& what) {
  throw WalletError(ErrorCode::kProtocolError, "electrum " + method + ": " + what);
}

std::vector<std::uint8_t> DecodeHexField(const nlohmann::json& value, const std::string& method) {
  if (!value.is_string()) {
    Malformed(method, "expected hex string");
  }
  std::vector<std::uint8_t> bytes;
  if (!util::HexDecode(value.get<std::string>(), &bytes)) {
    Malformed(method, "invalid hex");
  }
  return bytes;
}

primitives::Hash256 DecodeHashField(const nlohmann::json& value, const std::string& method) {
  if (!value.is_string()) {
    Malformed(method, "expected hash string");
  }
  const auto hash = util::ParseHash256Hex(value.get<std::string>());
  if (!hash) {
    Malformed(method, "invalid hash");
  }
  return *hash;
}

std::int32_t DecodeHeight(const nlohmann::json& value, const std::string& method) {
  if (!value.is_number_integer()) {
    Malformed(method, "expected integer height");
  }
  const auto height = value.get<std::int64_t>();
  if (height < -1 || height > std::numeric_limits<std::int32_t>::max()) {
    Malformed(method, "height out of range");
  }
  return static_cast<std::int32_t>(height);
}

}  // namespace

ElectrumApi::ElectrumApi(RpcClient& client, std::chrono::milliseconds timeout)
    : client_(client), timeout_(timeout) {}

nlohmann::json ElectrumApi::Call(const std::string& method, const nlohmann::json& params) {
  return client_.Call(method, params, timeout_);
}

std::optional<std::string> ElectrumApi::SubscribeScripthash(const std::string& scripthash) {
  static const std::string kMethod = "blockchain.scripthash.subscribe";
  const auto result = Call(kMethod, nlohmann::json::array({scripthash}));
  if (result.is_null()) {
    return std::nullopt;
  }
  if (!result.is_string()) {
    Malformed(kMethod, "status must be a string or null");
  }
  auto status = result.get<std::string>();
  std::vector<std::uint8_t> raw;
  if (status.size() != 64 || !util::HexDecode(status, &raw)) {
    Malformed(kMethod, "status must be 32-byte hex");
  }
  return status;
}

std::vector<wallet::HistoryEntry> ElectrumApi::GetHistory(const std::string& scripthash) {
  static const std::string kMethod = "blockchain.scripthash.get_history";
  const auto result = Call(kMethod, nlohmann::json::array({scripthash}));
  if (!result.is_array()) {
    Malformed(kMethod, "expected array");
  }
  std::vector<wallet::HistoryEntry> history;
  history.reserve(result.size());
  for (const auto& item : result) {
    if (!item.is_object() || !item.contains("tx_hash") || !item.contains("height")) {
      Malformed(kMethod, "history entry lacks tx_hash/height");
    }
    wallet::HistoryEntry entry;
    entry.txid = DecodeHashField(item.at("tx_hash"), kMethod);
    entry.height = DecodeHeight(item.at("height"), kMethod);
    history.push_back(entry);
  }
  return history;
}

primitives::Transaction ElectrumApi::GetTransaction(const primitives::Hash256& txid) {
  static const std::string kMethod = "blockchain.transaction.get";
  const auto txid_hex = primitives::TxIdToHex(txid);
  const auto raw = DecodeHexField(Call(kMethod, nlohmann::json::array({txid_hex})), kMethod);
  primitives::Transaction tx;
  std::size_t offset = 0;
  std::string error;
  if (!primitives::serialize::DeserializeTransaction(raw, &offset, &tx, &error) ||
      offset != raw.size()) {
    Malformed(kMethod, "undecodable transaction " + txid_hex + ": " + error);
  }
  if (primitives::ComputeTxId(tx) != txid) {
    throw WalletError(ErrorCode::kServerInconsistent,
                      "electrum served bytes that do not hash to " + txid_hex);
  }
  return tx;
}

ServerTip ElectrumApi::GetTip() {
  static const std::string kMethod = "blockchain.headers.subscribe";
  const auto result = Call(kMethod, nlohmann::json::array());
  if (!result.is_object() || !result.contains("height") || !result.contains("hex")) {
    Malformed(kMethod, "expected {height, hex}");
  }
  ServerTip tip;
  tip.height = DecodeHeight(result.at("height"), kMethod);
  if (tip.height < 0) {
    Malformed(kMethod, "negative tip height");
  }
  tip.header = DecodeHexField(result.at("hex"), kMethod);
  if (tip.header.empty()) {
    Malformed(kMethod, "empty header");
  }
  return tip;
}

std::vector<std::uint8_t> ElectrumApi::GetHeader(std::int32_t height) {
  static const std::string kMethod = "blockchain.block.header";
  auto header = DecodeHexField(Call(kMethod, nlohmann::json::array({height})), kMethod);
  if (header.empty()) {
    Malformed(kMethod, "empty header");
  }
  return header;
}

primitives::Hash256 ElectrumApi::Broadcast(const primitives::Transaction& tx) {
  static const std::string kMethod = "blockchain.transaction.broadcast";
  std::vector<std::uint8_t> raw;
  primitives::serialize::SerializeTransaction(tx, &raw);
  const auto result = Call(kMethod, nlohmann::json::array({util::HexEncode(raw)}));
  const auto txid = DecodeHashField(result, kMethod);
  if (txid != primitives::ComputeTxId(tx)) {
    throw WalletError(ErrorCode::kServerInconsistent, "electrum acknowledged a different txid");
  }
  return txid;
}

std::optional<std::string> ComputeStatusHash(const std::vector<wallet::HistoryEntry>& history) {
  if (history.empty()) {
    return std::nullopt;
  }
  std::string preimage;
  for (const auto& entry : history) {
    preimage += primitives::TxIdToHex(entry.txid);
    preimage += ':';
    preimage += std::to_string(entry.height);
    preimage += ':';
  }
  const auto digest = crypto::Sha256(std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(preimage.data()), preimage.size()));
  return util::HexEncode(digest);
}

primitives::Hash256 BlockHashFromHeader(std::span<const std::uint8_t> header) {
  return crypto::DoubleSha256(header);
}

}  // namespace ctwallet::net
