#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "crypto/hash.hpp"
#include "net/electrum_api.hpp"
#include "net/rpc_client.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "util/hex.hpp"
#include "wallet/errors.hpp"

namespace {

using namespace ctwallet;
using wallet::ErrorCode;
using wallet::WalletError;

// Answers every method with a canned response and records what was asked.
class ScriptedClient : public net::RpcClient {
 public:
  nlohmann::json Call(const std::string& method, const nlohmann::json& params,
                      std::chrono::milliseconds timeout) override {
    last_method = method;
    last_params = params;
    last_timeout = timeout;
    const auto it = responses.find(method);
    if (it == responses.end()) {
      throw WalletError(ErrorCode::kNetworkDisconnected, "scripted: no response for " + method);
    }
    return it->second;
  }

  std::map<std::string, nlohmann::json> responses;
  std::string last_method;
  nlohmann::json last_params;
  std::chrono::milliseconds last_timeout{0};
};

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

primitives::Hash256 Filled(std::uint8_t value) {
  primitives::Hash256 out{};
  out.fill(value);
  return out;
}

primitives::Transaction SampleTx() {
  primitives::Transaction tx;
  primitives::TxIn in;
  in.prevout.txid = Filled(0x44);
  in.prevout.index = 1;
  tx.vin.push_back(in);
  primitives::TxOut out;
  primitives::AssetId asset = Filled(0x5a);
  out.asset = primitives::ConfidentialAsset::FromExplicit(asset);
  out.value = primitives::ConfidentialValue::FromAmount(1234);
  out.script_pubkey = {0x51};
  tx.vout.push_back(out);
  return tx;
}

std::string RawHex(const primitives::Transaction& tx) {
  std::vector<std::uint8_t> raw;
  primitives::serialize::SerializeTransaction(tx, &raw);
  return util::HexEncode(raw);
}

bool TestStatusHash() {
  if (net::ComputeStatusHash({})) {
    std::cerr << "empty history has a status\n";
    return false;
  }
  const std::vector<wallet::HistoryEntry> history = {{Filled(0x11), 100}, {Filled(0x22), 0}};
  const auto status = net::ComputeStatusHash(history);
  if (!status || *status != "ad5381ff2661c90bfc7a70d68bc90d377ed2305de8833464cf14412dde759371") {
    std::cerr << "status hash mismatch\n";
    return false;
  }
  return true;
}

bool TestWellFormed() {
  ScriptedClient client;
  net::ElectrumApi api(client, std::chrono::milliseconds(750));
  const auto tx = SampleTx();
  const auto txid = primitives::ComputeTxId(tx);

  client.responses["blockchain.scripthash.subscribe"] = nullptr;
  if (api.SubscribeScripthash("ab") || client.last_params != nlohmann::json::array({"ab"}) ||
      client.last_timeout != std::chrono::milliseconds(750)) {
    std::cerr << "null status or request shape mismatch\n";
    return false;
  }
  const std::string status(64, 'f');
  client.responses["blockchain.scripthash.subscribe"] = status;
  if (api.SubscribeScripthash("ab") != std::optional<std::string>(status)) {
    std::cerr << "status not returned\n";
    return false;
  }

  client.responses["blockchain.scripthash.get_history"] = nlohmann::json::array(
      {nlohmann::json{{"tx_hash", primitives::TxIdToHex(txid)}, {"height", 7}},
       nlohmann::json{{"tx_hash", std::string(64, '3')}, {"height", -1}, {"fee", 300}}});
  const auto history = api.GetHistory("ab");
  if (history.size() != 2 || history[0].txid != txid || history[0].height != 7 ||
      history[1].height != -1) {
    std::cerr << "history mismatch\n";
    return false;
  }

  client.responses["blockchain.transaction.get"] = RawHex(tx);
  if (!(api.GetTransaction(txid) == tx) ||
      client.last_params != nlohmann::json::array({primitives::TxIdToHex(txid)})) {
    std::cerr << "transaction fetch mismatch\n";
    return false;
  }

  const std::vector<std::uint8_t> header(80, 0x01);
  client.responses["blockchain.headers.subscribe"] =
      nlohmann::json{{"height", 321}, {"hex", util::HexEncode(header)}};
  const auto tip = api.GetTip();
  if (tip.height != 321 || tip.header != header) {
    std::cerr << "tip mismatch\n";
    return false;
  }
  client.responses["blockchain.block.header"] = util::HexEncode(header);
  if (api.GetHeader(12) != header || client.last_params != nlohmann::json::array({12})) {
    std::cerr << "header fetch mismatch\n";
    return false;
  }
  if (net::BlockHashFromHeader(header) != crypto::DoubleSha256(header)) {
    std::cerr << "block hash is not sha256d of the header\n";
    return false;
  }

  client.responses["blockchain.transaction.broadcast"] = primitives::TxIdToHex(txid);
  if (api.Broadcast(tx) != txid || client.last_params != nlohmann::json::array({RawHex(tx)})) {
    std::cerr << "broadcast mismatch\n";
    return false;
  }
  return true;
}

bool TestMalformed() {
  ScriptedClient client;
  net::ElectrumApi api(client, std::chrono::milliseconds(100));
  bool ok = true;

  client.responses["blockchain.scripthash.subscribe"] = 17;
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.SubscribeScripthash("ab"); },
                    "numeric status");
  client.responses["blockchain.scripthash.subscribe"] = "zz";
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.SubscribeScripthash("ab"); },
                    "short status");

  client.responses["blockchain.scripthash.get_history"] = nlohmann::json::object();
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetHistory("ab"); }, "history object");
  client.responses["blockchain.scripthash.get_history"] =
      nlohmann::json::array({nlohmann::json{{"tx_hash", "00"}, {"height", 1}}});
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetHistory("ab"); }, "short tx_hash");
  client.responses["blockchain.scripthash.get_history"] = nlohmann::json::array(
      {nlohmann::json{{"tx_hash", std::string(64, '0')}, {"height", "tall"}}});
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetHistory("ab"); }, "string height");
  client.responses["blockchain.scripthash.get_history"] = nlohmann::json::array(
      {nlohmann::json{{"tx_hash", std::string(64, '0')}, {"height", -2}}});
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetHistory("ab"); }, "height below -1");

  client.responses["blockchain.transaction.get"] = "0g";
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetTransaction(Filled(0x01)); },
                    "bad transaction hex");
  client.responses["blockchain.transaction.get"] = "0200";
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetTransaction(Filled(0x01)); },
                    "truncated transaction");
  client.responses["blockchain.transaction.get"] = RawHex(SampleTx());
  ok &= ExpectError(ErrorCode::kServerInconsistent, [&] { api.GetTransaction(Filled(0x01)); },
                    "transaction under the wrong txid");

  client.responses["blockchain.headers.subscribe"] = nlohmann::json{{"height", 5}};
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetTip(); }, "tip without header");
  client.responses["blockchain.block.header"] = "";
  ok &= ExpectError(ErrorCode::kProtocolError, [&] { api.GetHeader(1); }, "empty header");

  client.responses["blockchain.transaction.broadcast"] = std::string(64, '9');
  ok &= ExpectError(ErrorCode::kServerInconsistent, [&] { api.Broadcast(SampleTx()); },
                    "broadcast acknowledged under another txid");

  // Transport errors pass through untouched.
  client.responses.clear();
  ok &= ExpectError(ErrorCode::kNetworkDisconnected, [&] { api.GetTip(); }, "transport error");
  return ok;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestStatusHash();
  ok &= TestWellFormed();
  ok &= TestMalformed();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
