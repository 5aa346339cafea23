#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

#include "net/rpc_client.hpp"
#include "primitives/transaction.hpp"
#include "wallet/chain_state.hpp"

namespace ctwallet::net {

struct ServerTip {
  std::int32_t height{0};
  std::vector<std::uint8_t> header;
};

// Typed, validating wrapper over the Electrum methods the wallet uses. Every
// response is treated as untrusted: malformed JSON or hex raises
// WalletError(kProtocolError); a transaction whose bytes do not hash to the
// requested txid raises kServerInconsistent.
class ElectrumApi {
 public:
  ElectrumApi(RpcClient& client, std::chrono::milliseconds timeout);

  std::optional<std::string> SubscribeScripthash(const std::string& scripthash);
  std::vector<wallet::HistoryEntry> GetHistory(const std::string& scripthash);
  primitives::Transaction GetTransaction(const primitives::Hash256& txid);
  ServerTip GetTip();
  std::vector<std::uint8_t> GetHeader(std::int32_t height);
  primitives::Hash256 Broadcast(const primitives::Transaction& tx);

 private:
  nlohmann::json Call(const std::string& method, const nlohmann::json& params);

  RpcClient& client_;
  std::chrono::milliseconds timeout_;
};

// sha256 over "txid:height:" for every entry in server order, hex encoded.
// Empty histories have no status.
std::optional<std::string> ComputeStatusHash(const std::vector<wallet::HistoryEntry>& history);

// Double SHA-256 of the serialized header (internal byte order).
primitives::Hash256 BlockHashFromHeader(std::span<const std::uint8_t> header);

}  // namespace ctwallet::net
