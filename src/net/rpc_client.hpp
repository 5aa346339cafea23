#pragma once

#include <chrono>
#include <string>

#include "nlohmann/json.hpp"

namespace ctwallet::net {

// Request/response channel to an Electrum server. The transport is provided
// by the embedding application; implementations must honour `timeout` and
// throw wallet::WalletError with kNetworkTimeout or kNetworkDisconnected on
// transport failure. Server-side JSON-RPC errors are thrown as
// kProtocolError. Implementations must be safe to call from several
// threads at once.
class RpcClient {
 public:
  virtual ~RpcClient() = default;

  virtual nlohmann::json Call(const std::string& method, const nlohmann::json& params,
                              std::chrono::milliseconds timeout) = 0;
};

}  // namespace ctwallet::net
