#pragma once

#include <array>
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/wallet_config.hpp"
#include "crypto/confidential.hpp"
#include "net/electrum_api.hpp"
#include "util/worker_pool.hpp"
#include "wallet/address_book.hpp"
#include "wallet/chain_state.hpp"
#include "wallet/key_ring.hpp"

namespace ctwallet::wallet {

enum class SyncPhase {
  kIdle,
  kDiscovering,
  kFetching,
  kReconciling,
  kFailed,
};

const char* SyncPhaseName(SyncPhase phase);

struct RoundStats {
  std::size_t tip_requests{0};
  std::size_t header_requests{0};
  std::size_t subscribe_requests{0};
  std::size_t history_requests{0};
  std::size_t transaction_requests{0};
  std::size_t transport_retries{0};
  // Scripthashes whose history was downloaded because the status changed.
  std::size_t refetched_scripthashes{0};
  std::size_t new_transactions{0};
  std::size_t restarts{0};
  std::optional<std::int32_t> reorg_height;
};

struct SyncResult {
  ChainState state;
  RoundStats stats;
};

// Runs one Discovering -> Fetching -> Reconciling round against the server.
// A round never mutates the snapshot it starts from: it returns a complete
// replacement, which the caller commits (persist, then swap) or drops.
class SyncEngine {
 public:
  SyncEngine(const KeyRing& keys, AddressBook& addresses, net::ElectrumApi& api,
             const crypto::ConfidentialEngine& engine, const config::SyncConfig& config);

  // Transport errors are retried with backoff up to max_transport_attempts
  // and then propagated unchanged. Throws kServerInconsistent when a
  // status never matches its history, kReorgDetected when the tip keeps
  // moving during the round, kProtocolError for malformed responses.
  SyncResult RunRound(const ChainState& previous);

  SyncPhase phase() const noexcept { return phase_.load(); }

 private:
  struct Counters {
    std::atomic<std::size_t> tip{0};
    std::atomic<std::size_t> header{0};
    std::atomic<std::size_t> subscribe{0};
    std::atomic<std::size_t> history{0};
    std::atomic<std::size_t> transaction{0};
    std::atomic<std::size_t> retries{0};
  };

  struct Discovered {
    Chain chain{Chain::kExternal};
    std::uint32_t index{0};
    std::optional<std::string> status;
  };

  // nullopt when the tip moved while fetching; `moved_tip` then holds it.
  std::optional<SyncResult> RunAttempt(const ChainState& previous, const net::ServerTip& tip,
                                       Counters* counters, net::ServerTip* moved_tip);
  ChainState DetectReorg(const ChainState& previous, const TipInfo& tip, Counters* counters,
                         std::optional<std::int32_t>* fork_height);
  std::map<std::string, Discovered> Discover(Counters* counters,
                                             std::array<std::uint32_t, 2>* first_unused);
  // Refetches until the history hashes to `status`, re-subscribing between
  // attempts; `status` ends as the value the history was verified against.
  std::vector<HistoryEntry> FetchVerifiedHistory(const std::string& scripthash,
                                                 std::optional<std::string>* status,
                                                 Counters* counters);
  // Records every output of `tx` paying one of our scripts that has no
  // entry yet.
  void UnblindOwnedOutputs(const primitives::Hash256& txid, const primitives::Transaction& tx,
                           ChainState* state) const;

  template <typename T>
  T WithRetry(std::atomic<std::size_t>* counter, Counters* counters,
              const std::function<T()>& call);

  const KeyRing& keys_;
  AddressBook& addresses_;
  net::ElectrumApi& api_;
  const crypto::ConfidentialEngine& engine_;
  config::SyncConfig config_;
  util::BoundedWorkerPool pool_;
  std::atomic<SyncPhase> phase_{SyncPhase::kIdle};
};

}  // namespace ctwallet::wallet
