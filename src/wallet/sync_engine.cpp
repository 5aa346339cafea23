#include "wallet/sync_engine.hpp"

#include <algorithm>
#include <set>
#include <thread>
#include <utility>

#include "primitives/txid.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"
#include "wallet/liquidex.hpp"
#include "wallet/reorg.hpp"

namespace ctwallet::wallet {

namespace {

constexpr const char* kLogComponent = "sync";

bool IsTransportError(const WalletError& error) {
  return error.code() == ErrorCode::kNetworkTimeout ||
         error.code() == ErrorCode::kNetworkDisconnected;
}

// Electrum lists confirmed entries by ascending height, then the mempool.
void CheckHistoryShape(const std::string& scripthash, const std::vector<HistoryEntry>& history) {
  std::set<primitives::Hash256> seen;
  std::int32_t last_height = 0;
  bool in_mempool = false;
  for (const auto& entry : history) {
    if (!seen.insert(entry.txid).second) {
      throw WalletError(ErrorCode::kServerInconsistent,
                        "history of " + scripthash + " lists " +
                            primitives::TxIdToHex(entry.txid) + " twice");
    }
    if (entry.height <= 0) {
      in_mempool = true;
      continue;
    }
    if (in_mempool || entry.height < last_height) {
      throw WalletError(ErrorCode::kServerInconsistent,
                        "history of " + scripthash + " is out of order at " +
                            primitives::TxIdToHex(entry.txid) + " (height " +
                            std::to_string(entry.height) + ")");
    }
    last_height = entry.height;
  }
}

}  // namespace

const char* SyncPhaseName(SyncPhase phase) {
  switch (phase) {
    case SyncPhase::kIdle:
      return "idle";
    case SyncPhase::kDiscovering:
      return "discovering";
    case SyncPhase::kFetching:
      return "fetching";
    case SyncPhase::kReconciling:
      return "reconciling";
    case SyncPhase::kFailed:
      return "failed";
  }
  return "unknown";
}

SyncEngine::SyncEngine(const KeyRing& keys, AddressBook& addresses, net::ElectrumApi& api,
                       const crypto::ConfidentialEngine& engine, const config::SyncConfig& config)
    : keys_(keys),
      addresses_(addresses),
      api_(api),
      engine_(engine),
      config_(config),
      pool_(config.max_parallel_requests) {}

template <typename T>
T SyncEngine::WithRetry(std::atomic<std::size_t>* counter, Counters* counters,
                        const std::function<T()>& call) {
  for (std::uint32_t attempt = 1;; ++attempt) {
    counter->fetch_add(1, std::memory_order_relaxed);
    try {
      return call();
    } catch (const WalletError& error) {
      if (!IsTransportError(error) || attempt >= config_.max_transport_attempts) {
        throw;
      }
      counters->retries.fetch_add(1, std::memory_order_relaxed);
      util::LogWarn(kLogComponent, std::string(error.what()) + "; retry " +
                                       std::to_string(attempt) + "/" +
                                       std::to_string(config_.max_transport_attempts - 1));
      std::this_thread::sleep_for(config_.retry_backoff * attempt);
    }
  }
}

SyncResult SyncEngine::RunRound(const ChainState& previous) {
  try {
    Counters counters;
    phase_ = SyncPhase::kDiscovering;
    auto tip = WithRetry<net::ServerTip>(&counters.tip, &counters,
                                         [&] { return api_.GetTip(); });
    for (std::uint32_t attempt = 1;; ++attempt) {
      net::ServerTip moved_tip;
      auto result = RunAttempt(previous, tip, &counters, &moved_tip);
      if (result) {
        auto& stats = result->stats;
        stats.tip_requests = counters.tip.load();
        stats.header_requests = counters.header.load();
        stats.subscribe_requests = counters.subscribe.load();
        stats.history_requests = counters.history.load();
        stats.transaction_requests = counters.transaction.load();
        stats.transport_retries = counters.retries.load();
        stats.restarts = attempt - 1;
        phase_ = SyncPhase::kIdle;
        util::LogInfo(kLogComponent,
                      "round done at height " + std::to_string(result->state.tip.height) +
                          ": " + std::to_string(stats.refetched_scripthashes) +
                          " histories, " + std::to_string(stats.new_transactions) +
                          " new transactions, " + std::to_string(stats.subscribe_requests) +
                          " status requests");
        return std::move(*result);
      }
      if (attempt >= config_.max_status_attempts) {
        throw WalletError(ErrorCode::kReorgDetected,
                          "tip kept moving during sync (now " +
                              std::to_string(moved_tip.height) + ")");
      }
      util::LogWarn(kLogComponent, "tip moved to " + std::to_string(moved_tip.height) +
                                       " mid-round; restarting");
      tip = std::move(moved_tip);
    }
  } catch (const std::exception& error) {
    phase_ = SyncPhase::kFailed;
    util::LogError(kLogComponent, error.what());
    throw;
  }
}

std::optional<SyncResult> SyncEngine::RunAttempt(const ChainState& previous,
                                                 const net::ServerTip& tip, Counters* counters,
                                                 net::ServerTip* moved_tip) {
  phase_ = SyncPhase::kDiscovering;
  const TipInfo tip_info{tip.height, net::BlockHashFromHeader(tip.header)};

  SyncResult result;
  ChainState state = DetectReorg(previous, tip_info, counters, &result.stats.reorg_height);
  auto first_unused = state.first_unused;
  const auto discovered = Discover(counters, &first_unused);

  phase_ = SyncPhase::kFetching;
  std::vector<std::string> stale;
  for (const auto& [scripthash, found] : discovered) {
    const auto cached = state.scripthashes.find(scripthash);
    const bool known = cached != state.scripthashes.end();
    const std::optional<std::string> cached_status = known ? cached->second.status : std::nullopt;
    // A known entry without a status was invalidated by a reorg.
    if (found.status != cached_status || (known && !cached_status)) {
      stale.push_back(scripthash);
    }
  }
  std::vector<std::optional<std::string>> statuses(stale.size());
  std::vector<std::vector<HistoryEntry>> histories(stale.size());
  pool_.ForEach(stale.size(), [&](std::size_t i) {
    statuses[i] = discovered.at(stale[i]).status;
    histories[i] = FetchVerifiedHistory(stale[i], &statuses[i], counters);
  });
  result.stats.refetched_scripthashes = stale.size();

  for (std::size_t i = 0; i < stale.size(); ++i) {
    const auto& found = discovered.at(stale[i]);
    if (!statuses[i]) {
      state.scripthashes.erase(stale[i]);
      continue;
    }
    ScripthashState entry;
    entry.chain = found.chain;
    entry.index = found.index;
    entry.status = statuses[i];
    entry.history = std::move(histories[i]);
    state.scripthashes[stale[i]] = std::move(entry);
  }

  std::map<primitives::Hash256, std::int32_t> heights;
  for (const auto& [scripthash, entry] : state.scripthashes) {
    for (const auto& item : entry.history) {
      auto [it, inserted] = heights.emplace(item.txid, item.height);
      if (!inserted) {
        it->second = std::max(it->second, item.height);
      }
    }
  }

  std::vector<primitives::Hash256> missing;
  for (const auto& [txid, height] : heights) {
    if (state.transactions.count(txid) == 0) {
      missing.push_back(txid);
    }
  }
  std::vector<primitives::Transaction> fetched(missing.size());
  pool_.ForEach(missing.size(), [&](std::size_t i) {
    fetched[i] = WithRetry<primitives::Transaction>(
        &counters->transaction, counters, [&] { return api_.GetTransaction(missing[i]); });
  });

  std::set<std::int32_t> confirmed;
  for (const auto& [txid, height] : heights) {
    if (height > 0) {
      confirmed.insert(height);
    }
  }
  std::vector<std::int32_t> unknown_heights;
  for (const auto height : confirmed) {
    if (state.block_hashes.count(height) == 0 && height != tip_info.height) {
      unknown_heights.push_back(height);
    }
  }
  std::vector<primitives::Hash256> header_hashes(unknown_heights.size());
  pool_.ForEach(unknown_heights.size(), [&](std::size_t i) {
    const auto header = WithRetry<std::vector<std::uint8_t>>(
        &counters->header, counters, [&] { return api_.GetHeader(unknown_heights[i]); });
    header_hashes[i] = net::BlockHashFromHeader(header);
  });

  // Every fetch of this attempt has joined. Only now is the tip rechecked
  // and the snapshot rebuilt.
  phase_ = SyncPhase::kReconciling;
  auto tip_after = WithRetry<net::ServerTip>(&counters->tip, counters,
                                             [&] { return api_.GetTip(); });
  if (tip_after.height != tip.height || tip_after.header != tip.header) {
    *moved_tip = std::move(tip_after);
    return std::nullopt;
  }

  for (auto it = state.transactions.begin(); it != state.transactions.end();) {
    if (heights.count(it->first) == 0) {
      util::LogInfo(kLogComponent, "dropping " + primitives::TxIdToHex(it->first) +
                                       ", no longer in any history");
      it = state.transactions.erase(it);
    } else {
      ++it;
    }
  }
  for (auto it = state.owned_outputs.begin(); it != state.owned_outputs.end();) {
    if (heights.count(it->first.txid) == 0) {
      it = state.owned_outputs.erase(it);
    } else {
      ++it;
    }
  }
  for (std::size_t i = 0; i < missing.size(); ++i) {
    UnblindOwnedOutputs(missing[i], fetched[i], &state);
    state.transactions[missing[i]] = std::move(fetched[i]);
  }
  result.stats.new_transactions = missing.size();

  // A cached transaction can pay an address that only became visible this
  // round, so every refreshed history gets its cached transactions rescanned.
  std::set<primitives::Hash256> rescan;
  for (const auto& scripthash : stale) {
    const auto entry = state.scripthashes.find(scripthash);
    if (entry == state.scripthashes.end()) {
      continue;
    }
    for (const auto& item : entry->second.history) {
      if (!std::binary_search(missing.begin(), missing.end(), item.txid)) {
        rescan.insert(item.txid);
      }
    }
  }
  for (const auto& txid : rescan) {
    UnblindOwnedOutputs(txid, state.transactions.at(txid), &state);
  }
  state.tx_heights = std::move(heights);

  for (auto it = state.block_hashes.begin(); it != state.block_hashes.end();) {
    if (confirmed.count(it->first) == 0) {
      it = state.block_hashes.erase(it);
    } else {
      ++it;
    }
  }
  for (std::size_t i = 0; i < unknown_heights.size(); ++i) {
    state.block_hashes[unknown_heights[i]] = header_hashes[i];
  }
  if (confirmed.count(tip_info.height) != 0) {
    state.block_hashes[tip_info.height] = tip_info.hash;
  }
  state.tip = tip_info;
  state.first_unused = first_unused;

  result.state = std::move(state);
  return result;
}

ChainState SyncEngine::DetectReorg(const ChainState& previous, const TipInfo& tip,
                                   Counters* counters, std::optional<std::int32_t>* fork_height) {
  if (previous.tip.height < 0 || previous.tip == tip) {
    return previous;
  }
  std::vector<std::int32_t> heights;
  for (const auto& [height, hash] : previous.block_hashes) {
    if (height <= tip.height) {
      heights.push_back(height);
    }
  }
  if (previous.tip.height <= tip.height &&
      previous.block_hashes.count(previous.tip.height) == 0) {
    heights.push_back(previous.tip.height);
  }

  ChainFacts facts;
  facts.tip = tip;
  std::vector<primitives::Hash256> hashes(heights.size());
  pool_.ForEach(heights.size(), [&](std::size_t i) {
    if (heights[i] == tip.height) {
      hashes[i] = tip.hash;
      return;
    }
    const auto header = WithRetry<std::vector<std::uint8_t>>(
        &counters->header, counters, [&] { return api_.GetHeader(heights[i]); });
    hashes[i] = net::BlockHashFromHeader(header);
  });
  for (std::size_t i = 0; i < heights.size(); ++i) {
    facts.block_hashes[heights[i]] = hashes[i];
  }

  auto outcome = ApplyChainFacts(previous, facts);
  *fork_height = outcome.fork_height;
  if (outcome.fork_height) {
    util::LogWarn(kLogComponent, "reorg at height " + std::to_string(*outcome.fork_height) +
                                     ", " + std::to_string(outcome.invalidated_heights.size()) +
                                     " heights invalidated");
  }
  return std::move(outcome.state);
}

std::map<std::string, SyncEngine::Discovered> SyncEngine::Discover(
    Counters* counters, std::array<std::uint32_t, 2>* first_unused) {
  std::map<std::string, Discovered> discovered;
  for (const auto chain : {Chain::kExternal, Chain::kInternal}) {
    const auto slot = static_cast<std::size_t>(chain);
    const std::uint64_t floor =
        std::max<std::uint64_t>((*first_unused)[slot], addresses_.FirstUnusedIndex(chain));
    std::int64_t last_used = -1;
    std::uint64_t next = 0;
    while (true) {
      const std::uint64_t end =
          std::min<std::uint64_t>(std::max<std::uint64_t>(last_used + 1, floor) +
                                      config_.gap_limit,
                                  std::uint64_t{kMaxDerivationIndex} + 1);
      if (next >= end) {
        break;
      }
      std::vector<Address> batch;
      batch.reserve(end - next);
      for (auto index = next; index < end; ++index) {
        batch.push_back(addresses_.AddressFor(chain, static_cast<std::uint32_t>(index)));
      }
      std::vector<std::optional<std::string>> statuses(batch.size());
      pool_.ForEach(batch.size(), [&](std::size_t i) {
        statuses[i] = WithRetry<std::optional<std::string>>(
            &counters->subscribe, counters,
            [&] { return api_.SubscribeScripthash(batch[i].scripthash); });
      });
      for (std::size_t i = 0; i < batch.size(); ++i) {
        if (statuses[i]) {
          last_used = std::max<std::int64_t>(last_used, batch[i].index);
        }
        discovered[batch[i].scripthash] = Discovered{chain, batch[i].index, statuses[i]};
      }
      next = end;
    }
    (*first_unused)[slot] =
        std::max<std::uint32_t>((*first_unused)[slot], static_cast<std::uint32_t>(last_used + 1));
    util::LogDebug(kLogComponent, std::string(chain == Chain::kExternal ? "external" : "internal") +
                                      " chain scanned to " + std::to_string(next) +
                                      ", first unused " +
                                      std::to_string((*first_unused)[slot]));
  }
  return discovered;
}

std::vector<HistoryEntry> SyncEngine::FetchVerifiedHistory(const std::string& scripthash,
                                                           std::optional<std::string>* status,
                                                           Counters* counters) {
  for (std::uint32_t attempt = 1;; ++attempt) {
    auto history = WithRetry<std::vector<HistoryEntry>>(
        &counters->history, counters, [&] { return api_.GetHistory(scripthash); });
    CheckHistoryShape(scripthash, history);
    if (net::ComputeStatusHash(history) == *status) {
      return history;
    }
    if (attempt >= config_.max_status_attempts) {
      throw WalletError(ErrorCode::kServerInconsistent,
                        "status of " + scripthash + " never matched its history after " +
                            std::to_string(attempt) + " attempts");
    }
    util::LogDebug(kLogComponent, "status/history mismatch for " + scripthash + ", refetching");
    *status = WithRetry<std::optional<std::string>>(
        &counters->subscribe, counters, [&] { return api_.SubscribeScripthash(scripthash); });
  }
}

void SyncEngine::UnblindOwnedOutputs(const primitives::Hash256& txid,
                                     const primitives::Transaction& tx, ChainState* state) const {
  for (std::uint32_t i = 0; i < tx.vout.size(); ++i) {
    const auto& output = tx.vout[i];
    if (output.script_pubkey.empty()) {
      continue;
    }
    const primitives::OutPoint outpoint{txid, i};
    if (state->owned_outputs.count(outpoint) != 0) {
      continue;
    }
    const auto address = addresses_.FindByScript(output.script_pubkey);
    if (!address) {
      continue;
    }
    auto blinding_key = keys_.BlindingPrivateKey(output.script_pubkey);
    auto secrets = crypto::UnblindTxOut(engine_, output, blinding_key);
    util::SecureWipe(blinding_key);
    if (!secrets) {
      // Maker outputs of a taken liquidex swap carry no rewindable proof.
      secrets = LiquidexUnblind(keys_.blinding_master(), engine_, tx, i, state->liquidex_assets);
    }
    if (!secrets) {
      util::LogWarn(kLogComponent, "cannot unblind " + primitives::TxIdToHex(txid) + ":" +
                                       std::to_string(i) + " paid to our script; ignoring it");
      continue;
    }
    state->owned_outputs[outpoint] = OwnedOutput{address->chain, address->index, *secrets};
  }
}

}  // namespace ctwallet::wallet
