#include "wallet/wallet_context.hpp"

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <exception>
#include <set>
#include <string>
#include <utility>

#include "consensus/sighash.hpp"
#include "crypto/secp256k1_zkp_engine.hpp"
#include "net/electrum_api.hpp"
#include "primitives/txid.hpp"
#include "script/script.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

constexpr const char* kLogComponent = "wallet";

std::unique_ptr<crypto::ConfidentialEngine> EngineOrDefault(
    std::unique_ptr<crypto::ConfidentialEngine> engine) {
  if (engine) {
    return engine;
  }
  return std::make_unique<crypto::Secp256k1ZkpEngine>();
}

}  // namespace

WalletContext::WalletContext(const config::WalletConfig& config, std::unique_ptr<KeyRing> keys,
                             std::unique_ptr<crypto::ConfidentialEngine> engine)
    : config_(config),
      policy_asset_(config.PolicyAsset()),
      engine_(EngineOrDefault(std::move(engine))),
      keys_(std::move(keys)),
      addresses_(std::make_unique<AddressBook>(*keys_)),
      store_(config.store_path) {}

WalletContext::~WalletContext() = default;

std::unique_ptr<WalletContext> WalletContext::Create(
    const config::WalletConfig& config, std::string_view mnemonic,
    std::string_view mnemonic_passphrase, std::string_view store_passphrase,
    std::unique_ptr<crypto::ConfidentialEngine> engine) {
  config::ValidateWalletConfig(config);
  if (EncryptedStore(config.store_path).Exists()) {
    throw WalletError(ErrorCode::kInvalidRequest,
                      "refusing to overwrite existing store " + config.store_path.string());
  }
  auto keys = KeyRing::FromMnemonic(mnemonic, mnemonic_passphrase, config.network);
  std::unique_ptr<WalletContext> wallet(new WalletContext(config, std::move(keys), std::move(engine)));
  wallet->store_key_.emplace(EncryptedStore::DeriveKey(store_passphrase, config.kdf));
  std::lock_guard<std::mutex> lock(wallet->mutex_);
  wallet->CommitLocked(ChainState{});
  util::LogInfo(kLogComponent, "created " + std::string(config.network.name) + " wallet");
  return wallet;
}

std::unique_ptr<WalletContext> WalletContext::Open(
    const config::WalletConfig& config, std::string_view store_passphrase,
    std::unique_ptr<crypto::ConfidentialEngine> engine) {
  config::ValidateWalletConfig(config);
  EncryptedStore store(config.store_path);
  const auto blob = store.Load();
  auto key = EncryptedStore::DeriveKeyFor(store_passphrase, blob);
  auto plaintext = EncryptedStore::Open(blob, key);
  const util::WipeOnExit wipe_plaintext(plaintext);
  auto snapshot = StoreSnapshot::Deserialize(plaintext);
  const util::WipeOnExit wipe_seed(snapshot.seed);
  if (snapshot.network != config.network.name) {
    throw WalletError(ErrorCode::kInvalidConfig,
                      "store belongs to network " + snapshot.network + ", config says " +
                          std::string(config.network.name));
  }
  auto keys = KeyRing::FromSeed(snapshot.seed, config.network);
  std::unique_ptr<WalletContext> wallet(new WalletContext(config, std::move(keys), std::move(engine)));
  wallet->store_key_.emplace(std::move(key));
  wallet->state_ = std::move(snapshot.state);
  wallet->addresses_->RestoreWatermarks(wallet->state_.first_unused[0],
                                        wallet->state_.first_unused[1]);
  util::LogInfo(kLogComponent, "opened wallet at height " +
                                   std::to_string(wallet->state_.tip.height));
  return wallet;
}

void WalletContext::CommitLocked(ChainState next) {
  StoreSnapshot snapshot;
  const util::WipeOnExit wipe_seed(snapshot.seed);
  snapshot.seed.assign(keys_->seed().begin(), keys_->seed().end());
  snapshot.network = std::string(config_.network.name);
  snapshot.state = std::move(next);
  auto plaintext = snapshot.Serialize();
  const util::WipeOnExit wipe_plaintext(plaintext);
  store_.Persist(EncryptedStore::Seal(plaintext, *store_key_));

  state_ = std::move(snapshot.state);
  addresses_->RestoreWatermarks(state_.first_unused[0], state_.first_unused[1]);
  std::set<primitives::OutPoint> unspent;
  for (const auto& utxo : ComputeUtxos(state_)) {
    unspent.insert(utxo.outpoint);
  }
  reservations_.Prune(unspent);
}

Address WalletContext::ReceiveAddress() {
  return addresses_->NextUnusedAddress(Chain::kExternal);
}

SyncResult WalletContext::Sync(net::RpcClient& client) {
  std::lock_guard<std::mutex> lock(mutex_);
  net::ElectrumApi api(client, config_.sync.request_timeout);
  SyncEngine engine(*keys_, *addresses_, api, *engine_, config_.sync);
  auto result = engine.RunRound(state_);
  CommitLocked(result.state);
  return result;
}

void WalletContext::RunSyncLoop(net::RpcClient& client, std::stop_token stop,
                                std::chrono::milliseconds interval) {
  std::mutex wait_mutex;
  std::condition_variable_any wake;
  while (!stop.stop_requested()) {
    try {
      Sync(client);
    } catch (const WalletError& error) {
      if (!error.IsRetryable()) {
        throw;
      }
      util::LogWarn(kLogComponent, std::string("sync round failed, will retry: ") + error.what());
    }
    std::unique_lock<std::mutex> lock(wait_mutex);
    wake.wait_for(lock, stop, interval, [] { return false; });
  }
  util::LogInfo(kLogComponent, "sync loop stopped");
}

std::vector<Utxo> WalletContext::UtxosLocked() const {
  auto utxos = ComputeUtxos(state_);
  utxos.erase(std::remove_if(utxos.begin(), utxos.end(),
                             [&](const Utxo& utxo) {
                               return utxo.secrets.asset == policy_asset_ &&
                                      utxo.secrets.value < primitives::kDustThreshold;
                             }),
              utxos.end());
  return utxos;
}

std::vector<Utxo> WalletContext::Utxos() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return UtxosLocked();
}

std::map<primitives::AssetId, primitives::Amount> WalletContext::Balance() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::map<primitives::AssetId, primitives::Amount> balance;
  balance[policy_asset_] = 0;
  for (const auto& utxo : UtxosLocked()) {
    auto& total = balance[utxo.secrets.asset];
    if (!primitives::CheckedAdd(total, utxo.secrets.value, &total)) {
      throw WalletError(ErrorCode::kStoreCorrupt, "balance exceeds money range");
    }
  }
  return balance;
}

std::vector<WalletTransaction> WalletContext::ListTransactions(std::size_t first,
                                                               std::size_t count) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<WalletTransaction> listed;
  for (const auto& [txid, tx] : state_.transactions) {
    WalletTransaction entry;
    entry.txid = txid;
    const auto height_it = state_.tx_heights.find(txid);
    entry.height = height_it == state_.tx_heights.end() ? 0 : height_it->second;
    for (const auto& input : tx.vin) {
      const auto owned = state_.owned_outputs.find(input.prevout);
      if (owned != state_.owned_outputs.end()) {
        entry.balance[owned->second.secrets.asset] -=
            static_cast<std::int64_t>(owned->second.secrets.value);
      }
    }
    for (std::uint32_t i = 0; i < tx.vout.size(); ++i) {
      const auto owned = state_.owned_outputs.find(primitives::OutPoint{txid, i});
      if (owned != state_.owned_outputs.end()) {
        entry.balance[owned->second.secrets.asset] +=
            static_cast<std::int64_t>(owned->second.secrets.value);
      }
      if (tx.vout[i].IsFee()) {
        entry.fee += tx.vout[i].value.Explicit().value_or(0);
      }
    }
    listed.push_back(std::move(entry));
  }
  std::sort(listed.begin(), listed.end(), [](const WalletTransaction& a, const WalletTransaction& b) {
    const bool a_pending = a.height <= 0;
    const bool b_pending = b.height <= 0;
    if (a_pending != b_pending) return a_pending;
    if (a.height != b.height) return a.height > b.height;
    return a.txid < b.txid;
  });
  if (first >= listed.size()) {
    return {};
  }
  const auto last = first + std::min(count, listed.size() - first);
  return std::vector<WalletTransaction>(listed.begin() + static_cast<std::ptrdiff_t>(first),
                                        listed.begin() + static_cast<std::ptrdiff_t>(last));
}

TipInfo WalletContext::Tip() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.tip;
}

ChainState WalletContext::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_;
}

void WalletContext::CommitWatermarksLocked(std::span<const primitives::OutPoint> reserved,
                                           const std::array<std::uint32_t, 2>& before) {
  auto next = state_;
  next.first_unused = {addresses_->FirstUnusedIndex(Chain::kExternal),
                       addresses_->FirstUnusedIndex(Chain::kInternal)};
  if (next.first_unused == state_.first_unused) {
    return;
  }
  try {
    CommitLocked(std::move(next));
  } catch (const std::exception& error) {
    // The caller sees a failed build: give back its inputs and addresses.
    reservations_.Release(reserved);
    addresses_->RewindWatermark(Chain::kExternal, before[0]);
    addresses_->RewindWatermark(Chain::kInternal, before[1]);
    util::LogWarn(kLogComponent, std::string("build rolled back: ") + error.what());
    throw;
  }
}

SignedTransaction WalletContext::Build(const BuildRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  TxBuilder builder(*keys_, *addresses_, *engine_, policy_asset_, config_.tx, reservations_);
  const std::array<std::uint32_t, 2> before{addresses_->FirstUnusedIndex(Chain::kExternal),
                                            addresses_->FirstUnusedIndex(Chain::kInternal)};
  auto built = builder.Build(request, UtxosLocked());
  // Change addresses were marked used; keep the watermark durable.
  CommitWatermarksLocked(built.spent, before);
  return built;
}

LiquidexProposal WalletContext::LiquidexMake(const LiquidexMakeRequest& request) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!std::isfinite(request.rate) || request.rate <= 0) {
    throw WalletError(ErrorCode::kInvalidAmount, "liquidex rate must be a positive number");
  }
  const auto utxos = UtxosLocked();
  const auto found = std::find_if(utxos.begin(), utxos.end(), [&](const Utxo& utxo) {
    return utxo.outpoint == request.utxo;
  });
  if (found == utxos.end() || reservations_.IsReserved(request.utxo)) {
    throw WalletError(ErrorCode::kInvalidRequest,
                      "liquidex utxo not spendable: " + primitives::TxIdToHex(request.utxo.txid) +
                          ":" + std::to_string(request.utxo.index));
  }
  const auto& utxo = *found;
  const double asked = std::floor(request.rate * static_cast<double>(utxo.secrets.value));
  if (!(asked >= 1) || asked > static_cast<double>(primitives::kMaxMoney)) {
    throw WalletError(ErrorCode::kInvalidAmount, "liquidex asking amount out of range");
  }
  const auto amount = static_cast<primitives::Amount>(asked);
  if (request.asset == policy_asset_ && amount <= primitives::kDustThreshold) {
    throw WalletError(ErrorCode::kInvalidAmount,
                      "liquidex asking amount is dust: " + std::to_string(amount));
  }

  const std::array<std::uint32_t, 2> before{addresses_->FirstUnusedIndex(Chain::kExternal),
                                            addresses_->FirstUnusedIndex(Chain::kInternal)};
  const auto receive = addresses_->NextUnusedAddress(Chain::kExternal);
  LiquidexProposal proposal;
  auto& tx = proposal.tx;
  primitives::TxIn input;
  input.prevout = utxo.outpoint;
  tx.vin.push_back(std::move(input));
  primitives::TxOut output;
  output.asset = primitives::ConfidentialAsset::FromExplicit(request.asset);
  output.value = primitives::ConfidentialValue::FromAmount(amount);
  output.script_pubkey = receive.script_pubkey;
  tx.vout.push_back(std::move(output));
  proposal.input = utxo.secrets;
  proposal.output = LiquidexBlind(keys_->blinding_master(), *engine_, &tx);

  const auto pair = keys_->Derive(utxo.chain, utxo.index);
  if (pair.script_pubkey != utxo.txout.script_pubkey) {
    throw WalletError(ErrorCode::kSigningFailed, "liquidex utxo is not owned by its recorded key");
  }
  tx.vin[0].script_sig = script::P2shP2wpkhScriptSig(pair.signing_pubkey);
  const auto sighash = consensus::ComputeSegwitV0Sighash(
      tx, 0, script::P2wpkhScriptCode(pair.signing_pubkey), utxo.txout.value, kLiquidexSighash);
  tx.vin[0].witness.script_witness = {
      keys_->SignSighash(utxo.chain, utxo.index, sighash, kLiquidexSighash),
      std::vector<std::uint8_t>(pair.signing_pubkey.begin(), pair.signing_pubkey.end())};

  const std::vector<primitives::OutPoint> reserved{utxo.outpoint};
  if (!reservations_.Reserve(reserved)) {
    throw WalletError(ErrorCode::kInvalidRequest, "liquidex utxo is already reserved");
  }
  addresses_->MarkUsed(Chain::kExternal, receive.index);
  CommitWatermarksLocked(reserved, before);
  util::LogInfo(kLogComponent, "liquidex offer for " + primitives::TxIdToHex(utxo.outpoint.txid) +
                                   ":" + std::to_string(utxo.outpoint.index) + " asks " +
                                   std::to_string(amount) + " of " +
                                   util::HexEncodeReversed(request.asset));
  return proposal;
}

void WalletContext::ReleaseLiquidex(const LiquidexProposal& proposal) {
  for (const auto& input : proposal.tx.vin) {
    reservations_.Release(std::span<const primitives::OutPoint>(&input.prevout, 1));
  }
}

SignedTransaction WalletContext::LiquidexTake(const LiquidexProposal& proposal,
                                              std::optional<std::uint64_t> fee_rate) {
  std::lock_guard<std::mutex> lock(mutex_);
  TxBuilder builder(*keys_, *addresses_, *engine_, policy_asset_, config_.tx, reservations_);
  const std::array<std::uint32_t, 2> before{addresses_->FirstUnusedIndex(Chain::kExternal),
                                            addresses_->FirstUnusedIndex(Chain::kInternal)};
  auto built = builder.TakeLiquidex(proposal, fee_rate, UtxosLocked());
  CommitWatermarksLocked(built.spent, before);
  return built;
}

std::set<primitives::AssetId> WalletContext::LiquidexAssets() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return state_.liquidex_assets;
}

bool WalletContext::LiquidexAssetsInsert(const primitives::AssetId& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.liquidex_assets.count(asset) != 0) {
    return false;
  }
  const std::set<primitives::AssetId> wanted{asset};
  auto next = state_;
  next.liquidex_assets.insert(asset);
  // Offers already taken become visible without waiting for new history.
  for (const auto& [txid, tx] : next.transactions) {
    for (std::uint32_t i = 0; i < tx.vout.size(); ++i) {
      const primitives::OutPoint outpoint{txid, i};
      if (next.owned_outputs.count(outpoint) != 0) {
        continue;
      }
      const auto address = addresses_->FindByScript(tx.vout[i].script_pubkey);
      if (!address) {
        continue;
      }
      const auto secrets = LiquidexUnblind(keys_->blinding_master(), *engine_, tx, i, wanted);
      if (secrets) {
        next.owned_outputs[outpoint] = OwnedOutput{address->chain, address->index, *secrets};
      }
    }
  }
  CommitLocked(std::move(next));
  return true;
}

bool WalletContext::LiquidexAssetsRemove(const primitives::AssetId& asset) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (state_.liquidex_assets.count(asset) == 0) {
    return false;
  }
  auto next = state_;
  next.liquidex_assets.erase(asset);
  CommitLocked(std::move(next));
  return true;
}

void WalletContext::ReleaseReservation(const SignedTransaction& built) {
  reservations_.Release(built.spent);
}

primitives::Hash256 WalletContext::Broadcast(net::RpcClient& client,
                                             const SignedTransaction& built) {
  net::ElectrumApi api(client, config_.sync.request_timeout);
  const auto txid = api.Broadcast(built.tx);
  util::LogInfo(kLogComponent, "broadcast " + primitives::TxIdToHex(txid));
  return txid;
}

void WalletContext::ChangePassphrase(std::string_view old_passphrase,
                                     std::string_view new_passphrase,
                                     const crypto::KdfParams& new_params) {
  std::lock_guard<std::mutex> lock(mutex_);
  store_.ChangePassphrase(old_passphrase, new_passphrase, new_params);
  store_key_.emplace(EncryptedStore::DeriveKeyFor(new_passphrase, store_.Load()));
}

}  // namespace ctwallet::wallet
