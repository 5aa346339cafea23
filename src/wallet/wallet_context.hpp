#pragma once

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <span>
#include <stop_token>
#include <string_view>
#include <vector>

#include "config/wallet_config.hpp"
#include "crypto/confidential.hpp"
#include "net/rpc_client.hpp"
#include "wallet/address_book.hpp"
#include "wallet/chain_state.hpp"
#include "wallet/encrypted_store.hpp"
#include "wallet/key_ring.hpp"
#include "wallet/liquidex.hpp"
#include "wallet/reservations.hpp"
#include "wallet/sync_engine.hpp"
#include "wallet/tx_builder.hpp"

namespace ctwallet::wallet {

struct WalletTransaction {
  primitives::Hash256 txid{};
  std::int32_t height{0};
  // Net change per asset: owned outputs created minus owned outputs spent.
  std::map<primitives::AssetId, std::int64_t> balance;
  primitives::Amount fee{0};
};

// Everything one open wallet owns: configuration, keys, the address cache,
// the sealed store and the synchronized chain state. Sync rounds and
// transaction builds run under one mutex, so they never interleave over the
// same utxo set. Secrets are wiped when the context is destroyed.
class WalletContext {
 public:
  // Builds a wallet from a BIP-39 mnemonic and seals an initial snapshot.
  // A null engine selects the libsecp256k1-zkp implementation.
  static std::unique_ptr<WalletContext> Create(
      const config::WalletConfig& config, std::string_view mnemonic,
      std::string_view mnemonic_passphrase, std::string_view store_passphrase,
      std::unique_ptr<crypto::ConfidentialEngine> engine = nullptr);
  // Reopens a sealed wallet. Throws kNotFound, kAuthenticationFailed or
  // kStoreCorrupt as reported by the store.
  static std::unique_ptr<WalletContext> Open(
      const config::WalletConfig& config, std::string_view store_passphrase,
      std::unique_ptr<crypto::ConfidentialEngine> engine = nullptr);

  ~WalletContext();
  WalletContext(const WalletContext&) = delete;
  WalletContext& operator=(const WalletContext&) = delete;

  const config::WalletConfig& config() const noexcept { return config_; }
  const KeyRing& keys() const noexcept { return *keys_; }
  AddressBook& addresses() noexcept { return *addresses_; }
  const crypto::ConfidentialEngine& engine() const noexcept { return *engine_; }
  const primitives::AssetId& policy_asset() const noexcept { return policy_asset_; }
  UtxoReservations& reservations() noexcept { return reservations_; }

  Address ReceiveAddress();

  // One sync round; the new state is persisted before it becomes visible.
  SyncResult Sync(net::RpcClient& client);
  // Repeats Sync every `interval` until `stop` is requested. Retryable
  // failures are logged and retried on the next tick; any other error ends
  // the loop. Cancellation takes effect between rounds only.
  void RunSyncLoop(net::RpcClient& client, std::stop_token stop,
                   std::chrono::milliseconds interval);

  std::map<primitives::AssetId, primitives::Amount> Balance() const;
  std::vector<Utxo> Utxos() const;
  std::vector<WalletTransaction> ListTransactions(std::size_t first, std::size_t count) const;
  TipInfo Tip() const;
  ChainState Snapshot() const;

  SignedTransaction Build(const BuildRequest& request);
  void ReleaseReservation(const SignedTransaction& built);
  primitives::Hash256 Broadcast(net::RpcClient& client, const SignedTransaction& built);

  // Signs a swap offer spending the whole of `request.utxo`. The utxo stays
  // reserved until ReleaseLiquidex or until it is seen spent.
  LiquidexProposal LiquidexMake(const LiquidexMakeRequest& request);
  void ReleaseLiquidex(const LiquidexProposal& proposal);
  // Verifies and completes someone else's offer. Nothing is broadcast.
  SignedTransaction LiquidexTake(const LiquidexProposal& proposal,
                                 std::optional<std::uint64_t> fee_rate = std::nullopt);
  std::set<primitives::AssetId> LiquidexAssets() const;
  // Both return false when the set already had, or lacked, `asset`.
  bool LiquidexAssetsInsert(const primitives::AssetId& asset);
  bool LiquidexAssetsRemove(const primitives::AssetId& asset);

  void ChangePassphrase(std::string_view old_passphrase, std::string_view new_passphrase,
                        const crypto::KdfParams& new_params);

 private:
  WalletContext(const config::WalletConfig& config, std::unique_ptr<KeyRing> keys,
                std::unique_ptr<crypto::ConfidentialEngine> engine);

  std::vector<Utxo> UtxosLocked() const;
  void CommitLocked(ChainState next);
  // Persists watermarks moved by a build. On failure releases `reserved` and
  // rewinds both chains to `before`, then rethrows.
  void CommitWatermarksLocked(std::span<const primitives::OutPoint> reserved,
                              const std::array<std::uint32_t, 2>& before);

  config::WalletConfig config_;
  primitives::AssetId policy_asset_{};
  std::unique_ptr<crypto::ConfidentialEngine> engine_;
  std::unique_ptr<KeyRing> keys_;
  std::unique_ptr<AddressBook> addresses_;
  EncryptedStore store_;
  std::optional<StoreKey> store_key_;
  UtxoReservations reservations_;

  mutable std::mutex mutex_;
  ChainState state_;
};

}  // namespace ctwallet::wallet
