#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "config/wallet_config.hpp"
#include "crypto/confidential.hpp"
#include "primitives/transaction.hpp"
#include "wallet/address_book.hpp"
#include "wallet/chain_state.hpp"
#include "wallet/coin_selection.hpp"
#include "wallet/key_ring.hpp"
#include "wallet/liquidex.hpp"
#include "wallet/reservations.hpp"

namespace ctwallet::wallet {

// Fee rates above this (sat/kvB) are rejected as caller mistakes.
inline constexpr std::uint64_t kMaxFeeRate = 100'000'000;

struct Recipient {
  std::string address;
  primitives::AssetId asset{};
  primitives::Amount amount{0};
};

struct BuildRequest {
  std::vector<Recipient> outputs;
  // Satoshi per 1000 virtual bytes. TxConfig::default_fee_rate when unset.
  std::optional<std::uint64_t> fee_rate;
  // Restricts selection to these outpoints.
  std::optional<std::vector<primitives::OutPoint>> coin_control;
};

struct ChangeOutput {
  std::size_t vout{0};
  std::uint32_t index{0};
  primitives::AssetId asset{};
  primitives::Amount amount{0};
};

struct SignedTransaction {
  primitives::Transaction tx;
  std::vector<std::uint8_t> raw;
  primitives::Hash256 txid{};
  primitives::Amount fee{0};
  std::uint64_t fee_rate{0};
  std::size_t vsize{0};
  std::vector<primitives::OutPoint> spent;
  std::vector<ChangeOutput> change;
  // Parallel to tx.vin / tx.vout. Explicit entries carry zero blinders.
  std::vector<crypto::UnblindedOutput> input_secrets;
  std::vector<crypto::UnblindedOutput> output_secrets;
};

// sat/kvB applied to a virtual size, rounded up.
primitives::Amount FeeForVsize(std::uint64_t fee_rate, std::size_t vsize);

// Rough virtual size before proofs and signatures exist. Used only to seed
// coin selection; the final fee is always computed from the finished bytes.
std::size_t EstimateVsize(std::size_t inputs, std::size_t blinded_outputs,
                          std::size_t explicit_outputs);

// Assembles, blinds and signs one transaction. The caller holds the wallet
// mutex, so the utxo view cannot change underneath a build.
class TxBuilder {
 public:
  TxBuilder(const KeyRing& keys, AddressBook& addresses, const crypto::ConfidentialEngine& engine,
            const primitives::AssetId& policy_asset, const config::TxConfig& config,
            UtxoReservations& reservations);

  // On success the spent outpoints stay reserved and the change addresses
  // are marked used. On failure nothing observable changes.
  SignedTransaction Build(const BuildRequest& request, const std::vector<Utxo>& utxos);

  // Completes a verified liquidex proposal: funds the maker's asking output,
  // receives the maker's input on our next external address and pays the
  // fee. The maker's pair stays at input 0 and output 0 untouched apart from
  // the proofs on output 0. Throws kInvalidRequest for a bad proposal, then
  // whatever Build would throw.
  SignedTransaction TakeLiquidex(const LiquidexProposal& proposal,
                                 std::optional<std::uint64_t> fee_rate,
                                 const std::vector<Utxo>& utxos);

 private:
  struct PlannedOutput {
    std::vector<std::uint8_t> script;
    std::optional<crypto::CompressedPublicKey> blinding_pubkey;
    primitives::AssetId asset{};
    primitives::Amount amount{0};
    std::optional<std::uint32_t> change_index;
  };

  // The maker's signed input/output pair of a liquidex swap.
  struct MakerLeg {
    std::uint32_t tx_version{2};
    std::uint32_t lock_time{0};
    primitives::TxIn input;
    crypto::CommittedAmount prevout{};
    crypto::UnblindedOutput input_secrets{};
    primitives::TxOut output;
    crypto::UnblindedOutput output_secrets{};
  };

  // An in-progress build. Discarded whole on any error.
  struct PendingTransaction {
    std::vector<Utxo> inputs;
    std::vector<PlannedOutput> outputs;
    primitives::Amount fee{0};
    bool has_policy_change{false};
    std::optional<MakerLeg> maker;
  };

  std::vector<PlannedOutput> PlanRecipients(const BuildRequest& request,
                                            std::map<primitives::AssetId, primitives::Amount>*
                                                totals) const;
  std::uint64_t CheckedFeeRate(std::optional<std::uint64_t> requested) const;
  std::vector<Utxo> FilterCandidates(const BuildRequest& request,
                                     const std::vector<Utxo>& utxos) const;
  CoinSelection SelectWithFee(const std::vector<Utxo>& candidates,
                              std::map<primitives::AssetId, primitives::Amount> targets,
                              primitives::Amount fee) const;
  PendingTransaction Plan(const CoinSelection& selection,
                          const std::vector<PlannedOutput>& recipients,
                          const std::map<primitives::AssetId, primitives::Amount>& targets,
                          primitives::Amount fee);
  // Selects, blinds and signs until the paid fee matches the finished size.
  SignedTransaction Converge(const std::vector<Utxo>& candidates,
                             const std::vector<PlannedOutput>& recipients,
                             const std::map<primitives::AssetId, primitives::Amount>& targets,
                             std::uint64_t fee_rate, const std::optional<MakerLeg>& maker);
  SignedTransaction Finalize(PendingTransaction pending, std::uint64_t fee_rate) const;
  void BlindOutputs(const PendingTransaction& pending, primitives::Transaction* tx,
                    std::vector<crypto::UnblindedOutput>* output_secrets) const;
  void SignInputs(const PendingTransaction& pending, primitives::Transaction* tx) const;

  const KeyRing& keys_;
  AddressBook& addresses_;
  const crypto::ConfidentialEngine& engine_;
  primitives::AssetId policy_asset_;
  config::TxConfig config_;
  UtxoReservations& reservations_;
};

}  // namespace ctwallet::wallet
