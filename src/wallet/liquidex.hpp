#pragma once

#include <cstdint>
#include <optional>
#include <set>

#include <nlohmann/json.hpp>

#include "consensus/sighash.hpp"
#include "crypto/confidential.hpp"
#include "crypto/slip77.hpp"
#include "primitives/transaction.hpp"

namespace ctwallet::wallet {

inline constexpr std::uint32_t kLiquidexProposalVersion = 0;
// The maker signs only its own input and the output paired with it.
inline constexpr std::uint32_t kLiquidexSighash =
    consensus::kSighashSingle | consensus::kSighashAnyoneCanPay;

struct LiquidexMakeRequest {
  primitives::OutPoint utxo{};
  // Asset the maker wants in exchange for the whole utxo.
  primitives::AssetId asset{};
  // Units of `asset` asked per unit of the utxo, rounded down.
  double rate{0};
};

// A signed one-input one-output swap offer. `input` unblinds the spent
// output, `output` unblinds the maker's blinded output 0.
struct LiquidexProposal {
  std::uint32_t version{kLiquidexProposalVersion};
  primitives::Transaction tx;
  crypto::UnblindedOutput input{};
  crypto::UnblindedOutput output{};

  bool operator==(const LiquidexProposal&) const = default;

  // Hashes and blinders are written byte-reversed, as block explorers show them.
  nlohmann::json ToJson() const;
  // Throws WalletError(kInvalidRequest) on any malformed field.
  static LiquidexProposal FromJson(const nlohmann::json& json);
};

// Maker blinders. The final transaction's other inputs are unknown when the
// offer is made, so they depend on the spent outpoint alone.
crypto::BlindingFactor LiquidexBlinder(const crypto::Slip77MasterKey& master,
                                       const primitives::OutPoint& prevout, bool asset_blinder);

// Blinds output 0 of a one-input one-output maker transaction. Nobody can
// rewind the taker's range proof, so the value is sealed into the nonce
// field instead, readable with the maker's master blinding key.
// Throws WalletError(kBlindingError).
crypto::UnblindedOutput LiquidexBlind(const crypto::Slip77MasterKey& master,
                                      const crypto::ConfidentialEngine& engine,
                                      primitives::Transaction* tx);

// Recovers a maker output at `vout` once it is on chain. The asset is found
// by trying every entry of `assets`. nullopt when the output is not one of
// ours or its asset is not listed.
std::optional<crypto::UnblindedOutput> LiquidexUnblind(
    const crypto::Slip77MasterKey& master, const crypto::ConfidentialEngine& engine,
    const primitives::Transaction& tx, std::uint32_t vout,
    const std::set<primitives::AssetId>& assets);

// Asset and value of the maker's spent output rebuilt from its secrets.
// Zero blinders mean the output was explicit.
crypto::CommittedAmount LiquidexPrevout(const crypto::ConfidentialEngine& engine,
                                        const crypto::UnblindedOutput& secrets);

// Checks the proposal shape, that the declared output secrets open output
// 0's commitments, and that input 0 carries a valid SINGLE|ANYONECANPAY
// P2SH-P2WPKH signature over the declared input amount. Returns the output
// secrets. Throws WalletError(kInvalidRequest).
crypto::UnblindedOutput VerifyLiquidexProposal(const crypto::ConfidentialEngine& engine,
                                               const LiquidexProposal& proposal);

}  // namespace ctwallet::wallet
