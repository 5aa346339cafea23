#include "wallet/tx_builder.hpp"

#include <algorithm>
#include <memory>
#include <set>
#include <string>
#include <utility>

#include "consensus/sighash.hpp"
#include "crypto/confidential_address.hpp"
#include "primitives/serialize.hpp"
#include "primitives/txid.hpp"
#include "script/script.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/logging.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

constexpr const char* kLogComponent = "txbuilder";
constexpr int kMaxFeePasses = 4;

// Weight units, sized for a 72-byte signature, a 52-bit range proof and a
// three-input surjection proof.
constexpr std::size_t kTxOverheadWeight = (4 + 1 + 1 + 1 + 4) * 4;
constexpr std::size_t kInputWeight = (32 + 4 + 24 + 4) * 4 + (2 + 1 + 73 + 34 + 1);
constexpr std::size_t kBlindedOutputWeight = (33 + 33 + 33 + 24) * 4 + (3 + 135) + (3 + 4174);
constexpr std::size_t kExplicitOutputWeight = (33 + 9 + 1 + 24) * 4 + 2;
constexpr std::size_t kFeeOutputWeight = (33 + 9 + 1 + 1) * 4 + 2;

template <typename T>
void Shuffle(std::vector<T>* items) {
  for (std::size_t i = items->size(); i > 1; --i) {
    const auto j = static_cast<std::size_t>(util::SecureRandomBelow(i));
    std::swap((*items)[i - 1], (*items)[j]);
  }
}

crypto::BlindingFactor RandomBlinder() {
  crypto::BlindingFactor out{};
  do {
    util::FillSecureRandomBytesOrThrow(out);
  } while (!crypto::IsValidSecretKey(out));
  return out;
}

bool IsConfidentialInput(const Utxo& utxo) {
  return utxo.txout.asset.IsCommitment() || utxo.txout.value.IsCommitment();
}

// Adds both proofs to an output whose commitments are already fixed. The
// nonce field is left alone, so nothing can rewind the range proof.
void ProveFixedOutput(const crypto::ConfidentialEngine& engine,
                      const crypto::UnblindedOutput& secrets,
                      const std::vector<crypto::SurjectionInput>& inputs, int exponent, int bits,
                      primitives::TxOut* output) {
  crypto::RangeProofRequest range;
  range.value = secrets.value;
  range.value_commitment = output->value;
  range.asset_commitment = output->asset;
  range.value_blinder = secrets.value_blinder;
  range.nonce = util::SecureRandomArray<32>();
  std::copy(secrets.asset.begin(), secrets.asset.end(), range.message.begin());
  std::copy(secrets.asset_blinder.begin(), secrets.asset_blinder.end(), range.message.begin() + 32);
  range.extra_commit = output->script_pubkey;
  range.exponent = exponent;
  range.bits = bits;
  auto range_proof = engine.ProveRange(range);
  if (!range_proof) {
    throw WalletError(ErrorCode::kBlindingError, "maker output: range proof generation failed");
  }
  crypto::SurjectionRequest surjection;
  surjection.output_asset = secrets.asset;
  surjection.output_asset_blinder = secrets.asset_blinder;
  surjection.output_commitment = output->asset;
  surjection.inputs = inputs;
  auto surjection_proof = engine.ProveSurjection(surjection);
  if (!surjection_proof) {
    throw WalletError(ErrorCode::kBlindingError,
                      "maker output: surjection proof generation failed");
  }
  output->witness.range_proof = std::move(*range_proof);
  output->witness.surjection_proof = std::move(*surjection_proof);
}

primitives::Amount AddOrThrow(primitives::Amount a, primitives::Amount b, const char* what) {
  primitives::Amount out = 0;
  if (!primitives::CheckedAdd(a, b, &out)) {
    throw WalletError(ErrorCode::kInvalidAmount, std::string(what) + " out of range");
  }
  return out;
}

}  // namespace

primitives::Amount FeeForVsize(std::uint64_t fee_rate, std::size_t vsize) {
  return (fee_rate * static_cast<std::uint64_t>(vsize) + 999) / 1000;
}

std::size_t EstimateVsize(std::size_t inputs, std::size_t blinded_outputs,
                          std::size_t explicit_outputs) {
  const std::size_t weight = kTxOverheadWeight + inputs * kInputWeight +
                             blinded_outputs * kBlindedOutputWeight +
                             explicit_outputs * kExplicitOutputWeight + kFeeOutputWeight;
  return (weight + 3) / 4;
}

TxBuilder::TxBuilder(const KeyRing& keys, AddressBook& addresses,
                     const crypto::ConfidentialEngine& engine,
                     const primitives::AssetId& policy_asset, const config::TxConfig& config,
                     UtxoReservations& reservations)
    : keys_(keys),
      addresses_(addresses),
      engine_(engine),
      policy_asset_(policy_asset),
      config_(config),
      reservations_(reservations) {}

std::vector<TxBuilder::PlannedOutput> TxBuilder::PlanRecipients(
    const BuildRequest& request,
    std::map<primitives::AssetId, primitives::Amount>* totals) const {
  if (request.outputs.empty()) {
    throw WalletError(ErrorCode::kInvalidRequest, "no outputs requested");
  }
  std::vector<PlannedOutput> planned;
  planned.reserve(request.outputs.size());
  for (const auto& recipient : request.outputs) {
    if (recipient.amount == 0 || !primitives::MoneyRange(recipient.amount)) {
      throw WalletError(ErrorCode::kInvalidAmount,
                        "output amount out of range: " + std::to_string(recipient.amount));
    }
    if (recipient.asset == policy_asset_ && recipient.amount <= primitives::kDustThreshold) {
      throw WalletError(ErrorCode::kInvalidAmount,
                        "output amount is dust: " + std::to_string(recipient.amount));
    }
    std::string error;
    const auto decoded = crypto::DecodeAddress(keys_.network(), recipient.address, &error);
    if (!decoded) {
      throw WalletError(ErrorCode::kInvalidAddress, "invalid recipient address: " + error);
    }
    PlannedOutput output;
    output.script = decoded->ScriptPubKey().data;
    output.blinding_pubkey = decoded->blinding_pubkey;
    output.asset = recipient.asset;
    output.amount = recipient.amount;
    planned.push_back(std::move(output));
    (*totals)[recipient.asset] = AddOrThrow((*totals)[recipient.asset], recipient.amount,
                                            "output total");
  }
  // The fee is always paid in the policy asset.
  totals->try_emplace(policy_asset_, 0);
  return planned;
}

std::uint64_t TxBuilder::CheckedFeeRate(std::optional<std::uint64_t> requested) const {
  const std::uint64_t fee_rate = requested.value_or(config_.default_fee_rate);
  if (fee_rate == 0 || fee_rate > kMaxFeeRate) {
    throw WalletError(ErrorCode::kInvalidRequest, "fee rate out of range: " +
                                                      std::to_string(fee_rate));
  }
  return fee_rate;
}

std::vector<Utxo> TxBuilder::FilterCandidates(const BuildRequest& request,
                                              const std::vector<Utxo>& utxos) const {
  const auto reserved = reservations_.Snapshot();
  std::set<primitives::OutPoint> allowed;
  if (request.coin_control) {
    allowed.insert(request.coin_control->begin(), request.coin_control->end());
    for (const auto& outpoint : allowed) {
      const bool known = std::any_of(utxos.begin(), utxos.end(), [&](const Utxo& utxo) {
        return utxo.outpoint == outpoint;
      });
      if (!known || reserved.count(outpoint) != 0) {
        throw WalletError(ErrorCode::kInvalidRequest,
                          "coin control outpoint not spendable: " +
                              primitives::TxIdToHex(outpoint.txid) + ":" +
                              std::to_string(outpoint.index));
      }
    }
  }
  std::vector<Utxo> candidates;
  for (const auto& utxo : utxos) {
    if (reserved.count(utxo.outpoint) != 0) {
      continue;
    }
    if (request.coin_control && allowed.count(utxo.outpoint) == 0) {
      continue;
    }
    candidates.push_back(utxo);
  }
  return candidates;
}

CoinSelection TxBuilder::SelectWithFee(const std::vector<Utxo>& candidates,
                                       std::map<primitives::AssetId, primitives::Amount> targets,
                                       primitives::Amount fee) const {
  targets[policy_asset_] = AddOrThrow(targets[policy_asset_], fee, "fee target");
  return SelectCoins(candidates, targets);
}

TxBuilder::PendingTransaction TxBuilder::Plan(
    const CoinSelection& selection, const std::vector<PlannedOutput>& recipients,
    const std::map<primitives::AssetId, primitives::Amount>& targets, primitives::Amount fee) {
  PendingTransaction pending;
  pending.inputs = selection.inputs;
  pending.outputs = recipients;
  pending.fee = fee;

  std::uint32_t offset = 0;
  for (const auto& [asset, input_total] : selection.input_totals) {
    primitives::Amount spend = targets.at(asset);
    if (asset == policy_asset_) {
      spend = AddOrThrow(spend, fee, "fee target");
    }
    primitives::Amount change = 0;
    if (!primitives::CheckedSub(input_total, spend, &change)) {
      throw WalletError(ErrorCode::kFeeEstimationDivergence,
                        "selection no longer covers " + util::HexEncodeReversed(asset));
    }
    if (change == 0) {
      continue;
    }
    if (asset == policy_asset_ && change <= primitives::kDustThreshold) {
      pending.fee += change;
      continue;
    }
    const auto address = addresses_.NextUnusedAddress(Chain::kInternal, offset++);
    PlannedOutput output;
    output.script = address.script_pubkey;
    output.blinding_pubkey = address.blinding_pubkey;
    output.asset = asset;
    output.amount = change;
    output.change_index = address.index;
    pending.outputs.push_back(std::move(output));
    if (asset == policy_asset_) {
      pending.has_policy_change = true;
    }
  }

  Shuffle(&pending.inputs);
  Shuffle(&pending.outputs);
  return pending;
}

void TxBuilder::BlindOutputs(const PendingTransaction& pending, primitives::Transaction* tx,
                             std::vector<crypto::UnblindedOutput>* output_secrets) const {
  const std::size_t offset = pending.maker ? 1 : 0;
  std::vector<std::size_t> blinded;
  for (std::size_t i = 0; i < pending.outputs.size(); ++i) {
    const auto& planned = pending.outputs[i];
    auto& secrets = (*output_secrets)[offset + i];
    secrets.asset = planned.asset;
    secrets.value = planned.amount;
    if (planned.blinding_pubkey) {
      blinded.push_back(offset + i);
    } else {
      auto& txout = tx->vout[offset + i];
      txout.asset = primitives::ConfidentialAsset::FromExplicit(planned.asset);
      txout.value = primitives::ConfidentialValue::FromAmount(planned.amount);
      txout.nonce.bytes.clear();
    }
  }

  const bool any_confidential_input =
      std::any_of(pending.inputs.begin(), pending.inputs.end(), IsConfidentialInput);
  if (blinded.empty()) {
    if (any_confidential_input || pending.maker) {
      throw WalletError(ErrorCode::kBlindingError,
                        "confidential inputs need at least one blinded output");
    }
    return;
  }

  // Entries: maker input, our inputs, maker output, our blinded outputs.
  // The maker's blinders are fixed, so only ours can absorb the balance.
  const std::size_t input_count = offset + pending.inputs.size();
  const std::size_t first_ours = input_count + offset;
  const std::size_t total = first_ours + blinded.size();
  std::vector<primitives::Amount> values(total);
  std::vector<crypto::BlindingFactor> asset_blinders(total);
  std::vector<crypto::BlindingFactor> value_blinders(total);
  std::vector<crypto::SurjectionInput> surjection_inputs;
  surjection_inputs.reserve(input_count);
  auto add_input = [&](std::size_t slot, const crypto::UnblindedOutput& secrets,
                       const primitives::ConfidentialAsset& commitment) {
    values[slot] = secrets.value;
    asset_blinders[slot] = secrets.asset_blinder;
    value_blinders[slot] = secrets.value_blinder;
    surjection_inputs.push_back(
        crypto::SurjectionInput{secrets.asset, secrets.asset_blinder, commitment});
  };
  if (pending.maker) {
    add_input(0, pending.maker->input_secrets, pending.maker->prevout.asset);
    values[input_count] = pending.maker->output_secrets.value;
    asset_blinders[input_count] = pending.maker->output_secrets.asset_blinder;
    value_blinders[input_count] = pending.maker->output_secrets.value_blinder;
  }
  for (std::size_t i = 0; i < pending.inputs.size(); ++i) {
    add_input(offset + i, pending.inputs[i].secrets, pending.inputs[i].txout.asset);
  }
  for (std::size_t k = 0; k < blinded.size(); ++k) {
    values[first_ours + k] = pending.outputs[blinded[k] - offset].amount;
    asset_blinders[first_ours + k] = RandomBlinder();
    value_blinders[first_ours + k] = RandomBlinder();
  }
  if (!engine_.BalanceFinalBlinder(values, asset_blinders, value_blinders, input_count)) {
    throw WalletError(ErrorCode::kBlindingError, "blinding factors do not close");
  }

  if (pending.maker) {
    ProveFixedOutput(engine_, pending.maker->output_secrets, surjection_inputs,
                     config_.ct_exponent, config_.ct_bits, &tx->vout[0]);
  }
  for (std::size_t k = 0; k < blinded.size(); ++k) {
    const std::size_t vout = blinded[k];
    auto& secrets = (*output_secrets)[vout];
    secrets.asset_blinder = asset_blinders[first_ours + k];
    secrets.value_blinder = value_blinders[first_ours + k];
    std::string error;
    if (!crypto::BlindTxOut(engine_, secrets, *pending.outputs[vout - offset].blinding_pubkey,
                            surjection_inputs, config_.ct_exponent, config_.ct_bits,
                            &tx->vout[vout], &error)) {
      throw WalletError(ErrorCode::kBlindingError,
                        "output " + std::to_string(vout) + ": " + error);
    }
  }
}

void TxBuilder::SignInputs(const PendingTransaction& pending, primitives::Transaction* tx) const {
  const std::size_t offset = pending.maker ? 1 : 0;
  for (std::size_t i = 0; i < pending.inputs.size(); ++i) {
    const auto& input = pending.inputs[i];
    const auto pair = keys_.Derive(input.chain, input.index);
    if (pair.script_pubkey != input.txout.script_pubkey) {
      throw WalletError(ErrorCode::kSigningFailed,
                        "input " + std::to_string(i) + " is not owned by its recorded key");
    }
    tx->vin[offset + i].script_sig = script::P2shP2wpkhScriptSig(pair.signing_pubkey);
  }
  for (std::size_t i = 0; i < pending.inputs.size(); ++i) {
    const auto& input = pending.inputs[i];
    const auto pair = keys_.Derive(input.chain, input.index);
    const auto script_code = script::P2wpkhScriptCode(pair.signing_pubkey);
    const auto sighash =
        consensus::ComputeSegwitV0Sighash(*tx, offset + i, script_code, input.txout.value);
    auto signature = keys_.SignSighash(input.chain, input.index, sighash);
    tx->vin[offset + i].witness.script_witness = {
        std::move(signature),
        std::vector<std::uint8_t>(pair.signing_pubkey.begin(), pair.signing_pubkey.end())};
  }
}

SignedTransaction TxBuilder::Finalize(PendingTransaction pending, std::uint64_t fee_rate) const {
  SignedTransaction result;
  auto& tx = result.tx;
  const std::size_t offset = pending.maker ? 1 : 0;
  if (pending.maker) {
    tx.version = pending.maker->tx_version;
    tx.lock_time = pending.maker->lock_time;
    tx.vin.push_back(pending.maker->input);
    result.input_secrets.push_back(pending.maker->input_secrets);
    tx.vout.push_back(pending.maker->output);
    result.output_secrets.push_back(pending.maker->output_secrets);
  }
  for (const auto& input : pending.inputs) {
    primitives::TxIn txin;
    txin.prevout = input.outpoint;
    tx.vin.push_back(std::move(txin));
    result.input_secrets.push_back(input.secrets);
    result.spent.push_back(input.outpoint);
  }
  tx.vout.resize(offset + pending.outputs.size());
  for (std::size_t i = 0; i < pending.outputs.size(); ++i) {
    tx.vout[offset + i].script_pubkey = pending.outputs[i].script;
  }
  result.output_secrets.resize(offset + pending.outputs.size());
  BlindOutputs(pending, &tx, &result.output_secrets);

  primitives::TxOut fee_output;
  fee_output.asset = primitives::ConfidentialAsset::FromExplicit(policy_asset_);
  fee_output.value = primitives::ConfidentialValue::FromAmount(pending.fee);
  tx.vout.push_back(std::move(fee_output));
  result.output_secrets.push_back(crypto::UnblindedOutput{policy_asset_, pending.fee, {}, {}});

  std::vector<crypto::CommittedAmount> committed_in;
  if (pending.maker) {
    committed_in.push_back(pending.maker->prevout);
  }
  for (const auto& input : pending.inputs) {
    committed_in.push_back(crypto::CommittedAmount{input.txout.asset, input.txout.value});
  }
  std::vector<crypto::CommittedAmount> committed_out;
  for (const auto& output : tx.vout) {
    committed_out.push_back(crypto::CommittedAmount{output.asset, output.value});
  }
  if (!engine_.VerifyBalance(committed_in, committed_out)) {
    throw WalletError(ErrorCode::kBlindingError, "commitments do not balance");
  }

  SignInputs(pending, &tx);

  primitives::serialize::SerializeTransaction(tx, &result.raw);
  result.txid = primitives::ComputeTxId(tx);
  result.fee = pending.fee;
  result.fee_rate = fee_rate;
  result.vsize = primitives::serialize::MeasureTransactionSizes(tx).VirtualSize();
  for (std::size_t i = 0; i < pending.outputs.size(); ++i) {
    const auto& planned = pending.outputs[i];
    if (planned.change_index) {
      result.change.push_back(
          ChangeOutput{offset + i, *planned.change_index, planned.asset, planned.amount});
    }
  }
  return result;
}

SignedTransaction TxBuilder::Build(const BuildRequest& request, const std::vector<Utxo>& utxos) {
  std::map<primitives::AssetId, primitives::Amount> targets;
  const auto recipients = PlanRecipients(request, &targets);
  const auto fee_rate = CheckedFeeRate(request.fee_rate);
  const auto candidates = FilterCandidates(request, utxos);
  return Converge(candidates, recipients, targets, fee_rate, std::nullopt);
}

SignedTransaction TxBuilder::TakeLiquidex(const LiquidexProposal& proposal,
                                          std::optional<std::uint64_t> fee_rate,
                                          const std::vector<Utxo>& utxos) {
  const auto maker_output = VerifyLiquidexProposal(engine_, proposal);
  if (proposal.input.asset == policy_asset_ &&
      proposal.input.value <= primitives::kDustThreshold) {
    throw WalletError(ErrorCode::kInvalidAmount,
                      "liquidex maker input is dust: " + std::to_string(proposal.input.value));
  }
  const auto rate = CheckedFeeRate(fee_rate);

  MakerLeg maker;
  maker.tx_version = proposal.tx.version;
  maker.lock_time = proposal.tx.lock_time;
  maker.input = proposal.tx.vin[0];
  maker.prevout = LiquidexPrevout(engine_, proposal.input);
  maker.input_secrets = proposal.input;
  maker.output = proposal.tx.vout[0];
  maker.output_secrets = maker_output;

  // The maker's input pays our receive output in full.
  const auto receive = addresses_.NextUnusedAddress(Chain::kExternal);
  PlannedOutput received;
  received.script = receive.script_pubkey;
  received.blinding_pubkey = receive.blinding_pubkey;
  received.asset = proposal.input.asset;
  received.amount = proposal.input.value;

  std::map<primitives::AssetId, primitives::Amount> targets{
      {maker_output.asset, maker_output.value}};
  targets.try_emplace(policy_asset_, 0);

  auto candidates = FilterCandidates(BuildRequest{}, utxos);
  candidates.erase(std::remove_if(candidates.begin(), candidates.end(),
                                  [&](const Utxo& utxo) {
                                    return utxo.outpoint == maker.input.prevout;
                                  }),
                   candidates.end());

  auto built = Converge(candidates, {received}, targets, rate, maker);
  addresses_.MarkUsed(Chain::kExternal, receive.index);
  return built;
}

SignedTransaction TxBuilder::Converge(
    const std::vector<Utxo>& candidates, const std::vector<PlannedOutput>& recipients,
    const std::map<primitives::AssetId, primitives::Amount>& targets, std::uint64_t fee_rate,
    const std::optional<MakerLeg>& maker) {
  const std::size_t maker_count = maker ? 1 : 0;
  const auto blinded_recipients = static_cast<std::size_t>(
      std::count_if(recipients.begin(), recipients.end(),
                    [](const PlannedOutput& output) { return output.blinding_pubkey.has_value(); }));
  const std::size_t explicit_recipients = recipients.size() - blinded_recipients;
  auto estimate_fee = [&](std::size_t inputs) {
    return FeeForVsize(fee_rate,
                       EstimateVsize(inputs + maker_count,
                                     maker_count + blinded_recipients + targets.size(),
                                     explicit_recipients));
  };

  primitives::Amount fee = estimate_fee(1);
  auto selection = SelectWithFee(candidates, targets, fee);
  if (const auto refined = estimate_fee(selection.inputs.size()); refined > fee) {
    fee = refined;
    selection = SelectWithFee(candidates, targets, fee);
  }

  auto reserve = [&](const CoinSelection& chosen) {
    std::vector<primitives::OutPoint> outpoints;
    for (const auto& utxo : chosen.inputs) {
      outpoints.push_back(utxo.outpoint);
    }
    if (!reservations_.Reserve(outpoints)) {
      throw WalletError(ErrorCode::kInvalidRequest, "selected outpoint is already reserved");
    }
    return std::make_unique<ReservationGuard>(reservations_, std::move(outpoints));
  };
  auto guard = reserve(selection);

  int reselections = 0;
  for (int pass = 0; pass < kMaxFeePasses; ++pass) {
    auto pending = Plan(selection, recipients, targets, fee);
    pending.maker = maker;
    const bool has_policy_change = pending.has_policy_change;
    auto built = Finalize(std::move(pending), fee_rate);
    const auto needed = FeeForVsize(fee_rate, built.vsize);
    if (built.fee == needed || (!has_policy_change && built.fee >= needed)) {
      guard->Commit();
      for (const auto& change : built.change) {
        addresses_.MarkUsed(Chain::kInternal, change.index);
      }
      util::LogInfo(kLogComponent, "built " + primitives::TxIdToHex(built.txid) + " inputs=" +
                                       std::to_string(built.tx.vin.size()) + " outputs=" +
                                       std::to_string(built.tx.vout.size()) + " fee=" +
                                       std::to_string(built.fee) + " vsize=" +
                                       std::to_string(built.vsize));
      return built;
    }
    util::LogDebug(kLogComponent, "fee pass " + std::to_string(pass) + ": paid " +
                                      std::to_string(built.fee) + ", need " +
                                      std::to_string(needed));
    fee = needed;
    const auto policy_in = selection.input_totals[policy_asset_];
    const auto policy_need = AddOrThrow(targets.at(policy_asset_), fee, "fee target");
    if (policy_in < policy_need) {
      if (++reselections > 1) {
        throw WalletError(ErrorCode::kFeeEstimationDivergence,
                          "fee kept outgrowing the selected inputs",
                          {AssetShortfall{policy_asset_, policy_need, policy_in}});
      }
      guard.reset();
      selection = SelectWithFee(candidates, targets, fee);
      guard = reserve(selection);
    }
  }
  const auto policy_in = selection.input_totals[policy_asset_];
  throw WalletError(ErrorCode::kFeeEstimationDivergence,
                    "fee did not converge after " + std::to_string(kMaxFeePasses) + " passes",
                    {AssetShortfall{policy_asset_, targets.at(policy_asset_) + fee, policy_in}});
}

}  // namespace ctwallet::wallet
