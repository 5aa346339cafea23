#include "wallet/liquidex.hpp"

#include <algorithm>
#include <array>
#include <string>
#include <string_view>
#include <vector>

#include "crypto/hash.hpp"
#include "primitives/serialize.hpp"
#include "script/script.hpp"
#include "util/aead.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

namespace ser = primitives::serialize;

// About half of all x coordinates lie on the curve.
constexpr int kMaxNonceAttempts = 64;
constexpr std::size_t kSealedValueSize = 16;
constexpr std::string_view kValueKeyTag = "liquidex_value_key";
constexpr std::string_view kValueNonceTag = "liquidex_value_nonce";

[[noreturn]] void Invalid(const std::string& what) {
  throw WalletError(ErrorCode::kInvalidRequest, "liquidex proposal: " + what);
}

void AppendTag(std::vector<std::uint8_t>* out, std::string_view tag) {
  out->insert(out->end(), tag.begin(), tag.end());
}

void AppendOutPoint(std::vector<std::uint8_t>* out, const primitives::OutPoint& outpoint) {
  out->insert(out->end(), outpoint.txid.begin(), outpoint.txid.end());
  ser::WriteUint32(out, outpoint.index);
}

bool IsZero(const crypto::BlindingFactor& blinder) {
  return std::all_of(blinder.begin(), blinder.end(), [](std::uint8_t b) { return b == 0; });
}

std::array<std::uint8_t, 32> ValueKey(const crypto::Slip77MasterKey& master,
                                      std::span<const std::uint8_t> script_pubkey) {
  std::vector<std::uint8_t> preimage;
  AppendTag(&preimage, kValueKeyTag);
  preimage.insert(preimage.end(), master.bytes().begin(), master.bytes().end());
  preimage.insert(preimage.end(), script_pubkey.begin(), script_pubkey.end());
  const auto key = crypto::Sha256(preimage);
  util::SecureWipe(preimage);
  return key;
}

// Bound to the commitments, so a nonce is never reused for another output.
std::array<std::uint8_t, util::kChaCha20Poly1305NonceSize> ValueNonce(
    const crypto::Slip77MasterKey& master, const primitives::OutPoint& prevout,
    const primitives::TxOut& output) {
  std::vector<std::uint8_t> preimage;
  AppendTag(&preimage, kValueNonceTag);
  preimage.insert(preimage.end(), master.bytes().begin(), master.bytes().end());
  AppendOutPoint(&preimage, prevout);
  preimage.insert(preimage.end(), output.asset.bytes.begin(), output.asset.bytes.end());
  preimage.insert(preimage.end(), output.value.bytes.begin(), output.value.bytes.end());
  preimage.insert(preimage.end(), output.script_pubkey.begin(), output.script_pubkey.end());
  const auto digest = crypto::Sha256(preimage);
  util::SecureWipe(preimage);
  std::array<std::uint8_t, util::kChaCha20Poly1305NonceSize> nonce{};
  std::copy_n(digest.begin(), nonce.size(), nonce.begin());
  return nonce;
}

nlohmann::json SecretsToJson(const crypto::UnblindedOutput& secrets) {
  return nlohmann::json{{"asset", util::HexEncodeReversed(secrets.asset)},
                        {"amount", secrets.value},
                        {"asset_blinder", util::HexEncodeReversed(secrets.asset_blinder)},
                        {"amount_blinder", util::HexEncodeReversed(secrets.value_blinder)}};
}

primitives::Hash256 ReadHash(const nlohmann::json& object, const char* key) {
  if (!object.contains(key) || !object.at(key).is_string()) {
    Invalid(std::string("missing '") + key + "'");
  }
  const auto hash = util::ParseHash256Hex(object.at(key).get<std::string>());
  if (!hash) {
    Invalid(std::string("'") + key + "' is not a 32-byte hex string");
  }
  return *hash;
}

crypto::UnblindedOutput SecretsFromJson(const nlohmann::json& list, const char* key) {
  if (!list.is_array() || list.size() != 1 || !list[0].is_object()) {
    Invalid(std::string("'") + key + "' must hold exactly one entry");
  }
  const auto& entry = list[0];
  crypto::UnblindedOutput secrets;
  secrets.asset = ReadHash(entry, "asset");
  secrets.asset_blinder = ReadHash(entry, "asset_blinder");
  secrets.value_blinder = ReadHash(entry, "amount_blinder");
  if (!entry.contains("amount") || !entry.at("amount").is_number_unsigned()) {
    Invalid(std::string("'") + key + "' amount must be an unsigned integer");
  }
  secrets.value = entry.at("amount").get<primitives::Amount>();
  if (secrets.value == 0 || !primitives::MoneyRange(secrets.value)) {
    Invalid(std::string("'") + key + "' amount out of range");
  }
  return secrets;
}

}  // namespace

nlohmann::json LiquidexProposal::ToJson() const {
  std::vector<std::uint8_t> raw;
  ser::SerializeTransaction(tx, &raw);
  return nlohmann::json{{"version", version},
                        {"tx", util::HexEncode(raw)},
                        {"inputs", nlohmann::json::array({SecretsToJson(input)})},
                        {"outputs", nlohmann::json::array({SecretsToJson(output)})}};
}

LiquidexProposal LiquidexProposal::FromJson(const nlohmann::json& json) {
  if (!json.is_object()) {
    Invalid("expected a json object");
  }
  LiquidexProposal proposal;
  if (json.contains("version")) {
    if (!json.at("version").is_number_unsigned()) {
      Invalid("version must be an unsigned integer");
    }
    proposal.version = json.at("version").get<std::uint32_t>();
  }
  if (proposal.version != kLiquidexProposalVersion) {
    Invalid("unsupported version " + std::to_string(proposal.version));
  }
  if (!json.contains("tx") || !json.at("tx").is_string()) {
    Invalid("missing 'tx'");
  }
  std::vector<std::uint8_t> raw;
  if (!util::HexDecode(json.at("tx").get<std::string>(), &raw)) {
    Invalid("'tx' is not hex");
  }
  std::size_t offset = 0;
  std::string error;
  if (!ser::DeserializeTransaction(raw, &offset, &proposal.tx, &error) || offset != raw.size()) {
    Invalid("'tx' does not parse: " + (error.empty() ? std::string("trailing bytes") : error));
  }
  proposal.input = SecretsFromJson(json.value("inputs", nlohmann::json()), "inputs");
  proposal.output = SecretsFromJson(json.value("outputs", nlohmann::json()), "outputs");
  return proposal;
}

crypto::BlindingFactor LiquidexBlinder(const crypto::Slip77MasterKey& master,
                                       const primitives::OutPoint& prevout, bool asset_blinder) {
  std::vector<std::uint8_t> outpoint;
  AppendOutPoint(&outpoint, prevout);
  const auto hash_prevout = crypto::DoubleSha256(outpoint);
  // The taker picks the final output index; use one no transaction can have.
  std::vector<std::uint8_t> message(hash_prevout.begin(), hash_prevout.end());
  ser::WriteUint32(&message, 0xFFFFFFFFu);
  AppendTag(&message, asset_blinder ? "ABF" : "VBF");
  const auto blinder = crypto::HmacSha256(master.bytes(), message);
  if (!crypto::IsValidSecretKey(blinder)) {
    throw WalletError(ErrorCode::kBlindingError, "liquidex blinder is not a valid scalar");
  }
  return blinder;
}

crypto::UnblindedOutput LiquidexBlind(const crypto::Slip77MasterKey& master,
                                      const crypto::ConfidentialEngine& engine,
                                      primitives::Transaction* tx) {
  if (tx->vin.size() != 1 || tx->vout.size() != 1) {
    throw WalletError(ErrorCode::kBlindingError,
                      "liquidex maker transaction needs one input and one output");
  }
  auto& output = tx->vout[0];
  const auto asset = output.asset.Explicit();
  const auto value = output.value.Explicit();
  if (!asset || !value) {
    throw WalletError(ErrorCode::kBlindingError, "liquidex maker output is already blinded");
  }
  const auto& prevout = tx->vin[0].prevout;
  crypto::UnblindedOutput secrets;
  secrets.asset = *asset;
  secrets.value = *value;
  secrets.asset_blinder = LiquidexBlinder(master, prevout, true);
  secrets.value_blinder = LiquidexBlinder(master, prevout, false);

  auto asset_commitment = engine.CommitAsset(secrets.asset, secrets.asset_blinder);
  if (!asset_commitment) {
    throw WalletError(ErrorCode::kBlindingError, "liquidex asset commitment failed");
  }
  auto value_commitment =
      engine.CommitValue(secrets.value, secrets.value_blinder, *asset_commitment);
  if (!value_commitment) {
    throw WalletError(ErrorCode::kBlindingError, "liquidex value commitment failed");
  }
  output.asset = std::move(*asset_commitment);
  output.value = std::move(*value_commitment);

  auto key = ValueKey(master, output.script_pubkey);
  const auto nonce = ValueNonce(master, prevout, output);
  for (int attempt = 0; attempt < kMaxNonceAttempts; ++attempt) {
    std::array<std::uint8_t, kSealedValueSize> plaintext{};
    for (int i = 0; i < 8; ++i) {
      plaintext[i] = static_cast<std::uint8_t>(secrets.value >> (8 * i));
    }
    util::FillSecureRandomBytesOrThrow(std::span<std::uint8_t>(plaintext).subspan(8));
    util::AeadTag tag{};
    const auto sealed =
        util::ChaCha20Poly1305Seal(key, nonce, std::span<const std::uint8_t>(), plaintext, &tag);
    util::SecureWipe(plaintext);

    crypto::CompressedPublicKey candidate{};
    candidate[0] = 0x02;
    std::copy(sealed.begin(), sealed.end(), candidate.begin() + 1);
    std::copy(tag.begin(), tag.end(), candidate.begin() + 1 + kSealedValueSize);
    secp256k1_pubkey parsed;
    if (crypto::ParsePublicKey(candidate, &parsed)) {
      util::SecureWipe(key);
      output.nonce.bytes.assign(candidate.begin(), candidate.end());
      return secrets;
    }
  }
  util::SecureWipe(key);
  throw WalletError(ErrorCode::kBlindingError, "no curve point encodes the sealed value");
}

std::optional<crypto::UnblindedOutput> LiquidexUnblind(
    const crypto::Slip77MasterKey& master, const crypto::ConfidentialEngine& engine,
    const primitives::Transaction& tx, std::uint32_t vout,
    const std::set<primitives::AssetId>& assets) {
  if (assets.empty() || vout >= tx.vout.size() || vout >= tx.vin.size()) {
    return std::nullopt;
  }
  const auto& output = tx.vout[vout];
  if (!output.asset.IsCommitment() || !output.value.IsCommitment() ||
      !output.nonce.IsPublicKey()) {
    return std::nullopt;
  }
  const auto& prevout = tx.vin[vout].prevout;
  auto key = ValueKey(master, output.script_pubkey);
  const auto nonce = ValueNonce(master, prevout, output);
  util::AeadTag tag{};
  std::copy_n(output.nonce.bytes.begin() + 1 + kSealedValueSize, tag.size(), tag.begin());
  std::vector<std::uint8_t> plaintext;
  const bool opened = util::ChaCha20Poly1305Open(
      key, nonce, std::span<const std::uint8_t>(),
      std::span<const std::uint8_t>(output.nonce.bytes.data() + 1, kSealedValueSize), tag,
      &plaintext);
  util::SecureWipe(key);
  if (!opened || plaintext.size() != kSealedValueSize) {
    return std::nullopt;
  }
  crypto::UnblindedOutput secrets;
  for (int i = 7; i >= 0; --i) {
    secrets.value = (secrets.value << 8) | plaintext[i];
  }
  util::SecureWipe(plaintext);
  secrets.asset_blinder = LiquidexBlinder(master, prevout, true);
  secrets.value_blinder = LiquidexBlinder(master, prevout, false);

  const auto value_commitment = engine.CommitValue(secrets.value, secrets.value_blinder, output.asset);
  if (!value_commitment || *value_commitment != output.value) {
    return std::nullopt;
  }
  for (const auto& asset : assets) {
    const auto asset_commitment = engine.CommitAsset(asset, secrets.asset_blinder);
    if (asset_commitment && *asset_commitment == output.asset) {
      secrets.asset = asset;
      return secrets;
    }
  }
  return std::nullopt;
}

crypto::CommittedAmount LiquidexPrevout(const crypto::ConfidentialEngine& engine,
                                        const crypto::UnblindedOutput& secrets) {
  crypto::CommittedAmount prevout;
  if (IsZero(secrets.asset_blinder)) {
    prevout.asset = primitives::ConfidentialAsset::FromExplicit(secrets.asset);
  } else {
    auto asset = engine.CommitAsset(secrets.asset, secrets.asset_blinder);
    if (!asset) {
      Invalid("input asset blinder does not form a commitment");
    }
    prevout.asset = std::move(*asset);
  }
  if (IsZero(secrets.value_blinder)) {
    prevout.value = primitives::ConfidentialValue::FromAmount(secrets.value);
  } else {
    auto value = engine.CommitValue(secrets.value, secrets.value_blinder, prevout.asset);
    if (!value) {
      Invalid("input value blinder does not form a commitment");
    }
    prevout.value = std::move(*value);
  }
  return prevout;
}

crypto::UnblindedOutput VerifyLiquidexProposal(const crypto::ConfidentialEngine& engine,
                                               const LiquidexProposal& proposal) {
  const auto& tx = proposal.tx;
  if (proposal.version != kLiquidexProposalVersion) {
    Invalid("unsupported version " + std::to_string(proposal.version));
  }
  if (tx.vin.size() != 1 || tx.vout.size() != 1) {
    Invalid("expected one input and one output");
  }
  const auto& output = tx.vout[0];
  if (!output.asset.IsCommitment() || !output.value.IsCommitment()) {
    Invalid("maker output is not blinded");
  }
  if (output.script_pubkey.empty()) {
    Invalid("maker output has no script");
  }
  for (const auto* secrets : {&proposal.input, &proposal.output}) {
    if (secrets->value == 0 || !primitives::MoneyRange(secrets->value)) {
      Invalid("amount out of range");
    }
  }
  const auto asset_commitment =
      engine.CommitAsset(proposal.output.asset, proposal.output.asset_blinder);
  const auto value_commitment =
      asset_commitment
          ? engine.CommitValue(proposal.output.value, proposal.output.value_blinder,
                               *asset_commitment)
          : std::nullopt;
  if (!value_commitment || *asset_commitment != output.asset ||
      *value_commitment != output.value) {
    Invalid("output secrets do not open the maker output");
  }

  const auto& input = tx.vin[0];
  const auto& stack = input.witness.script_witness;
  if (stack.size() != 2 || stack[0].size() < 2 || stack[1].size() != 33) {
    Invalid("maker input is not a P2SH-P2WPKH spend");
  }
  crypto::CompressedPublicKey pubkey{};
  std::copy(stack[1].begin(), stack[1].end(), pubkey.begin());
  if (input.script_sig != script::P2shP2wpkhScriptSig(pubkey)) {
    Invalid("maker scriptSig does not match its witness key");
  }
  if (stack[0].back() != kLiquidexSighash) {
    Invalid("maker signature is not SINGLE|ANYONECANPAY");
  }
  const auto prevout = LiquidexPrevout(engine, proposal.input);
  const auto sighash = consensus::ComputeSegwitV0Sighash(
      tx, 0, script::P2wpkhScriptCode(pubkey), prevout.value, kLiquidexSighash);
  if (!crypto::VerifyDerSignature(
          pubkey, sighash, std::span<const std::uint8_t>(stack[0].data(), stack[0].size() - 1))) {
    Invalid("maker signature does not cover the declared input");
  }
  return proposal.output;
}

}  // namespace ctwallet::wallet
