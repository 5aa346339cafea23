#include "script/script.hpp"

#include <algorithm>

#include "crypto/hash.hpp"
#include "util/hex.hpp"

namespace ctwallet::script {

std::vector<std::uint8_t> P2wpkhRedeemScript(std::span<const std::uint8_t> pubkey) {
  const auto key_hash = crypto::HashOf160(pubkey);
  std::vector<std::uint8_t> redeem;
  redeem.reserve(2 + kHash160Size);
  redeem.push_back(kOp0);
  redeem.push_back(static_cast<std::uint8_t>(kHash160Size));
  redeem.insert(redeem.end(), key_hash.begin(), key_hash.end());
  return redeem;
}

ScriptPubKey P2shScriptPubKey(const ScriptHash160& script_hash) {
  ScriptPubKey script;
  script.data.reserve(3 + kHash160Size);
  script.data.push_back(kOpHash160);
  script.data.push_back(static_cast<std::uint8_t>(kHash160Size));
  script.data.insert(script.data.end(), script_hash.begin(), script_hash.end());
  script.data.push_back(kOpEqual);
  return script;
}

ScriptPubKey P2pkhScriptPubKey(const ScriptHash160& key_hash) {
  ScriptPubKey script;
  script.data.reserve(5 + kHash160Size);
  script.data.push_back(kOpDup);
  script.data.push_back(kOpHash160);
  script.data.push_back(static_cast<std::uint8_t>(kHash160Size));
  script.data.insert(script.data.end(), key_hash.begin(), key_hash.end());
  script.data.push_back(kOpEqualVerify);
  script.data.push_back(kOpCheckSig);
  return script;
}

ScriptPubKey P2shP2wpkhScriptPubKey(std::span<const std::uint8_t> pubkey) {
  const auto redeem = P2wpkhRedeemScript(pubkey);
  return P2shScriptPubKey(crypto::HashOf160(redeem));
}

std::vector<std::uint8_t> P2shP2wpkhScriptSig(std::span<const std::uint8_t> pubkey) {
  const auto redeem = P2wpkhRedeemScript(pubkey);
  std::vector<std::uint8_t> script_sig;
  script_sig.reserve(1 + redeem.size());
  script_sig.push_back(static_cast<std::uint8_t>(redeem.size()));
  script_sig.insert(script_sig.end(), redeem.begin(), redeem.end());
  return script_sig;
}

std::vector<std::uint8_t> P2wpkhScriptCode(std::span<const std::uint8_t> pubkey) {
  return P2pkhScriptPubKey(crypto::HashOf160(pubkey)).data;
}

bool ExtractP2shHash(const ScriptPubKey& script, ScriptHash160* hash) {
  const auto& d = script.data;
  if (d.size() != 3 + kHash160Size || d[0] != kOpHash160 || d[1] != kHash160Size ||
      d.back() != kOpEqual) {
    return false;
  }
  if (hash != nullptr) {
    std::copy(d.begin() + 2, d.begin() + 2 + kHash160Size, hash->begin());
  }
  return true;
}

bool ExtractP2pkhHash(const ScriptPubKey& script, ScriptHash160* hash) {
  const auto& d = script.data;
  if (d.size() != 5 + kHash160Size || d[0] != kOpDup || d[1] != kOpHash160 ||
      d[2] != kHash160Size || d[23] != kOpEqualVerify || d[24] != kOpCheckSig) {
    return false;
  }
  if (hash != nullptr) {
    std::copy(d.begin() + 3, d.begin() + 3 + kHash160Size, hash->begin());
  }
  return true;
}

std::string ElectrumScriptHash(std::span<const std::uint8_t> script_pubkey) {
  return util::HexEncodeReversed(crypto::Sha256(script_pubkey));
}

}  // namespace ctwallet::script
