#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ctwallet::script {

inline constexpr std::uint8_t kOp0 = 0x00;
inline constexpr std::uint8_t kOpDup = 0x76;
inline constexpr std::uint8_t kOpEqual = 0x87;
inline constexpr std::uint8_t kOpEqualVerify = 0x88;
inline constexpr std::uint8_t kOpHash160 = 0xa9;
inline constexpr std::uint8_t kOpCheckSig = 0xac;
inline constexpr std::size_t kHash160Size = 20;

using ScriptHash160 = std::array<std::uint8_t, kHash160Size>;

struct ScriptPubKey {
  std::vector<std::uint8_t> data;
};

// OP_0 <hash160(pubkey)>
std::vector<std::uint8_t> P2wpkhRedeemScript(std::span<const std::uint8_t> pubkey);
// OP_HASH160 <hash> OP_EQUAL
ScriptPubKey P2shScriptPubKey(const ScriptHash160& script_hash);
// OP_DUP OP_HASH160 <hash> OP_EQUALVERIFY OP_CHECKSIG
ScriptPubKey P2pkhScriptPubKey(const ScriptHash160& key_hash);

// Wallet outputs are P2SH-wrapped P2WPKH.
ScriptPubKey P2shP2wpkhScriptPubKey(std::span<const std::uint8_t> pubkey);
// scriptSig holding a single push of the redeem script.
std::vector<std::uint8_t> P2shP2wpkhScriptSig(std::span<const std::uint8_t> pubkey);
// BIP-143 scriptCode for P2WPKH (P2PKH template, no length prefix).
std::vector<std::uint8_t> P2wpkhScriptCode(std::span<const std::uint8_t> pubkey);

bool ExtractP2shHash(const ScriptPubKey& script, ScriptHash160* hash);
bool ExtractP2pkhHash(const ScriptPubKey& script, ScriptHash160* hash);

// Electrum subscription key: SHA-256 of the script, byte-reversed, hex.
std::string ElectrumScriptHash(std::span<const std::uint8_t> script_pubkey);

}  // namespace ctwallet::script
