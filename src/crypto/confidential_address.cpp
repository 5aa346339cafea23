#include "crypto/confidential_address.hpp"

#include <algorithm>

#include "crypto/base58.hpp"

namespace ctwallet::crypto {

namespace {

constexpr std::size_t kUnconfidentialPayloadSize = 1 + script::kHash160Size;
constexpr std::size_t kConfidentialPayloadSize = 2 + 33 + script::kHash160Size;

std::uint8_t PrefixFor(const config::NetworkParams& params, AddressType type) {
  return type == AddressType::kP2sh ? params.p2sh_prefix : params.p2pkh_prefix;
}

std::optional<AddressType> TypeForPrefix(const config::NetworkParams& params,
                                         std::uint8_t prefix) {
  if (prefix == params.p2sh_prefix) return AddressType::kP2sh;
  if (prefix == params.p2pkh_prefix) return AddressType::kP2pkh;
  return std::nullopt;
}

std::optional<DecodedAddress> Reject(std::string* error, const char* message) {
  if (error) *error = message;
  return std::nullopt;
}

}  // namespace

script::ScriptPubKey DecodedAddress::ScriptPubKey() const {
  return type == AddressType::kP2sh ? script::P2shScriptPubKey(hash)
                                    : script::P2pkhScriptPubKey(hash);
}

std::string EncodeConfidentialAddress(const config::NetworkParams& params,
                                      const CompressedPublicKey& blinding_pubkey,
                                      const script::ScriptHash160& script_hash,
                                      AddressType type) {
  std::vector<std::uint8_t> payload;
  payload.reserve(kConfidentialPayloadSize);
  payload.push_back(params.blinded_prefix);
  payload.push_back(PrefixFor(params, type));
  payload.insert(payload.end(), blinding_pubkey.begin(), blinding_pubkey.end());
  payload.insert(payload.end(), script_hash.begin(), script_hash.end());
  return Base58CheckEncode(payload);
}

std::string EncodeUnconfidentialAddress(const config::NetworkParams& params,
                                        const script::ScriptHash160& hash, AddressType type) {
  std::vector<std::uint8_t> payload;
  payload.reserve(kUnconfidentialPayloadSize);
  payload.push_back(PrefixFor(params, type));
  payload.insert(payload.end(), hash.begin(), hash.end());
  return Base58CheckEncode(payload);
}

std::optional<DecodedAddress> DecodeAddress(const config::NetworkParams& params,
                                            std::string_view text, std::string* error) {
  const auto payload = Base58CheckDecode(text);
  if (!payload) {
    return Reject(error, "invalid base58check encoding");
  }
  DecodedAddress decoded;
  std::size_t hash_offset = 0;
  if (payload->size() == kConfidentialPayloadSize) {
    if ((*payload)[0] != params.blinded_prefix) {
      return Reject(error, "confidential prefix does not match network");
    }
    const auto type = TypeForPrefix(params, (*payload)[1]);
    if (!type) {
      return Reject(error, "unknown address prefix");
    }
    decoded.type = *type;
    CompressedPublicKey pubkey{};
    std::copy(payload->begin() + 2, payload->begin() + 35, pubkey.begin());
    secp256k1_pubkey parsed;
    if (!ParsePublicKey(pubkey, &parsed)) {
      return Reject(error, "invalid blinding public key");
    }
    decoded.blinding_pubkey = pubkey;
    hash_offset = 35;
  } else if (payload->size() == kUnconfidentialPayloadSize) {
    const auto type = TypeForPrefix(params, (*payload)[0]);
    if (!type) {
      return Reject(error, "address prefix does not match network");
    }
    decoded.type = *type;
    hash_offset = 1;
  } else {
    return Reject(error, "unexpected address length");
  }
  std::copy(payload->begin() + static_cast<std::ptrdiff_t>(hash_offset), payload->end(),
            decoded.hash.begin());
  return decoded;
}

}  // namespace ctwallet::crypto
