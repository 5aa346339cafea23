#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "config/network.hpp"
#include "crypto/ec_key.hpp"
#include "script/script.hpp"

namespace ctwallet::crypto {

enum class AddressType {
  kP2pkh,
  kP2sh,
};

struct DecodedAddress {
  AddressType type{AddressType::kP2sh};
  script::ScriptHash160 hash{};
  // Present for confidential (blinded) addresses.
  std::optional<CompressedPublicKey> blinding_pubkey;

  bool IsConfidential() const noexcept { return blinding_pubkey.has_value(); }
  script::ScriptPubKey ScriptPubKey() const;
};

// Base58Check(blinded_prefix || p2sh_prefix || blinding_pubkey || hash160).
std::string EncodeConfidentialAddress(const config::NetworkParams& params,
                                      const CompressedPublicKey& blinding_pubkey,
                                      const script::ScriptHash160& script_hash,
                                      AddressType type = AddressType::kP2sh);
std::string EncodeUnconfidentialAddress(const config::NetworkParams& params,
                                        const script::ScriptHash160& hash,
                                        AddressType type = AddressType::kP2sh);

// Rejects bad checksums, unknown prefixes, prefixes of other networks and
// blinding keys that are not valid curve points.
std::optional<DecodedAddress> DecodeAddress(const config::NetworkParams& params,
                                            std::string_view text, std::string* error = nullptr);

}  // namespace ctwallet::crypto
