#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "primitives/hash.hpp"

namespace ctwallet::config {

enum class NetworkType {
  kLiquid,
  kLiquidTestnet,
  kElementsRegtest,
};

struct NetworkParams {
  NetworkType type{NetworkType::kLiquid};
  std::string name{"liquid"};
  // Base58 version bytes.
  std::uint8_t p2pkh_prefix{57};
  std::uint8_t p2sh_prefix{39};
  std::uint8_t blinded_prefix{12};
  std::uint32_t bip44_coin_type{1776};
  // Regtest chains mint their own policy asset; it must come from config.
  std::optional<primitives::AssetId> policy_asset;
};

const NetworkParams& ParamsFor(NetworkType type);
std::optional<NetworkType> NetworkFromString(std::string_view name);
std::string_view NetworkName(NetworkType type);

}  // namespace ctwallet::config
