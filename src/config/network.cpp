#include "config/network.hpp"

#include <stdexcept>

#include "util/hex.hpp"

namespace ctwallet::config {

namespace {

constexpr std::string_view kLiquidPolicyAsset =
    "6f0279e9ed041c3d710a9f57d0c02928416460c4b722ae3457a11eec381c526d";
constexpr std::string_view kLiquidTestnetPolicyAsset =
    "144c654344aa716d6f3abcc1ca90e5641e4e2a7f633bc09fe3baf64585819a49";

NetworkParams BuildParams(NetworkType type, std::string name, std::uint8_t p2pkh,
                          std::uint8_t p2sh, std::uint8_t blinded, std::uint32_t coin_type,
                          std::string_view policy_asset_hex) {
  NetworkParams params;
  params.type = type;
  params.name = std::move(name);
  params.p2pkh_prefix = p2pkh;
  params.p2sh_prefix = p2sh;
  params.blinded_prefix = blinded;
  params.bip44_coin_type = coin_type;
  if (!policy_asset_hex.empty()) {
    params.policy_asset = util::ParseHash256Hex(policy_asset_hex);
    if (!params.policy_asset) {
      throw std::logic_error("invalid built-in policy asset");
    }
  }
  return params;
}

}  // namespace

const NetworkParams& ParamsFor(NetworkType type) {
  static const NetworkParams liquid = BuildParams(NetworkType::kLiquid, "liquid", 57, 39, 12,
                                                  1776, kLiquidPolicyAsset);
  static const NetworkParams testnet = BuildParams(NetworkType::kLiquidTestnet, "liquid-testnet",
                                                   36, 19, 23, 1, kLiquidTestnetPolicyAsset);
  static const NetworkParams regtest =
      BuildParams(NetworkType::kElementsRegtest, "elements-regtest", 235, 75, 4, 1, {});
  switch (type) {
    case NetworkType::kLiquid:
      return liquid;
    case NetworkType::kLiquidTestnet:
      return testnet;
    case NetworkType::kElementsRegtest:
      return regtest;
  }
  return liquid;
}

std::optional<NetworkType> NetworkFromString(std::string_view name) {
  if (name == "liquid" || name == "liquidv1" || name == "mainnet") return NetworkType::kLiquid;
  if (name == "liquid-testnet" || name == "liquidtestnet" || name == "testnet") {
    return NetworkType::kLiquidTestnet;
  }
  if (name == "elements-regtest" || name == "elementsregtest" || name == "regtest") {
    return NetworkType::kElementsRegtest;
  }
  return std::nullopt;
}

std::string_view NetworkName(NetworkType type) { return ParamsFor(type).name; }

}  // namespace ctwallet::config
