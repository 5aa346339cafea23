#pragma once

#include <array>
#include <cstdint>

namespace ctwallet::primitives {

// Hashes and asset ids are kept in internal byte order; hex display is
// byte-reversed.
using Hash256 = std::array<std::uint8_t, 32>;
using AssetId = Hash256;
using BlindingFactor = std::array<std::uint8_t, 32>;

}  // namespace ctwallet::primitives
