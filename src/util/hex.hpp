#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ctwallet::util {

std::string HexEncode(std::span<const std::uint8_t> data);
bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out);

// Hashes (txids, block hashes, asset ids) are displayed byte-reversed.
std::string HexEncodeReversed(std::span<const std::uint8_t> data);
std::optional<std::array<std::uint8_t, 32>> ParseHash256Hex(std::string_view hex);

}  // namespace ctwallet::util
