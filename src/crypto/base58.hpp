#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ctwallet::crypto {

std::string Base58Encode(std::span<const std::uint8_t> data);
bool Base58Decode(std::string_view text, std::vector<std::uint8_t>* out);

// Base58 with a 4-byte double-SHA256 checksum suffix.
std::string Base58CheckEncode(std::span<const std::uint8_t> payload);
std::optional<std::vector<std::uint8_t>> Base58CheckDecode(std::string_view text);

}  // namespace ctwallet::crypto
