#include "util/hex.hpp"

#include <algorithm>

namespace ctwallet::util {

namespace {

constexpr char kHexLower[] = "0123456789abcdef";

int FromHexDigit(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return 10 + (c - 'a');
  if (c >= 'A' && c <= 'F') return 10 + (c - 'A');
  return -1;
}

}  // namespace

std::string HexEncode(std::span<const std::uint8_t> data) {
  std::string out;
  out.resize(data.size() * 2);
  for (std::size_t i = 0; i < data.size(); ++i) {
    out[i * 2] = kHexLower[(data[i] >> 4) & 0x0F];
    out[i * 2 + 1] = kHexLower[data[i] & 0x0F];
  }
  return out;
}

bool HexDecode(std::string_view hex, std::vector<std::uint8_t>* out) {
  if (hex.size() % 2 != 0) {
    return false;
  }
  out->clear();
  out->reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    const int hi = FromHexDigit(hex[i]);
    const int lo = FromHexDigit(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      out->clear();
      return false;
    }
    out->push_back(static_cast<std::uint8_t>((hi << 4) | lo));
  }
  return true;
}

std::string HexEncodeReversed(std::span<const std::uint8_t> data) {
  std::vector<std::uint8_t> reversed(data.rbegin(), data.rend());
  return HexEncode(reversed);
}

std::optional<std::array<std::uint8_t, 32>> ParseHash256Hex(std::string_view hex) {
  std::vector<std::uint8_t> bytes;
  if (hex.size() != 64 || !HexDecode(hex, &bytes)) {
    return std::nullopt;
  }
  std::array<std::uint8_t, 32> out{};
  std::reverse_copy(bytes.begin(), bytes.end(), out.begin());
  return out;
}

}  // namespace ctwallet::util
