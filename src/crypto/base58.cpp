#include "crypto/base58.hpp"

#include <algorithm>
#include <cstring>

#include "crypto/hash.hpp"

namespace ctwallet::crypto {

namespace {

constexpr const char* kAlphabet = "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

int DigitValue(char c) {
  const char* p = std::strchr(kAlphabet, c);
  return (p != nullptr && c != '\0') ? static_cast<int>(p - kAlphabet) : -1;
}

}  // namespace

std::string Base58Encode(std::span<const std::uint8_t> data) {
  std::size_t zeros = 0;
  while (zeros < data.size() && data[zeros] == 0) {
    ++zeros;
  }
  // log(256) / log(58) ~= 1.37
  std::vector<std::uint8_t> digits((data.size() - zeros) * 138 / 100 + 1, 0);
  std::size_t used = 0;
  for (std::size_t i = zeros; i < data.size(); ++i) {
    int carry = data[i];
    std::size_t k = 0;
    for (auto it = digits.rbegin(); (carry != 0 || k < used) && it != digits.rend(); ++it, ++k) {
      carry += 256 * (*it);
      *it = static_cast<std::uint8_t>(carry % 58);
      carry /= 58;
    }
    used = k;
  }
  auto it = std::find_if(digits.begin(), digits.end(), [](std::uint8_t d) { return d != 0; });
  std::string out(zeros, '1');
  for (; it != digits.end(); ++it) {
    out.push_back(kAlphabet[*it]);
  }
  return out;
}

bool Base58Decode(std::string_view text, std::vector<std::uint8_t>* out) {
  std::size_t zeros = 0;
  while (zeros < text.size() && text[zeros] == '1') {
    ++zeros;
  }
  // log(58) / log(256) ~= 0.733
  std::vector<std::uint8_t> bytes((text.size() - zeros) * 733 / 1000 + 1, 0);
  std::size_t used = 0;
  for (std::size_t i = zeros; i < text.size(); ++i) {
    int carry = DigitValue(text[i]);
    if (carry < 0) {
      return false;
    }
    std::size_t k = 0;
    for (auto it = bytes.rbegin(); (carry != 0 || k < used) && it != bytes.rend(); ++it, ++k) {
      carry += 58 * (*it);
      *it = static_cast<std::uint8_t>(carry % 256);
      carry /= 256;
    }
    used = k;
  }
  auto it = std::find_if(bytes.begin(), bytes.end(), [](std::uint8_t b) { return b != 0; });
  out->assign(zeros, 0);
  out->insert(out->end(), it, bytes.end());
  return true;
}

std::string Base58CheckEncode(std::span<const std::uint8_t> payload) {
  std::vector<std::uint8_t> data(payload.begin(), payload.end());
  const auto checksum = DoubleSha256(payload);
  data.insert(data.end(), checksum.begin(), checksum.begin() + 4);
  return Base58Encode(data);
}

std::optional<std::vector<std::uint8_t>> Base58CheckDecode(std::string_view text) {
  std::vector<std::uint8_t> data;
  if (!Base58Decode(text, &data) || data.size() < 4) {
    return std::nullopt;
  }
  const std::span<const std::uint8_t> payload(data.data(), data.size() - 4);
  const auto checksum = DoubleSha256(payload);
  if (!std::equal(checksum.begin(), checksum.begin() + 4, data.end() - 4)) {
    return std::nullopt;
  }
  return std::vector<std::uint8_t>(payload.begin(), payload.end());
}

}  // namespace ctwallet::crypto
