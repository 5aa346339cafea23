#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string>
#include <string_view>
#include <vector>

#include "util/aead.hpp"
#include "util/hex.hpp"

namespace {

std::vector<std::uint8_t> FromHex(std::string_view hex) {
  std::vector<std::uint8_t> out;
  if (!ctwallet::util::HexDecode(hex, &out)) {
    std::cerr << "bad test hex\n";
    std::exit(EXIT_FAILURE);
  }
  return out;
}

}  // namespace

int main() {
  using namespace ctwallet::util;

  // RFC 8439 section 2.8.2.
  std::vector<std::uint8_t> key(32);
  for (std::size_t i = 0; i < key.size(); ++i) {
    key[i] = static_cast<std::uint8_t>(0x80 + i);
  }
  const auto nonce = FromHex("070000004041424344454647");
  const auto aad = FromHex("50515253c0c1c2c3c4c5c6c7");
  const std::string text =
      "Ladies and Gentlemen of the class of '99: If I could offer you only one tip for the "
      "future, sunscreen would be it.";
  const std::vector<std::uint8_t> plaintext(text.begin(), text.end());

  AeadTag tag{};
  const auto ciphertext = ChaCha20Poly1305Seal(key, nonce, aad, plaintext, &tag);
  const std::string expected_ct =
      "d31a8d34648e60db7b86afbc53ef7ec2a4aded51296e08fea9e2b5a736ee62d63dbea45e8ca9671282fafb69da"
      "92728b1a71de0a9e060b2905d6a5b67ecd3b3692ddbd7f2d778b8c9803aee328091b58fab324e4fad6759455"
      "85808b4831d7bc3ff4def08e4b7a9de576d26586cec64b6116";
  if (HexEncode(ciphertext) != expected_ct) {
    std::cerr << "ciphertext mismatch: " << HexEncode(ciphertext) << "\n";
    return EXIT_FAILURE;
  }
  if (HexEncode(tag) != "1ae10b594f09e26a7e902ecbd0600691") {
    std::cerr << "tag mismatch: " << HexEncode(tag) << "\n";
    return EXIT_FAILURE;
  }

  std::vector<std::uint8_t> opened;
  if (!ChaCha20Poly1305Open(key, nonce, aad, ciphertext, tag, &opened) || opened != plaintext) {
    std::cerr << "open failed\n";
    return EXIT_FAILURE;
  }

  // Any change to the ciphertext, the associated data or the tag must fail.
  {
    auto tampered = ciphertext;
    tampered[5] ^= 0x01;
    if (ChaCha20Poly1305Open(key, nonce, aad, tampered, tag, &opened) || !opened.empty()) {
      std::cerr << "tampered ciphertext opened\n";
      return EXIT_FAILURE;
    }
  }
  {
    auto other_aad = aad;
    other_aad.back() ^= 0x80;
    if (ChaCha20Poly1305Open(key, nonce, other_aad, ciphertext, tag, &opened)) {
      std::cerr << "tampered aad opened\n";
      return EXIT_FAILURE;
    }
  }
  {
    auto bad_tag = tag;
    bad_tag[0] ^= 0xff;
    if (ChaCha20Poly1305Open(key, nonce, aad, ciphertext, bad_tag, &opened)) {
      std::cerr << "bad tag accepted\n";
      return EXIT_FAILURE;
    }
  }

  try {
    const std::vector<std::uint8_t> short_key(16);
    ChaCha20Poly1305Seal(short_key, nonce, aad, plaintext, &tag);
    std::cerr << "short key accepted\n";
    return EXIT_FAILURE;
  } catch (const std::invalid_argument&) {
  }

  return EXIT_SUCCESS;
}
