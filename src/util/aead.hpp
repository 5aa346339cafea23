#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <vector>

namespace ctwallet::util {

constexpr std::size_t kChaCha20Poly1305KeySize = 32;
constexpr std::size_t kChaCha20Poly1305NonceSize = 12;
constexpr std::size_t kChaCha20Poly1305TagSize = 16;

using AeadTag = std::array<std::uint8_t, kChaCha20Poly1305TagSize>;

// RFC 8439 ChaCha20-Poly1305 with a detached tag. Throws std::invalid_argument
// on a malformed key or nonce.
std::vector<std::uint8_t> ChaCha20Poly1305Seal(std::span<const std::uint8_t> key,
                                               std::span<const std::uint8_t> nonce,
                                               std::span<const std::uint8_t> aad,
                                               std::span<const std::uint8_t> plaintext,
                                               AeadTag* tag);

// Returns false (and leaves `plaintext` empty) when the tag does not verify.
bool ChaCha20Poly1305Open(std::span<const std::uint8_t> key,
                          std::span<const std::uint8_t> nonce,
                          std::span<const std::uint8_t> aad,
                          std::span<const std::uint8_t> ciphertext,
                          const AeadTag& tag,
                          std::vector<std::uint8_t>* plaintext);

}  // namespace ctwallet::util
