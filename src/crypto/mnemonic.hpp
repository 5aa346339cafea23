#pragma once

#include <array>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ctwallet::crypto {

// BIP-39 seed: PBKDF2-HMAC-SHA512(sentence, "mnemonic" + passphrase, 2048, 64).
// The sentence must already be normalized (see NormalizeMnemonic).
std::array<std::uint8_t, 64> MnemonicSeedFromSentence(std::string_view mnemonic_sentence,
                                                      std::string_view passphrase);

const std::vector<std::string>& EnglishMnemonicWordlist();

// Lowercases and collapses whitespace to single ASCII spaces.
std::string NormalizeMnemonic(std::string_view mnemonic_sentence);

// Validates word count (12, 15, 18, 21 or 24), membership in the English
// wordlist and the SHA-256 checksum. On failure writes a reason to `error`.
bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* error = nullptr);

// Encodes 16..32 bytes of entropy (a multiple of 4) as a sentence.
// Throws std::invalid_argument for other lengths.
std::string MnemonicFromEntropy(std::span<const std::uint8_t> entropy);

}  // namespace ctwallet::crypto
