#include "crypto/mnemonic.hpp"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <unordered_map>

#include "crypto/hash.hpp"
#include "crypto/mnemonic_wordlist_en.hpp"
#include "crypto/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

namespace {

const std::unordered_map<std::string, std::uint16_t>& EnglishMnemonicWordIndex() {
  static const std::unordered_map<std::string, std::uint16_t> index = [] {
    std::unordered_map<std::string, std::uint16_t> out;
    const auto& wordlist = EnglishMnemonicWordlist();
    out.reserve(wordlist.size());
    for (std::size_t i = 0; i < wordlist.size(); ++i) {
      out.emplace(wordlist[i], static_cast<std::uint16_t>(i));
    }
    return out;
  }();
  return index;
}

bool IsSpace(char ch) { return std::isspace(static_cast<unsigned char>(ch)) != 0; }

std::vector<std::string> SplitWords(std::string_view sentence) {
  std::vector<std::string> words;
  std::size_t pos = 0;
  while (pos < sentence.size()) {
    while (pos < sentence.size() && IsSpace(sentence[pos])) {
      ++pos;
    }
    const std::size_t start = pos;
    while (pos < sentence.size() && !IsSpace(sentence[pos])) {
      ++pos;
    }
    if (pos > start) {
      std::string word(sentence.substr(start, pos - start));
      for (char& ch : word) {
        ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
      }
      words.push_back(std::move(word));
    }
  }
  return words;
}

void WipeWords(std::vector<std::string>& words) {
  for (auto& word : words) {
    util::SecureWipe(word);
  }
  words.clear();
}

}  // namespace

std::array<std::uint8_t, 64> MnemonicSeedFromSentence(std::string_view mnemonic_sentence,
                                                      std::string_view passphrase) {
  std::string salt = "mnemonic";
  salt.append(passphrase);
  const auto salt_bytes = std::span<const std::uint8_t>(
      reinterpret_cast<const std::uint8_t*>(salt.data()), salt.size());

  auto seed_vec = Pbkdf2HmacSha512(mnemonic_sentence, salt_bytes, 2048u, 64u);
  std::array<std::uint8_t, 64> seed{};
  std::copy_n(seed_vec.begin(), seed.size(), seed.begin());
  util::SecureWipe(seed_vec);
  util::SecureWipe(salt);
  return seed;
}

const std::vector<std::string>& EnglishMnemonicWordlist() {
  static const std::vector<std::string> wordlist = [] {
    std::vector<std::string> out;
    out.reserve(kEnglishMnemonicWordlistEn.size());
    for (const auto word : kEnglishMnemonicWordlistEn) {
      out.emplace_back(word);
    }
    return out;
  }();
  return wordlist;
}

std::string NormalizeMnemonic(std::string_view mnemonic_sentence) {
  auto words = SplitWords(mnemonic_sentence);
  std::string out;
  for (const auto& word : words) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out.append(word);
  }
  WipeWords(words);
  return out;
}

bool ValidateMnemonic(std::string_view mnemonic_sentence, std::string* error) {
  if (error) {
    error->clear();
  }
  auto words = SplitWords(mnemonic_sentence);
  const std::size_t count = words.size();
  if (count < 12 || count > 24 || count % 3 != 0) {
    if (error) {
      *error = "mnemonic must contain 12, 15, 18, 21 or 24 words";
    }
    WipeWords(words);
    return false;
  }

  const auto& index = EnglishMnemonicWordIndex();
  const std::size_t total_bits = count * 11;
  const std::size_t checksum_bits = total_bits / 33;
  const std::size_t entropy_bits = total_bits - checksum_bits;
  std::vector<std::uint8_t> packed((total_bits + 7) / 8, 0);
  std::size_t bit_pos = 0;
  for (const auto& word : words) {
    const auto it = index.find(word);
    if (it == index.end()) {
      if (error) {
        *error = "mnemonic contains a word not in the English wordlist";
      }
      util::SecureWipe(packed);
      WipeWords(words);
      return false;
    }
    for (int bit = 10; bit >= 0; --bit) {
      if (((it->second >> bit) & 0x01u) != 0) {
        packed[bit_pos / 8] |= static_cast<std::uint8_t>(1u << (7 - (bit_pos % 8)));
      }
      ++bit_pos;
    }
  }
  WipeWords(words);

  std::vector<std::uint8_t> entropy(packed.begin(),
                                    packed.begin() + static_cast<std::ptrdiff_t>(entropy_bits / 8));
  const auto hash = Sha256(entropy);
  util::SecureWipe(entropy);
  bool ok = true;
  for (std::size_t i = 0; i < checksum_bits; ++i) {
    const std::size_t pos = entropy_bits + i;
    const bool expected = ((hash[i / 8] >> (7 - (i % 8))) & 0x01u) != 0;
    const bool actual = ((packed[pos / 8] >> (7 - (pos % 8))) & 0x01u) != 0;
    ok = ok && expected == actual;
  }
  util::SecureWipe(packed);
  if (!ok && error) {
    *error = "mnemonic checksum mismatch";
  }
  return ok;
}

std::string MnemonicFromEntropy(std::span<const std::uint8_t> entropy) {
  if (entropy.size() < 16 || entropy.size() > 32 || entropy.size() % 4 != 0) {
    throw std::invalid_argument("mnemonic entropy must be 16..32 bytes in steps of 4");
  }
  const auto hash = Sha256(entropy);
  const std::size_t entropy_bits = entropy.size() * 8;
  const std::size_t total_bits = entropy_bits + entropy_bits / 32;
  auto bit_at = [&](std::size_t pos) -> unsigned {
    if (pos < entropy_bits) {
      return (entropy[pos / 8] >> (7 - (pos % 8))) & 0x01u;
    }
    const std::size_t c = pos - entropy_bits;
    return (hash[c / 8] >> (7 - (c % 8))) & 0x01u;
  };
  const auto& wordlist = EnglishMnemonicWordlist();
  std::string sentence;
  for (std::size_t start = 0; start < total_bits; start += 11) {
    unsigned value = 0;
    for (std::size_t i = 0; i < 11; ++i) {
      value = (value << 1) | bit_at(start + i);
    }
    if (!sentence.empty()) {
      sentence.push_back(' ');
    }
    sentence.append(wordlist[value]);
  }
  return sentence;
}

}  // namespace ctwallet::crypto
