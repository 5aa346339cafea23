#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>

#include "util/argon2_kdf.hpp"

namespace ctwallet::crypto {

// Stored in sealed-store headers; values are part of the file format.
enum class KdfAlgorithm : std::uint8_t {
  kArgon2id = 1,
  kPbkdf2Sha512 = 2,
};

inline constexpr std::uint32_t kDefaultPbkdf2Iterations = 200'000;
inline constexpr std::uint32_t kMaxPbkdf2Iterations = 10'000'000;

struct KdfParams {
  KdfAlgorithm algorithm{KdfAlgorithm::kArgon2id};
  util::Argon2idParams argon2{};
  std::uint32_t pbkdf2_iterations{kDefaultPbkdf2Iterations};
};

std::optional<KdfAlgorithm> KdfAlgorithmFromString(std::string_view name);
std::string_view KdfAlgorithmName(KdfAlgorithm algorithm);

bool CheckKdfParams(const KdfParams& params, std::string* error = nullptr);

// Turns a passphrase into the 32-byte store key.
bool DeriveStoreKey(std::string_view passphrase, std::span<const std::uint8_t> salt,
                    const KdfParams& params, std::array<std::uint8_t, 32>* key,
                    std::string* error = nullptr);

}  // namespace ctwallet::crypto
