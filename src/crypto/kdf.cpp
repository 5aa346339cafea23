#include "crypto/kdf.hpp"

#include <algorithm>
#include <vector>

#include "crypto/pbkdf2.hpp"
#include "util/secure_wipe.hpp"

namespace ctwallet::crypto {

std::optional<KdfAlgorithm> KdfAlgorithmFromString(std::string_view name) {
  if (name == "argon2id") return KdfAlgorithm::kArgon2id;
  if (name == "pbkdf2-sha512" || name == "pbkdf2") return KdfAlgorithm::kPbkdf2Sha512;
  return std::nullopt;
}

std::string_view KdfAlgorithmName(KdfAlgorithm algorithm) {
  switch (algorithm) {
    case KdfAlgorithm::kArgon2id:
      return "argon2id";
    case KdfAlgorithm::kPbkdf2Sha512:
      return "pbkdf2-sha512";
  }
  return "unknown";
}

bool CheckKdfParams(const KdfParams& params, std::string* error) {
  switch (params.algorithm) {
    case KdfAlgorithm::kArgon2id:
      return util::CheckArgon2idParams(params.argon2, error);
    case KdfAlgorithm::kPbkdf2Sha512:
      if (params.pbkdf2_iterations == 0 || params.pbkdf2_iterations > kMaxPbkdf2Iterations) {
        if (error) *error = "pbkdf2 iteration count out of range";
        return false;
      }
      return true;
  }
  if (error) *error = "unknown kdf algorithm";
  return false;
}

bool DeriveStoreKey(std::string_view passphrase, std::span<const std::uint8_t> salt,
                    const KdfParams& params, std::array<std::uint8_t, 32>* key,
                    std::string* error) {
  if (!CheckKdfParams(params, error)) {
    return false;
  }
  std::vector<std::uint8_t> derived;
  if (params.algorithm == KdfAlgorithm::kArgon2id) {
    if (!util::DeriveKeyArgon2id(passphrase, salt, params.argon2, key->size(), &derived, error)) {
      return false;
    }
  } else {
    derived = Pbkdf2HmacSha512(passphrase, salt, params.pbkdf2_iterations, key->size());
  }
  std::copy(derived.begin(), derived.end(), key->begin());
  util::SecureWipe(derived);
  return true;
}

}  // namespace ctwallet::crypto
