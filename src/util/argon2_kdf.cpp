#include "util/argon2_kdf.hpp"

#include <argon2.h>

namespace ctwallet::util {

bool CheckArgon2idParams(const Argon2idParams& params, std::string* error) {
  if (params.t_cost == 0 || params.m_cost_kib == 0 || params.parallelism == 0) {
    if (error) {
      *error = "Argon2id parameters must be non-zero";
    }
    return false;
  }
  if (params.t_cost > kMaxArgon2idT || params.m_cost_kib > kMaxArgon2idMemoryKiB ||
      params.parallelism > kMaxArgon2idParallelism) {
    if (error) {
      *error = "Argon2id parameters exceed maximums (t_cost=" + std::to_string(params.t_cost) +
               ", m_cost_kib=" + std::to_string(params.m_cost_kib) +
               ", parallelism=" + std::to_string(params.parallelism) + ")";
    }
    return false;
  }
  // libargon2 requires at least 8 KiB per lane.
  if (params.m_cost_kib < 8 * params.parallelism) {
    if (error) {
      *error = "Argon2id memory cost below 8 KiB per lane";
    }
    return false;
  }
  return true;
}

bool DeriveKeyArgon2id(std::string_view password,
                       std::span<const std::uint8_t> salt,
                       const Argon2idParams& params,
                       std::size_t key_size,
                       std::vector<std::uint8_t>* key_out,
                       std::string* error) {
  if (!key_out) return false;
  if (!CheckArgon2idParams(params, error)) {
    return false;
  }
  key_out->assign(key_size, 0);
  const int rc = argon2id_hash_raw(params.t_cost, params.m_cost_kib, params.parallelism,
                                   password.data(), password.size(), salt.data(), salt.size(),
                                   key_out->data(), key_out->size());
  if (rc != ARGON2_OK) {
    key_out->clear();
    if (error) {
      *error = std::string("argon2id failed: ") + argon2_error_message(rc);
    }
    return false;
  }
  return true;
}

}  // namespace ctwallet::util
