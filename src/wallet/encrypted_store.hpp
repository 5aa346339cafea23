#pragma once

#include <array>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <span>
#include <string_view>
#include <vector>

#include "crypto/kdf.hpp"
#include "util/aead.hpp"

namespace ctwallet::wallet {

inline constexpr std::uint16_t kStoreFormatVersion = 1;
inline constexpr std::size_t kStoreSaltSize = 16;

// On-disk envelope:
//   "CTWS" | u16 version | u8 kdf id | salt[16] | u32 kdf params x3 |
//   nonce[12] | u32 ciphertext length | ciphertext | tag[16]
// Everything before the nonce is authenticated as associated data.
struct SealedBlob {
  std::uint16_t version{kStoreFormatVersion};
  crypto::KdfParams kdf{};
  std::array<std::uint8_t, kStoreSaltSize> salt{};
  std::array<std::uint8_t, util::kChaCha20Poly1305NonceSize> nonce{};
  std::vector<std::uint8_t> ciphertext;
  util::AeadTag tag{};

  std::vector<std::uint8_t> AssociatedData() const;
  std::vector<std::uint8_t> Serialize() const;
  // Throws WalletError(kAuthenticationFailed) for a malformed envelope:
  // a damaged container is indistinguishable from a tampered one.
  static SealedBlob Parse(std::span<const std::uint8_t> bytes);
};

// Symmetric key bound to the KDF header it was derived with.
class StoreKey {
 public:
  StoreKey(const std::array<std::uint8_t, 32>& key, const crypto::KdfParams& params,
           const std::array<std::uint8_t, kStoreSaltSize>& salt);
  StoreKey(const StoreKey&) = default;
  StoreKey& operator=(const StoreKey&) = default;
  ~StoreKey();

  const std::array<std::uint8_t, 32>& bytes() const noexcept { return key_; }
  const crypto::KdfParams& params() const noexcept { return params_; }
  const std::array<std::uint8_t, kStoreSaltSize>& salt() const noexcept { return salt_; }

 private:
  std::array<std::uint8_t, 32> key_{};
  crypto::KdfParams params_{};
  std::array<std::uint8_t, kStoreSaltSize> salt_{};
};

class EncryptedStore {
 public:
  // An empty path keeps blobs in memory only.
  explicit EncryptedStore(std::filesystem::path path);

  // Fresh random salt. Throws WalletError(kInvalidConfig) for bad params.
  static StoreKey DeriveKey(std::string_view passphrase, const crypto::KdfParams& params);
  // Re-derives the key recorded in a blob's header. Header parameters are
  // capped before any work is done.
  static StoreKey DeriveKeyFor(std::string_view passphrase, const SealedBlob& blob);

  static SealedBlob Seal(std::span<const std::uint8_t> plaintext, const StoreKey& key,
                         std::uint16_t version = kStoreFormatVersion);
  // Throws kAuthenticationFailed on a tag mismatch (tampering or wrong key)
  // and kStoreCorrupt when an authentic blob carries an unsupported version.
  static std::vector<std::uint8_t> Open(const SealedBlob& blob, const StoreKey& key);

  // Atomic replace. Throws WalletError(kStoreIo).
  void Persist(const SealedBlob& blob);
  // Throws kNotFound when nothing has been persisted yet.
  SealedBlob Load() const;
  bool Exists() const;

  // Re-seals the current plaintext under a new passphrase, fresh salt and
  // nonce. Nothing else about the stored state changes.
  void ChangePassphrase(std::string_view old_passphrase, std::string_view new_passphrase,
                        const crypto::KdfParams& new_params);

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_;
  mutable std::mutex mutex_;
  std::optional<std::vector<std::uint8_t>> memory_blob_;
};

}  // namespace ctwallet::wallet
