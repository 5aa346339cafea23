#include "wallet/encrypted_store.hpp"

#include <algorithm>
#include <limits>
#include <string>

#include "primitives/serialize.hpp"
#include "util/atomic_file.hpp"
#include "util/csprng.hpp"
#include "util/logging.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"

namespace ctwallet::wallet {

namespace {

constexpr std::array<std::uint8_t, 4> kStoreMagic{'C', 'T', 'W', 'S'};
constexpr std::size_t kKdfParamsSize = 12;
constexpr std::size_t kHeaderSize = kStoreMagic.size() + 2 + 1 + kStoreSaltSize + kKdfParamsSize;
constexpr std::string_view kLogComponent = "store";

[[noreturn]] void Tampered(const char* what) {
  throw WalletError(ErrorCode::kAuthenticationFailed, std::string("sealed store: ") + what);
}

void AppendKdfParams(std::vector<std::uint8_t>* out, const crypto::KdfParams& kdf) {
  using primitives::serialize::WriteUint32;
  if (kdf.algorithm == crypto::KdfAlgorithm::kArgon2id) {
    WriteUint32(out, kdf.argon2.t_cost);
    WriteUint32(out, kdf.argon2.m_cost_kib);
    WriteUint32(out, kdf.argon2.parallelism);
  } else {
    WriteUint32(out, kdf.pbkdf2_iterations);
    WriteUint32(out, 0);
    WriteUint32(out, 0);
  }
}

}  // namespace

std::vector<std::uint8_t> SealedBlob::AssociatedData() const {
  std::vector<std::uint8_t> aad;
  aad.reserve(kHeaderSize);
  aad.insert(aad.end(), kStoreMagic.begin(), kStoreMagic.end());
  aad.push_back(static_cast<std::uint8_t>(version & 0xFFu));
  aad.push_back(static_cast<std::uint8_t>((version >> 8) & 0xFFu));
  aad.push_back(static_cast<std::uint8_t>(kdf.algorithm));
  aad.insert(aad.end(), salt.begin(), salt.end());
  AppendKdfParams(&aad, kdf);
  return aad;
}

std::vector<std::uint8_t> SealedBlob::Serialize() const {
  auto out = AssociatedData();
  out.reserve(out.size() + nonce.size() + 4 + ciphertext.size() + tag.size());
  out.insert(out.end(), nonce.begin(), nonce.end());
  primitives::serialize::WriteUint32(&out, static_cast<std::uint32_t>(ciphertext.size()));
  out.insert(out.end(), ciphertext.begin(), ciphertext.end());
  out.insert(out.end(), tag.begin(), tag.end());
  return out;
}

SealedBlob SealedBlob::Parse(std::span<const std::uint8_t> bytes) {
  const std::vector<std::uint8_t> data(bytes.begin(), bytes.end());
  if (data.size() < kHeaderSize + util::kChaCha20Poly1305NonceSize + 4 +
                        util::kChaCha20Poly1305TagSize) {
    Tampered("truncated");
  }
  if (!std::equal(kStoreMagic.begin(), kStoreMagic.end(), data.begin())) {
    Tampered("magic mismatch");
  }
  SealedBlob blob;
  std::size_t offset = kStoreMagic.size();
  blob.version = static_cast<std::uint16_t>(data[offset] | (data[offset + 1] << 8));
  offset += 2;
  const auto kdf_id = data[offset++];
  if (kdf_id != static_cast<std::uint8_t>(crypto::KdfAlgorithm::kArgon2id) &&
      kdf_id != static_cast<std::uint8_t>(crypto::KdfAlgorithm::kPbkdf2Sha512)) {
    Tampered("unknown kdf");
  }
  blob.kdf.algorithm = static_cast<crypto::KdfAlgorithm>(kdf_id);
  std::copy_n(data.begin() + offset, kStoreSaltSize, blob.salt.begin());
  offset += kStoreSaltSize;
  std::array<std::uint32_t, 3> params{};
  for (auto& value : params) {
    if (!primitives::serialize::ReadUint32(data, &offset, &value)) {
      Tampered("truncated");
    }
  }
  if (blob.kdf.algorithm == crypto::KdfAlgorithm::kArgon2id) {
    blob.kdf.argon2.t_cost = params[0];
    blob.kdf.argon2.m_cost_kib = params[1];
    blob.kdf.argon2.parallelism = params[2];
  } else {
    if (params[1] != 0 || params[2] != 0) {
      Tampered("reserved kdf fields set");
    }
    blob.kdf.pbkdf2_iterations = params[0];
  }
  std::copy_n(data.begin() + offset, blob.nonce.size(), blob.nonce.begin());
  offset += blob.nonce.size();
  std::uint32_t cipher_len = 0;
  if (!primitives::serialize::ReadUint32(data, &offset, &cipher_len)) {
    Tampered("truncated");
  }
  if (data.size() - offset != static_cast<std::size_t>(cipher_len) + blob.tag.size()) {
    Tampered("length mismatch");
  }
  blob.ciphertext.assign(data.begin() + offset, data.begin() + offset + cipher_len);
  offset += cipher_len;
  std::copy_n(data.begin() + offset, blob.tag.size(), blob.tag.begin());
  return blob;
}

StoreKey::StoreKey(const std::array<std::uint8_t, 32>& key, const crypto::KdfParams& params,
                   const std::array<std::uint8_t, kStoreSaltSize>& salt)
    : key_(key), params_(params), salt_(salt) {}

StoreKey::~StoreKey() { util::SecureWipe(key_); }

EncryptedStore::EncryptedStore(std::filesystem::path path) : path_(std::move(path)) {}

StoreKey EncryptedStore::DeriveKey(std::string_view passphrase, const crypto::KdfParams& params) {
  std::string error;
  if (!crypto::CheckKdfParams(params, &error)) {
    throw WalletError(ErrorCode::kInvalidConfig, "store kdf: " + error);
  }
  const auto salt = util::SecureRandomArray<kStoreSaltSize>();
  std::array<std::uint8_t, 32> key{};
  if (!crypto::DeriveStoreKey(passphrase, salt, params, &key, &error)) {
    throw WalletError(ErrorCode::kInvalidConfig, "store kdf: " + error);
  }
  StoreKey out(key, params, salt);
  util::SecureWipe(key);
  return out;
}

StoreKey EncryptedStore::DeriveKeyFor(std::string_view passphrase, const SealedBlob& blob) {
  std::string error;
  if (!crypto::CheckKdfParams(blob.kdf, &error)) {
    // Out-of-range costs never come from a store we wrote.
    throw WalletError(ErrorCode::kAuthenticationFailed, "sealed store: " + error);
  }
  std::array<std::uint8_t, 32> key{};
  if (!crypto::DeriveStoreKey(passphrase, blob.salt, blob.kdf, &key, &error)) {
    throw WalletError(ErrorCode::kStoreIo, "store kdf: " + error);
  }
  StoreKey out(key, blob.kdf, blob.salt);
  util::SecureWipe(key);
  return out;
}

SealedBlob EncryptedStore::Seal(std::span<const std::uint8_t> plaintext, const StoreKey& key,
                                std::uint16_t version) {
  if (plaintext.size() > std::numeric_limits<std::uint32_t>::max()) {
    throw WalletError(ErrorCode::kStoreIo, "sealed store: plaintext too large");
  }
  SealedBlob blob;
  blob.version = version;
  blob.kdf = key.params();
  blob.salt = key.salt();
  blob.nonce = util::SecureRandomArray<util::kChaCha20Poly1305NonceSize>();
  const auto aad = blob.AssociatedData();
  blob.ciphertext = util::ChaCha20Poly1305Seal(key.bytes(), blob.nonce, aad, plaintext, &blob.tag);
  return blob;
}

std::vector<std::uint8_t> EncryptedStore::Open(const SealedBlob& blob, const StoreKey& key) {
  const auto aad = blob.AssociatedData();
  std::vector<std::uint8_t> plaintext;
  if (!util::ChaCha20Poly1305Open(key.bytes(), blob.nonce, aad, blob.ciphertext, blob.tag,
                                  &plaintext)) {
    throw WalletError(ErrorCode::kAuthenticationFailed,
                      "sealed store: authentication failed (wrong passphrase or tampered data)");
  }
  if (blob.version != kStoreFormatVersion) {
    util::SecureWipe(plaintext);
    throw WalletError(ErrorCode::kStoreCorrupt,
                      "sealed store: unsupported format version " + std::to_string(blob.version));
  }
  return plaintext;
}

void EncryptedStore::Persist(const SealedBlob& blob) {
  const auto bytes = blob.Serialize();
  std::lock_guard<std::mutex> lock(mutex_);
  if (path_.empty()) {
    memory_blob_ = bytes;
    return;
  }
  std::string error;
  if (!util::AtomicWriteFileBytes(path_, bytes, &error)) {
    util::LogError(kLogComponent, "persist failed: " + error);
    throw WalletError(ErrorCode::kStoreIo, "sealed store: write failed: " + error);
  }
  util::LogDebug(kLogComponent, "persisted " + std::to_string(bytes.size()) + " bytes");
}

SealedBlob EncryptedStore::Load() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (path_.empty()) {
    if (!memory_blob_) {
      throw WalletError(ErrorCode::kNotFound, "sealed store: nothing persisted");
    }
    return SealedBlob::Parse(*memory_blob_);
  }
  bool missing = false;
  std::string error;
  auto bytes = util::ReadFileBytes(path_, &missing, &error);
  if (!bytes) {
    if (missing) {
      throw WalletError(ErrorCode::kNotFound, "sealed store: " + path_.string() + " not found");
    }
    throw WalletError(ErrorCode::kStoreIo, "sealed store: read failed: " + error);
  }
  return SealedBlob::Parse(*bytes);
}

bool EncryptedStore::Exists() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (path_.empty()) {
    return memory_blob_.has_value();
  }
  std::error_code ec;
  return std::filesystem::exists(path_, ec);
}

void EncryptedStore::ChangePassphrase(std::string_view old_passphrase,
                                      std::string_view new_passphrase,
                                      const crypto::KdfParams& new_params) {
  const auto blob = Load();
  const auto old_key = DeriveKeyFor(old_passphrase, blob);
  auto plaintext = Open(blob, old_key);
  const util::WipeOnExit wipe_plaintext(plaintext);
  const auto new_key = DeriveKey(new_passphrase, new_params);
  Persist(Seal(plaintext, new_key));
  util::LogInfo(kLogComponent, "passphrase changed");
}

}  // namespace ctwallet::wallet
