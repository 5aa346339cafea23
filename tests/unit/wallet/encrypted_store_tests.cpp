#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <functional>
#include <iostream>
#include <string>
#include <vector>

#include "crypto/kdf.hpp"
#include "wallet/encrypted_store.hpp"
#include "wallet/errors.hpp"

namespace {

using ctwallet::wallet::EncryptedStore;
using ctwallet::wallet::ErrorCode;
using ctwallet::wallet::SealedBlob;
using ctwallet::wallet::WalletError;

// Byte offsets inside the serialized envelope.
constexpr std::size_t kSaltOffset = 7;
constexpr std::size_t kCiphertextOffset = 51;

ctwallet::crypto::KdfParams FastKdf() {
  ctwallet::crypto::KdfParams params;
  params.algorithm = ctwallet::crypto::KdfAlgorithm::kPbkdf2Sha512;
  params.pbkdf2_iterations = 1000;
  return params;
}

bool ExpectError(ErrorCode expected, const std::function<void()>& fn, const char* label) {
  try {
    fn();
  } catch (const WalletError& ex) {
    if (ex.code() == expected) {
      return true;
    }
    std::cerr << label << ": unexpected error " << ex.what() << "\n";
    return false;
  }
  std::cerr << label << ": no error raised\n";
  return false;
}

const std::vector<std::uint8_t> kPlaintext = {'w', 'a', 'l', 'l', 'e', 't', 0x00, 0xff, 0x10};

bool TestSealOpen() {
  const auto key = EncryptedStore::DeriveKey("correct horse", FastKdf());
  const auto bytes = EncryptedStore::Seal(kPlaintext, key).Serialize();
  const auto blob = SealedBlob::Parse(bytes);
  const auto rekey = EncryptedStore::DeriveKeyFor("correct horse", blob);
  if (EncryptedStore::Open(blob, rekey) != kPlaintext) {
    std::cerr << "round trip lost data\n";
    return false;
  }
  const auto other = EncryptedStore::Seal(kPlaintext, key);
  if (other.nonce == blob.nonce || other.ciphertext == blob.ciphertext) {
    std::cerr << "nonce reused across seals\n";
    return false;
  }
  return true;
}

bool TestTampering() {
  const auto key = EncryptedStore::DeriveKey("correct horse", FastKdf());
  const auto bytes = EncryptedStore::Seal(kPlaintext, key).Serialize();
  bool ok = true;

  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    const auto blob = SealedBlob::Parse(bytes);
    EncryptedStore::Open(blob, EncryptedStore::DeriveKeyFor("battery staple", blob));
  }, "wrong passphrase");

  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    auto damaged = bytes;
    damaged[kCiphertextOffset] ^= 0x01;
    EncryptedStore::Open(SealedBlob::Parse(damaged), key);
  }, "flipped ciphertext");

  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    auto damaged = bytes;
    damaged.back() ^= 0x80;
    EncryptedStore::Open(SealedBlob::Parse(damaged), key);
  }, "flipped tag");

  // The header is associated data, so a changed salt fails even under the
  // original key.
  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    auto damaged = bytes;
    damaged[kSaltOffset] ^= 0x01;
    EncryptedStore::Open(SealedBlob::Parse(damaged), key);
  }, "flipped salt");

  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    auto damaged = bytes;
    damaged.resize(damaged.size() - 3);
    SealedBlob::Parse(damaged);
  }, "truncated envelope");

  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    auto damaged = bytes;
    damaged[0] = 'X';
    SealedBlob::Parse(damaged);
  }, "bad magic");
  return ok;
}

bool TestVersion() {
  const auto key = EncryptedStore::DeriveKey("correct horse", FastKdf());
  const auto blob = SealedBlob::Parse(EncryptedStore::Seal(kPlaintext, key, 2).Serialize());
  if (blob.version != 2) {
    std::cerr << "version not carried through the envelope\n";
    return false;
  }
  return ExpectError(ErrorCode::kStoreCorrupt, [&] { EncryptedStore::Open(blob, key); },
                     "future version");
}

bool TestKdfParams() {
  auto params = FastKdf();
  params.pbkdf2_iterations = 0;
  return ExpectError(ErrorCode::kInvalidConfig,
                     [&] { EncryptedStore::DeriveKey("pass", params); }, "zero iterations");
}

bool TestMemoryStore() {
  EncryptedStore store{std::filesystem::path{}};
  bool ok = ExpectError(ErrorCode::kNotFound, [&] { store.Load(); }, "empty store");
  if (store.Exists()) {
    std::cerr << "empty store reports a blob\n";
    return false;
  }
  store.Persist(EncryptedStore::Seal(kPlaintext, EncryptedStore::DeriveKey("old", FastKdf())));
  const auto before = store.Load();

  store.ChangePassphrase("old", "new", FastKdf());
  const auto after = store.Load();
  if (after.salt == before.salt) {
    std::cerr << "passphrase change kept the salt\n";
    ok = false;
  }
  ok &= ExpectError(ErrorCode::kAuthenticationFailed, [&] {
    EncryptedStore::Open(after, EncryptedStore::DeriveKeyFor("old", after));
  }, "old passphrase after change");
  if (EncryptedStore::Open(after, EncryptedStore::DeriveKeyFor("new", after)) != kPlaintext) {
    std::cerr << "passphrase change altered the plaintext\n";
    ok = false;
  }
  ok &= ExpectError(ErrorCode::kAuthenticationFailed,
                    [&] { store.ChangePassphrase("old", "newer", FastKdf()); },
                    "change with a stale passphrase");

  auto broken = FastKdf();
  broken.pbkdf2_iterations = 0;
  ok &= ExpectError(ErrorCode::kInvalidConfig,
                    [&] { store.ChangePassphrase("new", "newer", broken); },
                    "change to unusable kdf params");
  const auto kept = store.Load();
  if (kept.salt != after.salt ||
      EncryptedStore::Open(kept, EncryptedStore::DeriveKeyFor("new", kept)) != kPlaintext) {
    std::cerr << "failed passphrase change touched the store\n";
    ok = false;
  }
  return ok;
}

bool TestFileStore() {
  const auto dir = std::filesystem::temp_directory_path() / "ctwallet_encrypted_store_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path = dir / "wallet.ctws";

  EncryptedStore writer(path);
  bool ok = ExpectError(ErrorCode::kNotFound, [&] { writer.Load(); }, "missing file");
  writer.Persist(EncryptedStore::Seal(kPlaintext, EncryptedStore::DeriveKey("disk", FastKdf())));

  EncryptedStore reader(path);
  if (!reader.Exists()) {
    std::cerr << "persisted file not found\n";
    ok = false;
  } else {
    const auto blob = reader.Load();
    if (EncryptedStore::Open(blob, EncryptedStore::DeriveKeyFor("disk", blob)) != kPlaintext) {
      std::cerr << "file store lost data\n";
      ok = false;
    }
  }
  std::filesystem::remove_all(dir);
  return ok;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestSealOpen();
  ok &= TestTampering();
  ok &= TestVersion();
  ok &= TestKdfParams();
  ok &= TestMemoryStore();
  ok &= TestFileStore();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
