#include <array>
#include <cstdint>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <span>
#include <vector>

#include "crypto/ec_key.hpp"
#include "util/hex.hpp"
#include "wallet/errors.hpp"
#include "wallet/key_ring.hpp"
#include "wallet_fixtures.hpp"

namespace {

using ctwallet::util::HexEncode;
using ctwallet::wallet::Chain;
using ctwallet::wallet::ErrorCode;
using ctwallet::wallet::KeyRing;
using ctwallet::wallet::WalletError;

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

bool TestBip49Vector() {
  const auto cfg = ctwallet::test::RegtestConfig();
  const auto keys = KeyRing::FromMnemonic(ctwallet::test::kTestMnemonic, "", cfg.network);
  if (HexEncode(keys->MasterFingerprint()) != "73c5da0a") {
    std::cerr << "fingerprint mismatch: " << HexEncode(keys->MasterFingerprint()) << "\n";
    return false;
  }
  const auto pair = keys->Derive(Chain::kExternal, 0);
  if (HexEncode(pair.signing_pubkey) !=
      "03a1af804ac108a8a51782198c2d034b28bf90c8803f5a53f76276fa69a4eae77f") {
    std::cerr << "m/49'/1'/0'/0/0 pubkey mismatch: " << HexEncode(pair.signing_pubkey) << "\n";
    return false;
  }
  if (HexEncode(pair.script_pubkey) != "a914336caa13e08b96080a32b5d818d59b4ab3b3674287") {
    std::cerr << "p2sh script mismatch: " << HexEncode(pair.script_pubkey) << "\n";
    return false;
  }
  if (pair.blinding_pubkey != keys->BlindingPublicKey(pair.script_pubkey)) {
    std::cerr << "blinding key not bound to the script\n";
    return false;
  }
  return true;
}

bool TestDeterministic() {
  const auto cfg = ctwallet::test::RegtestConfig();
  const auto a = KeyRing::FromMnemonic(ctwallet::test::kTestMnemonic, "", cfg.network);
  const auto b = KeyRing::FromSeed(a->seed(), cfg.network);
  for (std::uint32_t i = 0; i < 4; ++i) {
    if (a->Derive(Chain::kInternal, i) != b->Derive(Chain::kInternal, i)) {
      std::cerr << "FromSeed derives differently at internal " << i << "\n";
      return false;
    }
  }
  if (a->Derive(Chain::kExternal, 1) == a->Derive(Chain::kInternal, 1)) {
    std::cerr << "chains collide\n";
    return false;
  }
  const auto salted = KeyRing::FromMnemonic(ctwallet::test::kTestMnemonic, "TREZOR", cfg.network);
  if (salted->Derive(Chain::kExternal, 0) == a->Derive(Chain::kExternal, 0)) {
    std::cerr << "mnemonic passphrase ignored\n";
    return false;
  }
  return true;
}

bool TestErrors() {
  const auto cfg = ctwallet::test::RegtestConfig();
  bool ok = true;
  ok &= ExpectError(ErrorCode::kInvalidSeed, [&] {
    KeyRing::FromMnemonic("abandon abandon abandon", "", cfg.network);
  }, "short mnemonic");
  ok &= ExpectError(ErrorCode::kInvalidSeed, [&] {
    KeyRing::FromMnemonic(
        "abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon abandon "
        "abandon",
        "", cfg.network);
  }, "bad checksum");
  ok &= ExpectError(ErrorCode::kInvalidSeed, [&] {
    const std::vector<std::uint8_t> seed(15, 0x01);
    KeyRing::FromSeed(seed, cfg.network);
  }, "short seed");
  ok &= ExpectError(ErrorCode::kInvalidSeed, [&] {
    const std::vector<std::uint8_t> seed(65, 0x01);
    KeyRing::FromSeed(seed, cfg.network);
  }, "long seed");

  const auto keys = KeyRing::FromMnemonic(ctwallet::test::kTestMnemonic, "", cfg.network);
  ok &= ExpectError(ErrorCode::kDerivationRange, [&] {
    keys->Derive(Chain::kExternal, 0x80000000u);
  }, "hardened index");
  try {
    keys->Derive(Chain::kExternal, ctwallet::wallet::kMaxDerivationIndex);
  } catch (const WalletError& ex) {
    std::cerr << "largest index rejected: " << ex.what() << "\n";
    ok = false;
  }
  return ok;
}

bool TestSigning() {
  const auto cfg = ctwallet::test::RegtestConfig();
  const auto keys = KeyRing::FromMnemonic(ctwallet::test::kTestMnemonic, "", cfg.network);
  std::array<std::uint8_t, 32> sighash{};
  for (std::size_t i = 0; i < sighash.size(); ++i) {
    sighash[i] = static_cast<std::uint8_t>(0xA0 + i);
  }
  const auto sig = keys->SignSighash(Chain::kInternal, 3, sighash);
  if (sig.empty() || sig.back() != 0x01) {
    std::cerr << "missing SIGHASH_ALL byte\n";
    return false;
  }
  const auto pair = keys->Derive(Chain::kInternal, 3);
  const std::span<const std::uint8_t> der(sig.data(), sig.size() - 1);
  if (!ctwallet::crypto::VerifyDerSignature(pair.signing_pubkey, sighash, der)) {
    std::cerr << "signature does not verify\n";
    return false;
  }
  const auto other = keys->Derive(Chain::kInternal, 4);
  if (ctwallet::crypto::VerifyDerSignature(other.signing_pubkey, sighash, der)) {
    std::cerr << "signature verifies under the wrong key\n";
    return false;
  }
  if (keys->SignSighash(Chain::kInternal, 3, sighash) != sig) {
    std::cerr << "signing is not deterministic\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  bool ok = true;
  ok &= TestBip49Vector();
  ok &= TestDeterministic();
  ok &= TestErrors();
  ok &= TestSigning();
  return ok ? EXIT_SUCCESS : EXIT_FAILURE;
}
