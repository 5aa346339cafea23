#include <cstdlib>
#include <exception>
#include <filesystem>
#include <functional>
#include <iostream>
#include <system_error>

#include "config/network.hpp"
#include "fake_electrum.hpp"
#include "wallet/errors.hpp"
#include "wallet/wallet_context.hpp"
#include "wallet_fixtures.hpp"

namespace {

using namespace ctwallet;
using wallet::ErrorCode;
using wallet::WalletContext;
using wallet::WalletError;

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

}  // namespace

int main() {
  try {
    const std::filesystem::path test_root =
        std::filesystem::temp_directory_path() / "ctwallet_store_reload_tests";
    std::error_code cleanup_ec;
    std::filesystem::remove_all(test_root, cleanup_ec);
    std::filesystem::create_directories(test_root);

    struct ScopedCleanup {
      std::filesystem::path root;
      ~ScopedCleanup() {
        std::error_code ec;
        std::filesystem::remove_all(root, ec);
      }
    } cleanup{test_root};

    const auto cfg = test::RegtestConfig(test_root / "wallet.ctws");
    test::FakeElectrum server;
    server.SetTip(30);

    wallet::ChainState synced;
    wallet::Address receive;
    {
      auto wallet = WalletContext::Create(cfg, test::kTestMnemonic, "", "first pass");
      const auto address = wallet->addresses().AddressFor(wallet::Chain::kExternal, 4);
      const auto tx = test::MakeFundingTx(wallet->engine(), address, test::TestPolicyAsset(),
                                          12'345, 0x41);
      server.AddHistory(address.scripthash, server.AddTransaction(tx), 25);
      wallet->Sync(server);
      synced = wallet->Snapshot();
      receive = wallet->ReceiveAddress();
      if (receive.index != 5) {
        std::cerr << "receive address did not skip used indices\n";
        return EXIT_FAILURE;
      }
    }
    if (!std::filesystem::exists(cfg.store_path)) {
      std::cerr << "store file not written\n";
      return EXIT_FAILURE;
    }

    bool ok = true;
    ok &= ExpectError(ErrorCode::kInvalidRequest, [&] {
      WalletContext::Create(cfg, test::kOtherMnemonic, "", "other");
    }, "create over an existing store");
    ok &= ExpectError(ErrorCode::kAuthenticationFailed,
                      [&] { WalletContext::Open(cfg, "second pass"); }, "wrong passphrase");

    {
      auto reopened = WalletContext::Open(cfg, "first pass");
      if (!(reopened->Snapshot() == synced) || reopened->ReceiveAddress() != receive) {
        std::cerr << "reopened wallet differs from the synced one\n";
        return EXIT_FAILURE;
      }
      if (reopened->Balance().at(test::TestPolicyAsset()) != 12'345) {
        std::cerr << "reopened balance mismatch\n";
        return EXIT_FAILURE;
      }
      // Nothing new on the server: the reopened cache is reused as is.
      server.ResetCalls();
      const auto round = reopened->Sync(server);
      if (round.stats.history_requests != 0 || round.stats.transaction_requests != 0) {
        std::cerr << "reopened wallet refetched cached data\n";
        return EXIT_FAILURE;
      }
      reopened->ChangePassphrase("first pass", "second pass", cfg.kdf);
    }

    ok &= ExpectError(ErrorCode::kAuthenticationFailed,
                      [&] { WalletContext::Open(cfg, "first pass"); }, "old passphrase");
    {
      auto reopened = WalletContext::Open(cfg, "second pass");
      if (!(reopened->Snapshot() == synced)) {
        std::cerr << "passphrase change altered the wallet\n";
        ok = false;
      }
    }

    auto testnet = cfg;
    testnet.network = config::ParamsFor(config::NetworkType::kLiquidTestnet);
    ok &= ExpectError(ErrorCode::kInvalidConfig,
                      [&] { WalletContext::Open(testnet, "second pass"); }, "network mismatch");

    auto missing = cfg;
    missing.store_path = test_root / "absent.ctws";
    ok &= ExpectError(ErrorCode::kNotFound, [&] { WalletContext::Open(missing, "second pass"); },
                      "missing store");
    return ok ? EXIT_SUCCESS : EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "store reload tests failed: " << ex.what() << "\n";
    return EXIT_FAILURE;
  }
}
