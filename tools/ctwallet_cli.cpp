#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <Windows.h>
#include <io.h>
#else
#include <termios.h>
#include <unistd.h>
#endif

#include "config/network.hpp"
#include "config/wallet_config.hpp"
#include "crypto/mnemonic.hpp"
#include "crypto/secp256k1_zkp_engine.hpp"
#include "nlohmann/json.hpp"
#include "util/csprng.hpp"
#include "util/hex.hpp"
#include "util/secure_wipe.hpp"
#include "wallet/errors.hpp"
#include "wallet/liquidex.hpp"
#include "wallet/wallet_context.hpp"

namespace {

using ctwallet::wallet::Chain;

struct CliOptions {
  std::string config_path;
  std::optional<std::string> network;
  std::optional<std::string> store_path;
  std::vector<std::string> args;
  std::vector<std::string> flags;
};

bool HasFlag(const std::vector<std::string>& flags, std::string_view flag) {
  for (const auto& arg : flags) {
    if (arg == flag) {
      return true;
    }
  }
  return false;
}

std::optional<std::string> FindPrefixedOptionValue(const std::vector<std::string>& flags,
                                                   std::string_view prefix) {
  for (const auto& arg : flags) {
    if (arg.rfind(prefix, 0) == 0) {
      return arg.substr(prefix.size());
    }
  }
  return std::nullopt;
}

bool IsStdinInteractive() {
#ifdef _WIN32
  return _isatty(_fileno(stdin)) != 0;
#else
  return isatty(fileno(stdin)) != 0;
#endif
}

std::string TrimTrailingNewlines(std::string input) {
  while (!input.empty() && (input.back() == '\n' || input.back() == '\r')) {
    input.pop_back();
  }
  return input;
}

std::string ReadFirstLineFromFile(const std::string& path, std::string_view label) {
  std::ifstream in(path, std::ios::in);
  if (!in) {
    throw std::runtime_error("unable to read " + std::string(label) + " file: " + path);
  }
  std::string line;
  std::getline(in, line);
  return TrimTrailingNewlines(std::move(line));
}

std::string ReadLineFromStdin(std::string_view label) {
  std::string line;
  if (!std::getline(std::cin, line)) {
    throw std::runtime_error("failed to read " + std::string(label) + " from stdin");
  }
  return TrimTrailingNewlines(std::move(line));
}

std::string PromptHidden(std::string_view prompt) {
  if (!IsStdinInteractive()) {
    throw std::runtime_error("stdin is not interactive; use -<name>-stdin or -<name>-file=");
  }
  std::cerr << prompt;
  std::string line;
#ifdef _WIN32
  const HANDLE handle = GetStdHandle(STD_INPUT_HANDLE);
  DWORD original_mode = 0;
  bool have_mode = false;
  if (handle != INVALID_HANDLE_VALUE && GetConsoleMode(handle, &original_mode)) {
    have_mode = true;
    (void)SetConsoleMode(handle, original_mode & ~static_cast<DWORD>(ENABLE_ECHO_INPUT));
  }
  std::getline(std::cin, line);
  if (have_mode) {
    (void)SetConsoleMode(handle, original_mode);
  }
  std::cerr << "\n";
#else
  termios original{};
  bool have_termios = false;
  if (tcgetattr(STDIN_FILENO, &original) == 0) {
    have_termios = true;
    termios updated = original;
    updated.c_lflag &= static_cast<tcflag_t>(~ECHO);
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &updated);
  }
  std::getline(std::cin, line);
  if (have_termios) {
    (void)tcsetattr(STDIN_FILENO, TCSAFLUSH, &original);
    std::cerr << "\n";
  }
#endif
  return TrimTrailingNewlines(std::move(line));
}

// Secrets come from -<name>-stdin, -<name>-file=<path> or a hidden prompt.
// At most one secret per invocation may be read from stdin.
std::string ReadSecret(const CliOptions& opts, std::string_view name, std::string_view label,
                       bool allow_empty = false) {
  const std::string stdin_flag = "-" + std::string(name) + "-stdin";
  const std::string file_prefix = "-" + std::string(name) + "-file=";
  std::optional<std::string> value;
  int sources = 0;
  if (HasFlag(opts.flags, stdin_flag)) {
    ++sources;
    value = ReadLineFromStdin(label);
  }
  if (auto file = FindPrefixedOptionValue(opts.flags, file_prefix)) {
    ++sources;
    value = ReadFirstLineFromFile(*file, label);
  }
  if (sources > 1) {
    throw std::runtime_error("specify only one of " + stdin_flag + " or " + file_prefix + "<path>");
  }
  if (!value) {
    value = PromptHidden("Enter " + std::string(label) + ": ");
  }
  if (!allow_empty && value->empty()) {
    throw std::runtime_error(std::string(label) + " must not be empty");
  }
  return std::move(*value);
}

CliOptions ParseOptions(int argc, char** argv) {
  CliOptions opts;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg.rfind("-conf=", 0) == 0) {
      opts.config_path = arg.substr(6);
    } else if (arg.rfind("-network=", 0) == 0) {
      opts.network = arg.substr(9);
    } else if (arg.rfind("-store=", 0) == 0) {
      opts.store_path = arg.substr(7);
    } else if (!arg.empty() && arg.front() == '-') {
      opts.flags.push_back(std::move(arg));
    } else {
      opts.args.push_back(std::move(arg));
    }
  }
  if (opts.args.empty()) {
    throw std::runtime_error(
        "usage: ctwallet-cli [-conf=<file>] [-network=<name>] [-store=<path>] <command>\n"
        "commands: newmnemonic [12|24], checkmnemonic, create, fingerprint,\n"
        "          addresses [external|internal] [count], changepassphrase,\n"
        "          liquidexassets [insert|remove <asset>], liquidexverify <proposal.json>");
  }
  return opts;
}

ctwallet::config::WalletConfig LoadConfig(const CliOptions& opts) {
  nlohmann::json json = nlohmann::json::object();
  if (!opts.config_path.empty()) {
    std::ifstream in(opts.config_path);
    if (!in) {
      throw std::runtime_error("unable to read config file: " + opts.config_path);
    }
    try {
      in >> json;
    } catch (const nlohmann::json::exception& ex) {
      throw std::runtime_error("config file is not valid JSON: " + std::string(ex.what()));
    }
  }
  if (opts.network) {
    json["network"] = *opts.network;
  }
  if (opts.store_path) {
    json["store_path"] = *opts.store_path;
  }
  auto config = ctwallet::config::WalletConfigFromJson(json);
  ctwallet::config::ApplyLogConfig(config.log);
  return config;
}

void RequireStore(const ctwallet::config::WalletConfig& config) {
  if (config.store_path.empty()) {
    throw std::runtime_error("this command needs a store; pass -store=<path> or set store_path");
  }
}

nlohmann::json HandleNewMnemonic(const CliOptions& opts) {
  std::size_t words = 12;
  if (opts.args.size() > 1) {
    words = static_cast<std::size_t>(std::stoul(opts.args[1]));
  }
  if (words != 12 && words != 24) {
    throw std::runtime_error("word count must be 12 or 24");
  }
  auto entropy = ctwallet::util::SecureRandomBytes(words == 12 ? 16 : 32);
  auto sentence = ctwallet::crypto::MnemonicFromEntropy(entropy);
  ctwallet::util::SecureWipe(entropy);
  nlohmann::json out{{"mnemonic", sentence}};
  ctwallet::util::SecureWipe(sentence);
  return out;
}

nlohmann::json HandleCheckMnemonic(const CliOptions& opts) {
  auto sentence = ReadSecret(opts, "mnemonic", "mnemonic");
  std::string error;
  const bool valid =
      ctwallet::crypto::ValidateMnemonic(ctwallet::crypto::NormalizeMnemonic(sentence), &error);
  ctwallet::util::SecureWipe(sentence);
  nlohmann::json out{{"valid", valid}};
  if (!valid) {
    out["error"] = error;
  }
  return out;
}

nlohmann::json HandleCreate(const CliOptions& opts) {
  const auto config = LoadConfig(opts);
  RequireStore(config);
  auto sentence = ReadSecret(opts, "mnemonic", "mnemonic");
  auto bip39_passphrase = FindPrefixedOptionValue(opts.flags, "-bip39-passphrase-file=")
                              ? ReadSecret(opts, "bip39-passphrase", "BIP-39 passphrase", true)
                              : std::string();
  auto passphrase = ReadSecret(opts, "passphrase", "store passphrase");
  auto wallet =
      ctwallet::wallet::WalletContext::Create(config, sentence, bip39_passphrase, passphrase);
  ctwallet::util::SecureWipe(sentence);
  ctwallet::util::SecureWipe(bip39_passphrase);
  ctwallet::util::SecureWipe(passphrase);
  const auto fingerprint = wallet->keys().MasterFingerprint();
  return nlohmann::json{{"store", config.store_path.string()},
                        {"network", config.network.name},
                        {"fingerprint", ctwallet::util::HexEncode(fingerprint)},
                        {"receive", wallet->ReceiveAddress().confidential}};
}

std::unique_ptr<ctwallet::wallet::WalletContext> OpenWallet(const CliOptions& opts,
                                                             const ctwallet::config::WalletConfig& config) {
  RequireStore(config);
  auto passphrase = ReadSecret(opts, "passphrase", "store passphrase");
  auto wallet = ctwallet::wallet::WalletContext::Open(config, passphrase);
  ctwallet::util::SecureWipe(passphrase);
  return wallet;
}

nlohmann::json HandleFingerprint(const CliOptions& opts) {
  const auto config = LoadConfig(opts);
  auto wallet = OpenWallet(opts, config);
  return nlohmann::json{
      {"fingerprint", ctwallet::util::HexEncode(wallet->keys().MasterFingerprint())}};
}

nlohmann::json HandleAddresses(const CliOptions& opts) {
  Chain chain = Chain::kExternal;
  std::uint32_t count = 20;
  if (opts.args.size() > 1) {
    if (opts.args[1] == "internal") {
      chain = Chain::kInternal;
    } else if (opts.args[1] != "external") {
      throw std::runtime_error("chain must be external or internal");
    }
  }
  if (opts.args.size() > 2) {
    count = static_cast<std::uint32_t>(std::stoul(opts.args[2]));
    if (count == 0 || count > 1000) {
      throw std::runtime_error("count must be 1..1000");
    }
  }
  const auto config = LoadConfig(opts);
  auto wallet = OpenWallet(opts, config);
  nlohmann::json out = nlohmann::json::array();
  const auto first_unused = wallet->addresses().FirstUnusedIndex(chain);
  for (const auto& address : wallet->addresses().AllAddressesUpTo(chain, count - 1)) {
    out.push_back({{"index", address.index},
                   {"address", address.confidential},
                   {"unconfidential", address.unconfidential},
                   {"scripthash", address.scripthash},
                   {"used", address.index < first_unused}});
  }
  return out;
}

nlohmann::json HandleChangePassphrase(const CliOptions& opts) {
  const auto config = LoadConfig(opts);
  RequireStore(config);
  auto old_passphrase = ReadSecret(opts, "passphrase", "current store passphrase");
  auto new_passphrase = ReadSecret(opts, "new-passphrase", "new store passphrase");
  ctwallet::wallet::EncryptedStore store(config.store_path);
  store.ChangePassphrase(old_passphrase, new_passphrase, config.kdf);
  ctwallet::util::SecureWipe(old_passphrase);
  ctwallet::util::SecureWipe(new_passphrase);
  return nlohmann::json{{"changed", true}};
}

ctwallet::primitives::AssetId ParseAsset(const std::string& hex) {
  const auto asset = ctwallet::util::ParseHash256Hex(hex);
  if (!asset) {
    throw std::runtime_error("asset must be 64 hex characters");
  }
  return *asset;
}

nlohmann::json HandleLiquidexAssets(const CliOptions& opts) {
  const auto config = LoadConfig(opts);
  auto wallet = OpenWallet(opts, config);
  nlohmann::json out;
  if (opts.args.size() > 1) {
    if (opts.args.size() != 3) {
      throw std::runtime_error("usage: liquidexassets insert|remove <asset>");
    }
    const auto asset = ParseAsset(opts.args[2]);
    if (opts.args[1] == "insert") {
      out["changed"] = wallet->LiquidexAssetsInsert(asset);
    } else if (opts.args[1] == "remove") {
      out["changed"] = wallet->LiquidexAssetsRemove(asset);
    } else {
      throw std::runtime_error("liquidexassets action must be insert or remove");
    }
  }
  out["assets"] = nlohmann::json::array();
  for (const auto& asset : wallet->LiquidexAssets()) {
    out["assets"].push_back(ctwallet::util::HexEncodeReversed(asset));
  }
  return out;
}

// Checks an offer without opening a wallet.
nlohmann::json HandleLiquidexVerify(const CliOptions& opts) {
  if (opts.args.size() != 2) {
    throw std::runtime_error("usage: liquidexverify <proposal.json>");
  }
  std::ifstream in(opts.args[1]);
  if (!in) {
    throw std::runtime_error("unable to read proposal file: " + opts.args[1]);
  }
  nlohmann::json json;
  try {
    in >> json;
  } catch (const nlohmann::json::parse_error& ex) {
    throw ctwallet::wallet::WalletError(ctwallet::wallet::ErrorCode::kInvalidRequest,
                                        std::string("proposal is not json: ") + ex.what());
  }
  const auto proposal = ctwallet::wallet::LiquidexProposal::FromJson(json);
  const ctwallet::crypto::Secp256k1ZkpEngine engine;
  const auto wanted = ctwallet::wallet::VerifyLiquidexProposal(engine, proposal);
  return nlohmann::json{
      {"gives", {{"asset", ctwallet::util::HexEncodeReversed(proposal.input.asset)},
                 {"amount", proposal.input.value}}},
      {"wants", {{"asset", ctwallet::util::HexEncodeReversed(wanted.asset)},
                 {"amount", wanted.value}}}};
}

}  // namespace

int main(int argc, char** argv) {
  try {
    const auto opts = ParseOptions(argc, argv);
    const auto& command = opts.args.front();
    nlohmann::json response;
    if (command == "newmnemonic") {
      response = HandleNewMnemonic(opts);
    } else if (command == "checkmnemonic") {
      response = HandleCheckMnemonic(opts);
    } else if (command == "create") {
      response = HandleCreate(opts);
    } else if (command == "fingerprint") {
      response = HandleFingerprint(opts);
    } else if (command == "addresses") {
      response = HandleAddresses(opts);
    } else if (command == "changepassphrase") {
      response = HandleChangePassphrase(opts);
    } else if (command == "liquidexassets") {
      response = HandleLiquidexAssets(opts);
    } else if (command == "liquidexverify") {
      response = HandleLiquidexVerify(opts);
    } else {
      throw std::runtime_error("unknown command: " + command);
    }
    std::cout << response.dump(2) << "\n";
  } catch (const ctwallet::wallet::WalletError& ex) {
    std::cerr << "ctwallet-cli: " << ctwallet::wallet::ErrorCodeName(ex.code()) << ": "
              << ex.what() << "\n";
    return 1;
  } catch (const std::exception& ex) {
    std::cerr << "ctwallet-cli: " << ex.what() << "\n";
    return 1;
  }
  return 0;
}
