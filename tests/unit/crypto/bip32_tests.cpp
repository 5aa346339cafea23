#include <array>
#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <string_view>
#include <vector>

#include "crypto/bip32.hpp"
#include "util/hex.hpp"

namespace {

bool ExpectHex(std::span<const std::uint8_t> actual, std::string_view expected, const char* label) {
  const auto hex = ctwallet::util::HexEncode(actual);
  if (hex != expected) {
    std::cerr << label << ": got " << hex << "\n";
    return false;
  }
  return true;
}

}  // namespace

int main() {
  using namespace ctwallet::crypto;

  // BIP-32 test vector 1.
  std::vector<std::uint8_t> seed(16);
  for (std::size_t i = 0; i < seed.size(); ++i) {
    seed[i] = static_cast<std::uint8_t>(i);
  }
  ExtendedPrivateKey master;
  if (!MasterKeyFromSeed(seed, &master)) {
    std::cerr << "master derivation failed\n";
    return EXIT_FAILURE;
  }
  if (!ExpectHex(master.key, "e8f32e723decf4051aefac8e2c93c9c5b214313817cdb01a1494b917c8436b35",
                 "m key") ||
      !ExpectHex(master.chain_code,
                 "873dff81c02f525623fd1fe5167eac3a55a049de3d314bb42ee227ffed37d508", "m chain") ||
      !ExpectHex(master.PublicKey(),
                 "0339a36013301597daef41fbe593a02cc513d0b55527ec2df1050e2e8ff49c85c2", "m pub") ||
      !ExpectHex(master.Fingerprint(), "3442193e", "m fingerprint")) {
    return EXIT_FAILURE;
  }

  ExtendedPrivateKey child;
  if (!DeriveChild(master, 0 | kHardenedBit, &child)) {
    std::cerr << "m/0' derivation failed\n";
    return EXIT_FAILURE;
  }
  if (!ExpectHex(child.key, "edb2e14f9ee77d26dd93b4ecede8d16ed408ce149b6cd80b0715a2d911a0afea",
                 "m/0' key") ||
      !ExpectHex(child.chain_code,
                 "47fdacbd0f1097043b78c63c20c34ef4ed9a111d980047ad16282c7ae6236141",
                 "m/0' chain") ||
      !ExpectHex(child.PublicKey(),
                 "035a784662a4a20a65bf6aab9ae98a6c068a81c52e4b032c0fb5400c706cfccc56",
                 "m/0' pub")) {
    return EXIT_FAILURE;
  }
  if (child.depth != 1 || child.child_number != (0 | kHardenedBit) ||
      child.parent_fingerprint != master.Fingerprint()) {
    std::cerr << "m/0' metadata mismatch\n";
    return EXIT_FAILURE;
  }

  // DerivePath agrees with stepwise derivation.
  {
    const std::array<std::uint32_t, 2> path = {0 | kHardenedBit, 1};
    ExtendedPrivateKey via_path;
    ExtendedPrivateKey step;
    if (!DerivePath(master, path, &via_path) || !DeriveChild(child, 1, &step)) {
      std::cerr << "path derivation failed\n";
      return EXIT_FAILURE;
    }
    if (via_path.key != step.key || via_path.chain_code != step.chain_code) {
      std::cerr << "DerivePath disagrees with DeriveChild\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
