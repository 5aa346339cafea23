#include <cstdint>
#include <cstdlib>
#include <iostream>
#include <vector>

#include "util/hex.hpp"

int main() {
  using namespace ctwallet::util;

  {
    const std::vector<std::uint8_t> bytes = {0x00, 0x01, 0xab, 0xff};
    if (HexEncode(bytes) != "0001abff") {
      std::cerr << "HexEncode mismatch\n";
      return EXIT_FAILURE;
    }
    if (HexEncodeReversed(bytes) != "ffab0100") {
      std::cerr << "HexEncodeReversed mismatch\n";
      return EXIT_FAILURE;
    }
  }

  {
    std::vector<std::uint8_t> out;
    if (!HexDecode("DEADbeef", &out) || out != std::vector<std::uint8_t>{0xde, 0xad, 0xbe, 0xef}) {
      std::cerr << "mixed-case decode failed\n";
      return EXIT_FAILURE;
    }
    if (HexDecode("abc", &out)) {
      std::cerr << "odd-length hex accepted\n";
      return EXIT_FAILURE;
    }
    if (HexDecode("zz", &out) || !out.empty()) {
      std::cerr << "non-hex digits accepted\n";
      return EXIT_FAILURE;
    }
  }

  // Display order is reversed relative to internal order.
  {
    const auto parsed =
        ParseHash256Hex("0100000000000000000000000000000000000000000000000000000000000002");
    if (!parsed || (*parsed)[0] != 0x02 || (*parsed)[31] != 0x01) {
      std::cerr << "ParseHash256Hex did not reverse\n";
      return EXIT_FAILURE;
    }
    if (ParseHash256Hex("0102")) {
      std::cerr << "short hash accepted\n";
      return EXIT_FAILURE;
    }
  }

  return EXIT_SUCCESS;
}
