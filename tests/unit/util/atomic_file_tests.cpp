#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>

#include "util/atomic_file.hpp"

int main() {
  using namespace ctwallet::util;
  const auto dir = std::filesystem::temp_directory_path() / "ctwallet_atomic_file_tests";
  std::filesystem::remove_all(dir);
  std::filesystem::create_directories(dir);
  const auto path = dir / "blob.bin";

  bool missing = false;
  if (ReadFileBytes(path, &missing) || !missing) {
    std::cerr << "missing file not reported\n";
    return EXIT_FAILURE;
  }

  const std::vector<std::uint8_t> first = {1, 2, 3, 4};
  const std::vector<std::uint8_t> second = {9, 8, 7};
  std::string error;
  if (!AtomicWriteFileBytes(path, first, &error)) {
    std::cerr << "first write failed: " << error << "\n";
    return EXIT_FAILURE;
  }
  if (!AtomicWriteFileBytes(path, second, &error)) {
    std::cerr << "second write failed: " << error << "\n";
    return EXIT_FAILURE;
  }
  const auto read = ReadFileBytes(path, &missing, &error);
  if (!read || missing || *read != second) {
    std::cerr << "replaced contents not read back\n";
    return EXIT_FAILURE;
  }
  for (const auto& entry : std::filesystem::directory_iterator(dir)) {
    if (entry.path() != path) {
      std::cerr << "temp file left behind: " << entry.path() << "\n";
      return EXIT_FAILURE;
    }
  }

  std::filesystem::remove_all(dir);
  return EXIT_SUCCESS;
}
