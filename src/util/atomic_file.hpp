#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ctwallet::util {

// Replace `path` atomically: the bytes go to a temp file in the same
// directory, are fsync'ed, and only then renamed over the target. Readers see
// either the previous contents or the new contents, never a partial file.
bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error = nullptr);

// Returns std::nullopt and leaves `missing` true when the file does not exist.
std::optional<std::vector<std::uint8_t>> ReadFileBytes(const std::filesystem::path& path,
                                                       bool* missing = nullptr,
                                                       std::string* error = nullptr);

}  // namespace ctwallet::util
