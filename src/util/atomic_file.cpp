#include "util/atomic_file.hpp"

#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <system_error>

#include <fcntl.h>
#include <unistd.h>

namespace ctwallet::util {

namespace {

std::atomic<std::uint64_t> g_temp_counter{0};

std::filesystem::path MakeTempPath(const std::filesystem::path& target) {
  const auto nonce = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  std::string tmp_name =
      target.filename().string() + ".tmp." + std::to_string(now) + "." + std::to_string(nonce);
  return target.parent_path() / tmp_name;
}

void SetError(std::string* error, const std::string& what) {
  if (error) {
    *error = what + ": " + std::strerror(errno);
  }
}

bool WriteAllAndSync(int fd, std::span<const std::uint8_t> data, std::string* error) {
  std::size_t written = 0;
  while (written < data.size()) {
    const ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      SetError(error, "write failed");
      return false;
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    SetError(error, "fsync failed");
    return false;
  }
  return true;
}

void SyncDirectory(const std::filesystem::path& dir) {
  const auto target = dir.empty() ? std::filesystem::path(".") : dir;
  const int fd = ::open(target.c_str(), O_RDONLY | O_DIRECTORY);
  if (fd < 0) {
    return;
  }
  (void)::fsync(fd);
  ::close(fd);
}

}  // namespace

bool AtomicWriteFileBytes(const std::filesystem::path& path,
                          std::span<const std::uint8_t> data,
                          std::string* error) {
  const auto parent = path.parent_path();
  if (!parent.empty()) {
    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec) {
      if (error) {
        *error = "create_directories failed: " + ec.message();
      }
      return false;
    }
  }

  const auto tmp_path = MakeTempPath(path);
  const int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
  if (fd < 0) {
    SetError(error, "failed to open temp file for write");
    return false;
  }
  const bool ok = WriteAllAndSync(fd, data, error);
  ::close(fd);
  if (!ok) {
    std::error_code ec;
    std::filesystem::remove(tmp_path, ec);
    return false;
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    if (error) {
      *error = "rename failed: " + ec.message();
    }
    std::filesystem::remove(tmp_path, ec);
    return false;
  }
  SyncDirectory(parent);
  return true;
}

std::optional<std::vector<std::uint8_t>> ReadFileBytes(const std::filesystem::path& path,
                                                       bool* missing,
                                                       std::string* error) {
  if (missing) {
    *missing = false;
  }
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    if (missing) {
      *missing = true;
    }
    if (error) {
      *error = "file not found: " + path.string();
    }
    return std::nullopt;
  }
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    if (error) {
      *error = "file unreadable: " + path.string();
    }
    return std::nullopt;
  }
  in.seekg(0, std::ios::end);
  const auto size = in.tellg();
  if (size < 0) {
    if (error) {
      *error = "file size query failed";
    }
    return std::nullopt;
  }
  in.seekg(0, std::ios::beg);
  std::vector<std::uint8_t> out(static_cast<std::size_t>(size));
  if (!out.empty()) {
    in.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
    if (!in.good()) {
      if (error) {
        *error = "file read failed";
      }
      return std::nullopt;
    }
  }
  return out;
}

}  // namespace ctwallet::util
