#include "util/csprng.hpp"

#include <cstring>
#include <limits>
#include <stdexcept>

#include <errno.h>
#include <fcntl.h>
#include <unistd.h>
#if defined(__linux__)
#include <sys/random.h>
#endif

namespace ctwallet::util {

bool FillSecureRandomBytes(std::span<std::uint8_t> out, std::string* error) {
  if (out.empty()) {
    return true;
  }
  std::size_t filled = 0;
#if defined(__linux__)
  while (filled < out.size()) {
    const ssize_t n = getrandom(out.data() + filled, out.size() - filled, 0);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      break;
    }
    filled += static_cast<std::size_t>(n);
  }
  if (filled == out.size()) {
    return true;
  }
#endif

  const int fd = ::open("/dev/urandom", O_RDONLY);
  if (fd < 0) {
    if (error) {
      *error = std::string("open(/dev/urandom) failed: ") + std::strerror(errno);
    }
    return false;
  }
  while (filled < out.size()) {
    const ssize_t n = ::read(fd, out.data() + filled, out.size() - filled);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      ::close(fd);
      if (error) {
        *error = std::string("read(/dev/urandom) failed: ") + std::strerror(errno);
      }
      return false;
    }
    if (n == 0) {
      ::close(fd);
      if (error) {
        *error = "read(/dev/urandom) returned EOF";
      }
      return false;
    }
    filled += static_cast<std::size_t>(n);
  }
  ::close(fd);
  return true;
}

void FillSecureRandomBytesOrThrow(std::span<std::uint8_t> out) {
  std::string error;
  if (!FillSecureRandomBytes(out, &error)) {
    throw std::runtime_error("secure randomness unavailable: " + error);
  }
}

std::vector<std::uint8_t> SecureRandomBytes(std::size_t size) {
  std::vector<std::uint8_t> out(size);
  FillSecureRandomBytesOrThrow(out);
  return out;
}

std::uint64_t SecureRandomBelow(std::uint64_t bound) {
  if (bound == 0) {
    throw std::invalid_argument("SecureRandomBelow: zero bound");
  }
  // Rejection sampling keeps the result unbiased.
  const std::uint64_t limit =
      std::numeric_limits<std::uint64_t>::max() - (std::numeric_limits<std::uint64_t>::max() % bound);
  while (true) {
    std::array<std::uint8_t, 8> buf{};
    FillSecureRandomBytesOrThrow(buf);
    std::uint64_t value = 0;
    for (auto b : buf) {
      value = (value << 8) | b;
    }
    if (value < limit) {
      return value % bound;
    }
  }
}

}  // namespace ctwallet::util
