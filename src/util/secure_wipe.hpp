#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

namespace ctwallet::util {

// Overwrite memory in a way the optimizer may not elide.
void SecureWipe(void* data, std::size_t size) noexcept;

inline void SecureWipe(std::span<std::uint8_t> data) noexcept {
  SecureWipe(data.data(), data.size());
}

inline void SecureWipe(std::vector<std::uint8_t>& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::vector<std::uint8_t>().swap(data);
}

inline void SecureWipe(std::string& data) noexcept {
  SecureWipe(data.data(), data.size());
  std::string().swap(data);
}

template <typename T, std::size_t N>
inline void SecureWipe(std::array<T, N>& data) noexcept {
  SecureWipe(data.data(), data.size() * sizeof(T));
}

// Wipes a buffer it does not own on every exit from the enclosing scope.
template <typename Buffer>
class WipeOnExit {
 public:
  explicit WipeOnExit(Buffer& buffer) noexcept : buffer_(buffer) {}
  WipeOnExit(const WipeOnExit&) = delete;
  WipeOnExit& operator=(const WipeOnExit&) = delete;
  ~WipeOnExit() { SecureWipe(buffer_); }

 private:
  Buffer& buffer_;
};

// Owns a fixed-size secret and wipes it when destroyed.
template <std::size_t N>
class SecretBytes {
 public:
  SecretBytes() = default;
  explicit SecretBytes(const std::array<std::uint8_t, N>& bytes) : bytes_(bytes) {}
  SecretBytes(const SecretBytes&) = default;
  SecretBytes& operator=(const SecretBytes&) = default;
  ~SecretBytes() { SecureWipe(bytes_); }

  std::uint8_t* data() noexcept { return bytes_.data(); }
  const std::uint8_t* data() const noexcept { return bytes_.data(); }
  static constexpr std::size_t size() noexcept { return N; }
  std::span<const std::uint8_t, N> span() const noexcept { return bytes_; }
  const std::array<std::uint8_t, N>& array() const noexcept { return bytes_; }

 private:
  std::array<std::uint8_t, N> bytes_{};
};

}  // namespace ctwallet::util
