#include "util/secure_wipe.hpp"

#include <cstring>

namespace ctwallet::util {

void SecureWipe(void* data, std::size_t size) noexcept {
  if (data == nullptr || size == 0) {
    return;
  }
#if defined(__STDC_LIB_EXT1__)
  (void)memset_s(data, size, 0, size);
#else
  volatile std::uint8_t* ptr = reinterpret_cast<volatile std::uint8_t*>(data);
  while (size--) {
    *ptr++ = 0;
  }
#endif
}

}  // namespace ctwallet::util
