#pragma once

#include <chrono>
#include <cstdint>

namespace sealnode::util {

inline std::int64_t UnixNow() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

}  // namespace sealnode::util
