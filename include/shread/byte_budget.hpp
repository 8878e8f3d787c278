#pragma once
#include <cstddef>

namespace shread {

constexpr std::size_t kDefaultReadByteLimit = 100 * 1024 * 1024; // 100 MiB

// Raw-byte ceiling for one acquisition call. limit == 0 disables the check.
struct ByteBudget {
  std::size_t limit = kDefaultReadByteLimit;

  bool exceeded(std::size_t raw_bytes) const noexcept {
    return limit != 0 && raw_bytes > limit;
  }
};

}
