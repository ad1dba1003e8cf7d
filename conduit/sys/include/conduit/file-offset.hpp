#pragma once

#include <sys/types.h>  // off_t

#include <cstdint>
#include <limits>
#include <stdexcept>
#include <type_traits>

namespace conduit {

static_assert(sizeof(off_t) == sizeof(std::int64_t), "conduit requires a 64-bit off_t (_FILE_OFFSET_BITS=64)");

// Largest position representable by the kernel offset type.
inline constexpr std::uint64_t kMaxFileOffset = static_cast<std::uint64_t>(std::numeric_limits<off_t>::max());

// Converts a 64-bit unsigned position to off_t, rejecting values that would wrap negative.
constexpr off_t ToFileOffset(std::uint64_t position) {
  if (position > kMaxFileOffset) [[unlikely]] {
    throw std::overflow_error("position exceeds the maximum file offset");
  }
  return static_cast<off_t>(position);
}

// Converts an off_t returned by the kernel to an unsigned position.
constexpr std::uint64_t FromFileOffset(off_t offset) {
  if (offset < 0) [[unlikely]] {
    throw std::overflow_error("negative file offset");
  }
  return static_cast<std::uint64_t>(offset);
}

// position + count, throwing instead of exceeding kMaxFileOffset.
constexpr std::uint64_t AdvanceFileOffset(std::uint64_t position, std::uint64_t count) {
  if (count > kMaxFileOffset || position > kMaxFileOffset - count) [[unlikely]] {
    throw std::overflow_error("file offset overflow");
  }
  return position + count;
}

}  // namespace conduit
