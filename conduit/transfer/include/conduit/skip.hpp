#pragma once

#include <cstddef>
#include <cstdint>

#include "conduit/byte-source.hpp"

namespace conduit {

// Maximum scratch buffer size used when skipping.
inline constexpr std::size_t kMaxSkipBufferSize = 4096;

enum class SkipStatus : std::uint8_t {
  Completed,    // n bytes skipped, or end of data reached first
  WouldBlock,   // non-blocking source ran dry; bytesSkipped is the partial count
  Interrupted,  // a read was interrupted by a signal; bytesSkipped is the partial count
  Error         // hard read failure; bytesSkipped is 0 and err holds the errno value
};

struct SkipResult {
  std::uint64_t bytesSkipped;
  SkipStatus status;
  int err;
};

// Discards up to n bytes from source without retaining them, reading through a bounded scratch buffer.
// n < 1 is a no-op returning {0, Completed}.
//
// A WouldBlock result is not a failure: the source had nothing more to give without blocking.
// Whether the skip is done or must be resumed later is for the caller to decide by comparing
// bytesSkipped with n.
[[nodiscard]] SkipResult Skip(ByteSource& source, std::int64_t n);

// Skips exactly n bytes from a blocking source, resuming interrupted skips.
// Throws std::runtime_error if end of data comes first, std::system_error on read failure and
// IllegalBlockingModeError if the source would block.
void SkipExactly(ByteSource& source, std::uint64_t n);

}  // namespace conduit
