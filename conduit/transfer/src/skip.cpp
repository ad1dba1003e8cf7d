#include "conduit/skip.hpp"

#include <algorithm>
#include <array>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <stdexcept>

#include <fmt/format.h>

#include "conduit/errno-throw.hpp"
#include "conduit/io-result.hpp"
#include "conduit/log.hpp"
#include "conduit/transfer-errors.hpp"

namespace conduit {

SkipResult Skip(ByteSource& source, std::int64_t n) {
  if (n < 1) {
    return {0, SkipStatus::Completed, 0};
  }

  const auto target = static_cast<std::uint64_t>(n);
  const auto bufSize = static_cast<std::size_t>(std::min<std::uint64_t>(target, kMaxSkipBufferSize));
  std::array<std::byte, kMaxSkipBufferSize> scratch;

  std::uint64_t skipped = 0;
  while (skipped < target) {
    const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(target - skipped, bufSize));
    const auto [nbRead, status, err] = source.read(std::span<std::byte>(scratch).first(count));
    switch (status) {
      case IoStatus::Ok:
        if (nbRead == 0) {
          // Nothing came back for a non-empty request: treat like end of data rather than spin.
          return {skipped, SkipStatus::Completed, 0};
        }
        skipped += nbRead;
        break;
      case IoStatus::EndOfData:
        return {skipped, SkipStatus::Completed, 0};
      case IoStatus::WouldBlock:
        return {skipped, SkipStatus::WouldBlock, 0};
      case IoStatus::Interrupted:
        return {skipped, SkipStatus::Interrupted, 0};
      case IoStatus::Error:
        log::debug("skip: read failed after {} bytes (errno {}: {})", skipped, err, SystemErrorMessage(err));
        return {0, SkipStatus::Error, err};
      default:
        throw std::logic_error("skip: unexpected read status");
    }
  }
  return {skipped, SkipStatus::Completed, 0};
}

void SkipExactly(ByteSource& source, std::uint64_t n) {
  static constexpr auto kMaxSkipPerCall = static_cast<std::uint64_t>(std::numeric_limits<std::int64_t>::max());

  std::uint64_t remaining = n;
  while (remaining > 0) {
    const std::uint64_t request = std::min(remaining, kMaxSkipPerCall);
    const SkipResult res = Skip(source, static_cast<std::int64_t>(request));
    switch (res.status) {
      case SkipStatus::Completed:
        remaining -= res.bytesSkipped;
        if (res.bytesSkipped < request) {
          throw std::runtime_error(
              fmt::format("end of data reached after skipping {} of {} bytes", n - remaining, n));
        }
        break;
      case SkipStatus::Interrupted:
        remaining -= res.bytesSkipped;
        break;
      case SkipStatus::WouldBlock:
        throw IllegalBlockingModeError("cannot skip exactly on a source that would block");
      case SkipStatus::Error:
        throw_system_error(res.err, "skip failed after {} of {} bytes", n - remaining, n);
      default:
        throw std::logic_error("skip: unexpected status");
    }
  }
}

}  // namespace conduit
