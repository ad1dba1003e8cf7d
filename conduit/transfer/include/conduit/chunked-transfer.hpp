#pragma once

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <optional>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace conduit {

enum class ChunkStatus : std::uint8_t {
  Ok,         // 'bytes' moved; 0 means no progress
  EndOfData,  // the source is exhausted
  Error       // hard failure, 'err' holds the errno value; 'bytes' still counts what reached the sink
};

// Outcome of one bounded call of a direct-transfer primitive.
struct ChunkResult {
  std::size_t bytes;
  ChunkStatus status;
  int err;
};

enum class ChunkedStopReason : std::uint8_t {
  Exhausted,   // the requested volume was fully transferred
  EndOfData,   // the source reported end of data
  NoProgress,  // a call moved nothing without reporting end of data
  Error        // a call failed
};

struct ChunkedTransferResult {
  std::uint64_t bytesTransferred{0};  // committed bytes, including those of the failing call
  std::uint64_t nbCalls{0};
  ChunkedStopReason stopReason{ChunkedStopReason::Exhausted};
  int err{0};
};

constexpr std::string_view ChunkedStopReasonName(ChunkedStopReason reason) noexcept {
  switch (reason) {
    case ChunkedStopReason::Exhausted:
      return "exhausted";
    case ChunkedStopReason::EndOfData:
      return "end-of-data";
    case ChunkedStopReason::NoProgress:
      return "no-progress";
    case ChunkedStopReason::Error:
      return "error";
    default:
      return "unknown";
  }
}

// Calls primitive(position, count) with count = min(remaining, maxChunk) until totalBytes are moved
// (unbounded when empty), the source reports end of data, a call makes no progress, or a call fails.
// Position and remaining volume are 64-bit and independent of the per-call bound.
//
// The primitive must have the signature ChunkResult(std::uint64_t position, std::size_t count) and
// must never report more than count bytes.
template <class Primitive>
ChunkedTransferResult RunChunkedTransfer(Primitive&& primitive, std::uint64_t position,
                                         std::optional<std::uint64_t> totalBytes, std::size_t maxChunk) {
  if (maxChunk == 0) {
    throw std::invalid_argument("RunChunkedTransfer: maxChunk must be > 0");
  }

  ChunkedTransferResult result;
  std::uint64_t remaining = totalBytes.value_or(std::numeric_limits<std::uint64_t>::max());
  while (remaining > 0) {
    const auto count = static_cast<std::size_t>(std::min<std::uint64_t>(remaining, maxChunk));
    const ChunkResult chunk = std::forward<Primitive>(primitive)(position, count);
    ++result.nbCalls;
    if (chunk.bytes > count) [[unlikely]] {
      throw std::logic_error("RunChunkedTransfer: primitive reported more bytes than requested");
    }

    result.bytesTransferred += chunk.bytes;
    position += chunk.bytes;
    remaining -= chunk.bytes;

    switch (chunk.status) {
      case ChunkStatus::Ok:
        if (chunk.bytes == 0) {
          result.stopReason = ChunkedStopReason::NoProgress;
          return result;
        }
        break;
      case ChunkStatus::EndOfData:
        result.stopReason = ChunkedStopReason::EndOfData;
        return result;
      case ChunkStatus::Error:
        result.stopReason = ChunkedStopReason::Error;
        result.err = chunk.err;
        return result;
      default:
        throw std::logic_error("RunChunkedTransfer: unexpected chunk status");
    }
  }
  result.stopReason = ChunkedStopReason::Exhausted;
  return result;
}

}  // namespace conduit
