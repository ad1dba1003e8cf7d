#pragma once

#include <cstddef>

namespace conduit {

// Upper bound of a single read/write/sendfile/splice/copy_file_range call on Linux (MAX_RW_COUNT:
// INT_MAX rounded down to the page size). Larger transfers are split into several calls.
inline constexpr std::size_t kDefaultMaxDirectChunk = 0x7ffff000UL;

/// Tuning knobs for Transfer.
class TransferConfig {
 public:
  static constexpr std::size_t kDefaultBufferSize = 8192;
  static constexpr std::size_t kMaxBufferSize = 64UL * 1024 * 1024;

  void validate() const;

  TransferConfig& withBufferSize(std::size_t bufferSize);

  TransferConfig& withMaxDirectChunkSize(std::size_t maxDirectChunkSize);

  TransferConfig& withDirectTransfer(bool on);

  /// Size of the scratch buffer used by the buffered copy loop.
  std::size_t bufferSize{kDefaultBufferSize};

  /// Maximum number of bytes requested from one zero-copy system call.
  std::size_t maxDirectChunkSize{kDefaultMaxDirectChunk};

  // When false, the buffered copy loop is always used.
  bool enableDirectTransfer{true};
};

}  // namespace conduit
