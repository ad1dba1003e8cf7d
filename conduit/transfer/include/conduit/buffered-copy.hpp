#pragma once

#include <cstddef>
#include <cstdint>
#include <span>

#include "conduit/byte-sink.hpp"
#include "conduit/byte-source.hpp"

namespace conduit {

struct BufferedCopyResult {
  std::uint64_t bytesTransferred;
  std::uint64_t nbReads;  // read calls that returned data
};

// Copies everything from source to sink through buffer until the source reports end of data.
// Partial writes and interrupted calls are resumed.
// Throws std::system_error on a read or write failure and IllegalBlockingModeError if an endpoint
// would block. Bytes already written before a failure stay in the sink.
BufferedCopyResult BufferedCopy(ByteSource& source, ByteSink& sink, std::span<std::byte> buffer);

}  // namespace conduit
