#pragma once

#include <cstdint>

#include "conduit/byte-sink.hpp"
#include "conduit/byte-source.hpp"
#include "conduit/transfer-config.hpp"
#include "conduit/transfer-strategy.hpp"

namespace conduit {

struct TransferStats {
  std::uint64_t bytesTransferred{0};
  TransferStrategy strategy{TransferStrategy::Buffered};
  // Zero-copy system calls for direct strategies, reads returning data for the buffered one.
  std::uint64_t nbCalls{0};
};

// Moves every remaining byte of source into sink, starting at their current positions, and returns the
// number of bytes moved. Both positions are advanced by exactly that count, so a second call transfers
// only what the source received in between.
//
// Throws:
//  - std::invalid_argument if sink is null (the source is left untouched) or config is invalid
//  - IllegalBlockingModeError if either endpoint is in non-blocking mode
//  - std::system_error on a read, write or zero-copy failure. Bytes moved before the failure stay moved.
std::uint64_t Transfer(ByteSource& source, ByteSink* sink, const TransferConfig& config = {});

// Same as Transfer, also reporting the path taken and the number of primitive calls.
TransferStats TransferWithStats(ByteSource& source, ByteSink* sink, const TransferConfig& config = {});

}  // namespace conduit
