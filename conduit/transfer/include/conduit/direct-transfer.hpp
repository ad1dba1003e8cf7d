#pragma once

#include <cstddef>

#include "conduit/chunked-transfer.hpp"
#include "conduit/transfer-strategy.hpp"

namespace conduit {

// Runs a SinkPull or SourcePush plan with the kernel zero-copy primitives, each call bounded by maxChunk.
// File endpoints are transferred from their current file offset, which is advanced by the bytes moved on
// every exit path.
// Throws std::system_error on hard failure (after positions are stored back), std::invalid_argument for a
// Buffered plan and std::overflow_error if a position would exceed the file offset range.
ChunkedTransferResult RunDirectTransfer(const TransferPlan& plan, std::size_t maxChunk);

}  // namespace conduit
