#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace conduit {

// Outcome of one read or write on an endpoint.
enum class IoStatus : std::uint8_t {
  Ok,           // 'bytes' were read or written. 0 only for an empty request.
  EndOfData,    // source exhausted (bytes == 0). Never returned by sinks.
  WouldBlock,   // non-blocking endpoint has no data / no space right now
  Interrupted,  // blocking call interrupted by a signal before any byte moved
  Error         // hard failure, 'err' holds the errno value
};

struct IoResult {
  std::size_t bytes;  // bytes read for read operations, or written for write operations
  IoStatus status;
  int err;  // errno value when status == Error, 0 otherwise
};

constexpr std::string_view IoStatusName(IoStatus status) noexcept {
  switch (status) {
    case IoStatus::Ok:
      return "ok";
    case IoStatus::EndOfData:
      return "end-of-data";
    case IoStatus::WouldBlock:
      return "would-block";
    case IoStatus::Interrupted:
      return "interrupted";
    case IoStatus::Error:
      return "error";
    default:
      return "unknown";
  }
}

}  // namespace conduit
