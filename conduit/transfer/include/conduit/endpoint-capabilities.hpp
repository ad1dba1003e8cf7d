#pragma once

#include <cstdint>
#include <string_view>

#include "conduit/platform.hpp"

namespace conduit {

// What an endpoint is backed by, which decides the zero-copy primitives it can take part in.
enum class EndpointKind : std::uint8_t {
  Stream,      // no descriptor: plain read / write only
  File,        // regular file: seekable, known size, offset-addressed primitives
  Pipe,        // FIFO: sequential, usable with splice
  Descriptor,  // socket: sequential, usable as splice input through a pipe
};

struct EndpointCapabilities {
  EndpointKind kind{EndpointKind::Stream};
  NativeHandle fd{kInvalidHandle};  // valid for every kind but Stream
  bool nonBlocking{false};          // O_NONBLOCK set on a Pipe / Descriptor endpoint

  bool operator==(const EndpointCapabilities&) const noexcept = default;
};

// Descriptor access handed to the direct-transfer paths.
// For File endpoints, the descriptor's file offset is the endpoint position.
struct DirectHandle {
  NativeHandle fd;
  EndpointKind kind;

  bool operator==(const DirectHandle&) const noexcept = default;
};

constexpr std::string_view EndpointKindName(EndpointKind kind) noexcept {
  switch (kind) {
    case EndpointKind::Stream:
      return "stream";
    case EndpointKind::File:
      return "file";
    case EndpointKind::Pipe:
      return "pipe";
    case EndpointKind::Descriptor:
      return "descriptor";
    default:
      return "unknown";
  }
}

}  // namespace conduit
