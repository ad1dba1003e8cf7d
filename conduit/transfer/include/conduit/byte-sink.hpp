#pragma once

#include <cstddef>
#include <optional>
#include <span>

#include "conduit/endpoint-capabilities.hpp"
#include "conduit/io-result.hpp"

namespace conduit {

// Writable endpoint of a transfer.
class ByteSink {
 public:
  virtual ~ByteSink() = default;

  // Writes up to src.size() bytes at the current position. May write less than requested: the number
  // written is reported and the caller retries the remainder. Never returns EndOfData.
  virtual IoResult write(std::span<const std::byte> src) = 0;

  // Inspected once per transfer call. Default: a Stream endpoint without descriptor.
  [[nodiscard]] virtual EndpointCapabilities capabilities() const { return {}; }

  [[nodiscard]] bool isNonBlocking() const { return capabilities().nonBlocking; }

  // Descriptor access for zero-copy paths, absent for Stream endpoints.
  [[nodiscard]] std::optional<DirectHandle> asDirectTransferable() const {
    const EndpointCapabilities caps = capabilities();
    if (caps.kind == EndpointKind::Stream) {
      return std::nullopt;
    }
    return DirectHandle{caps.fd, caps.kind};
  }
};

}  // namespace conduit
