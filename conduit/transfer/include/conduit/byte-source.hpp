#pragma once

#include <cstddef>
#include <optional>
#include <span>

#include "conduit/endpoint-capabilities.hpp"
#include "conduit/io-result.hpp"

namespace conduit {

// Readable endpoint of a transfer.
class ByteSource {
 public:
  virtual ~ByteSource() = default;

  // Reads up to dst.size() bytes at the current position and advances it by the number read.
  // Blocking endpoints only return Ok, EndOfData, Interrupted or Error.
  virtual IoResult read(std::span<std::byte> dst) = 0;

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
