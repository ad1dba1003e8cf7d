#pragma once

#include <cstdint>
#include <string_view>

#include "conduit/endpoint-capabilities.hpp"

namespace conduit {

enum class TransferStrategy : std::uint8_t {
  Buffered,    // read into a scratch buffer, write it out
  SinkPull,    // the sink is a regular file and pulls from the source descriptor
  SourcePush,  // the source is a regular file and pushes into the sink descriptor
};

struct TransferPlan {
  TransferStrategy strategy{TransferStrategy::Buffered};
  EndpointCapabilities source;
  EndpointCapabilities sink;
};

// Decides the transfer path for one (source, sink) pair:
//  - sink File, source File / Pipe / Descriptor        -> SinkPull
//  - source File, sink Pipe / Descriptor               -> SourcePush
//  - otherwise, or if !allowDirect or unsupported here -> Buffered
// Throws IllegalBlockingModeError if a direct path is selected while either endpoint is non-blocking.
[[nodiscard]] TransferPlan SelectStrategy(const EndpointCapabilities& source, const EndpointCapabilities& sink,
                                          bool allowDirect = true);

constexpr std::string_view TransferStrategyName(TransferStrategy strategy) noexcept {
  switch (strategy) {
    case TransferStrategy::Buffered:
      return "buffered";
    case TransferStrategy::SinkPull:
      return "sink-pull";
    case TransferStrategy::SourcePush:
      return "source-push";
    default:
      return "unknown";
  }
}

}  // namespace conduit
