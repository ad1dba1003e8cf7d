#include "conduit/transfer-strategy.hpp"

#include <fmt/format.h>

#include "conduit/endpoint-capabilities.hpp"
#include "conduit/platform.hpp"
#include "conduit/transfer-errors.hpp"

namespace conduit {

namespace {

constexpr bool IsDescriptorReadable(EndpointKind kind) noexcept { return kind != EndpointKind::Stream; }

constexpr bool IsSequentialDescriptor(EndpointKind kind) noexcept {
  return kind == EndpointKind::Pipe || kind == EndpointKind::Descriptor;
}

TransferStrategy Select(const EndpointCapabilities& source, const EndpointCapabilities& sink) noexcept {
  if (sink.kind == EndpointKind::File && IsDescriptorReadable(source.kind)) {
    return TransferStrategy::SinkPull;
  }
  if (source.kind == EndpointKind::File && IsSequentialDescriptor(sink.kind)) {
    return TransferStrategy::SourcePush;
  }
  return TransferStrategy::Buffered;
}

}  // namespace

TransferPlan SelectStrategy(const EndpointCapabilities& source, const EndpointCapabilities& sink, bool allowDirect) {
  TransferPlan plan{TransferStrategy::Buffered, source, sink};
  if (!allowDirect || !kDirectTransferSupported) {
    return plan;
  }

  plan.strategy = Select(source, sink);
  if (plan.strategy != TransferStrategy::Buffered && (source.nonBlocking || sink.nonBlocking)) {
    throw IllegalBlockingModeError(fmt::format("{} transfer from {} to {} requires blocking endpoints",
                                               TransferStrategyName(plan.strategy), EndpointKindName(source.kind),
                                               EndpointKindName(sink.kind)));
  }
  return plan;
}

}  // namespace conduit
