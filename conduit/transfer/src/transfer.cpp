#include "conduit/transfer.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <span>
#include <stdexcept>

#include <fmt/format.h>

#include "conduit/buffered-copy.hpp"
#include "conduit/direct-transfer.hpp"
#include "conduit/endpoint-capabilities.hpp"
#include "conduit/log.hpp"
#include "conduit/transfer-config.hpp"
#include "conduit/transfer-errors.hpp"
#include "conduit/transfer-strategy.hpp"

namespace conduit {

namespace {

TransferStats RunBuffered(ByteSource& source, ByteSink& sink, const TransferPlan& plan, std::size_t bufferSize) {
  if (plan.source.nonBlocking || plan.sink.nonBlocking) {
    throw IllegalBlockingModeError(fmt::format("cannot transfer from {}{} to {}{} endpoint",
                                               plan.source.nonBlocking ? "non-blocking " : "",
                                               EndpointKindName(plan.source.kind),
                                               plan.sink.nonBlocking ? "non-blocking " : "",
                                               EndpointKindName(plan.sink.kind)));
  }

  auto buffer = std::make_unique_for_overwrite<std::byte[]>(bufferSize);
  const BufferedCopyResult res = BufferedCopy(source, sink, std::span<std::byte>(buffer.get(), bufferSize));
  return {res.bytesTransferred, TransferStrategy::Buffered, res.nbReads};
}

}  // namespace

TransferStats TransferWithStats(ByteSource& source, ByteSink* sink, const TransferConfig& config) {
  if (sink == nullptr) {
    throw std::invalid_argument("Transfer: sink must not be null");
  }
  config.validate();

  const TransferPlan plan =
      SelectStrategy(source.capabilities(), sink->capabilities(), config.enableDirectTransfer);
  log::debug("transfer {} -> {} with {} strategy", EndpointKindName(plan.source.kind),
             EndpointKindName(plan.sink.kind), TransferStrategyName(plan.strategy));

  TransferStats stats;
  if (plan.strategy == TransferStrategy::Buffered) {
    stats = RunBuffered(source, *sink, plan, config.bufferSize);
  } else {
    const ChunkedTransferResult res = RunDirectTransfer(plan, config.maxDirectChunkSize);
    stats = {res.bytesTransferred, plan.strategy, res.nbCalls};
  }

  log::debug("transferred {} bytes in {} calls", stats.bytesTransferred, stats.nbCalls);
  return stats;
}

std::uint64_t Transfer(ByteSource& source, ByteSink* sink, const TransferConfig& config) {
  return TransferWithStats(source, sink, config).bytesTransferred;
}

}  // namespace conduit
