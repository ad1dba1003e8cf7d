#include "conduit/direct-transfer.hpp"

#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <stdexcept>

#include "conduit/chunked-transfer.hpp"
#include "conduit/direct-io.hpp"
#include "conduit/endpoint-capabilities.hpp"
#include "conduit/errno-throw.hpp"
#include "conduit/file-offset.hpp"
#include "conduit/log.hpp"
#include "conduit/pipe.hpp"
#include "conduit/platform.hpp"
#include "conduit/transfer-strategy.hpp"

namespace conduit {

namespace {

std::uint64_t CurrentOffset(NativeHandle fd) {
  const off_t pos = ::lseek(fd, 0, SEEK_CUR);
  if (pos == -1) {
    throw_errno("lseek failed for fd # {}", fd);
  }
  return FromFileOffset(pos);
}

std::uint64_t FileSize(NativeHandle fd) {
  struct stat st{};
  if (::fstat(fd, &st) == -1) {
    throw_errno("fstat failed for fd # {}", fd);
  }
  return FromFileOffset(st.st_size);
}

// Stores start + moved back as the file offset of a file endpoint.
// commit() is the regular exit and throws on failure; the destructor covers exceptional exits and only logs.
class OffsetCommitGuard {
 public:
  OffsetCommitGuard(NativeHandle fd, std::uint64_t start, const std::uint64_t& moved) noexcept
      : _fd(fd), _start(start), _moved(moved) {}

  OffsetCommitGuard(const OffsetCommitGuard&) = delete;
  OffsetCommitGuard(OffsetCommitGuard&&) = delete;
  OffsetCommitGuard& operator=(const OffsetCommitGuard&) = delete;
  OffsetCommitGuard& operator=(OffsetCommitGuard&&) = delete;

  ~OffsetCommitGuard() {
    if (!_committed && ::lseek(_fd, static_cast<off_t>(_start + _moved), SEEK_SET) == -1) {
      log::error("unable to store offset {} back to fd # {} (errno {}: {})", _start + _moved, _fd, errno,
                 SystemErrorMessage(errno));
    }
  }

  void commit() {
    _committed = true;
    if (::lseek(_fd, ToFileOffset(_start + _moved), SEEK_SET) == -1) {
      throw_errno("unable to store offset {} back to fd # {}", _start + _moved, _fd);
    }
  }

 private:
  NativeHandle _fd;
  std::uint64_t _start;
  const std::uint64_t& _moved;  // only ever advanced by primitives that checked the offset range
  bool _committed{false};
};

// Invokes a primitive returning -1 / errno, restarting it while interrupted.
template <class Call>
int64_t RetryOnEintr(Call&& call) {
  int64_t ret;
  do {
    ret = call();
  } while (ret == -1 && errno == EINTR);
  return ret;
}

ChunkResult ToChunkResult(int64_t ret) noexcept {
  if (ret > 0) {
    return {static_cast<std::size_t>(ret), ChunkStatus::Ok, 0};
  }
  if (ret == 0) {
    return {0, ChunkStatus::EndOfData, 0};
  }
  return {0, ChunkStatus::Error, errno};
}

constexpr bool IsCopyFileRangeUnsupported(int err) noexcept {
  return err == error::kCrossDevice || err == error::kNotSupported || err == ENOSYS || err == EINVAL;
}

ChunkedTransferResult PushFromFile(NativeHandle srcFd, NativeHandle dstFd, std::size_t maxChunk) {
  const std::uint64_t start = CurrentOffset(srcFd);
  const std::uint64_t size = FileSize(srcFd);
  const std::uint64_t total = size > start ? size - start : 0;

  std::uint64_t moved = 0;
  OffsetCommitGuard srcGuard(srcFd, start, moved);
  auto res = RunChunkedTransfer(
      [&](std::uint64_t pos, std::size_t count) {
        AdvanceFileOffset(pos, count);
        off_t offset = ToFileOffset(pos);
        const ChunkResult chunk = ToChunkResult(RetryOnEintr([&] { return Sendfile(dstFd, srcFd, offset, count); }));
        moved += chunk.bytes;
        return chunk;
      },
      start, total, maxChunk);
  srcGuard.commit();
  return res;
}

ChunkedTransferResult PullFromFile(NativeHandle srcFd, NativeHandle dstFd, std::size_t maxChunk) {
  const std::uint64_t srcStart = CurrentOffset(srcFd);
  const std::uint64_t dstStart = CurrentOffset(dstFd);
  const std::uint64_t size = FileSize(srcFd);
  const std::uint64_t total = size > srcStart ? size - srcStart : 0;

  std::uint64_t moved = 0;
  bool useSendfile = false;
  OffsetCommitGuard srcGuard(srcFd, srcStart, moved);
  OffsetCommitGuard dstGuard(dstFd, dstStart, moved);
  auto res = RunChunkedTransfer(
      [&](std::uint64_t pos, std::size_t count) {
        AdvanceFileOffset(pos, count);
        const std::uint64_t dstPos = dstStart + moved;
        AdvanceFileOffset(dstPos, count);
        off_t inOffset = ToFileOffset(pos);
        off_t outOffset = ToFileOffset(dstPos);
        if (!useSendfile) {
          const int64_t ret =
              RetryOnEintr([&] { return CopyFileRange(srcFd, inOffset, dstFd, outOffset, count); });
          const ChunkResult chunk = ToChunkResult(ret);
          if (chunk.status != ChunkStatus::Error || moved != 0 || !IsCopyFileRangeUnsupported(chunk.err)) {
            moved += chunk.bytes;
            return chunk;
          }
          log::warn("copy_file_range from fd # {} to fd # {} refused (errno {}: {}), falling back to sendfile", srcFd,
                    dstFd, chunk.err, SystemErrorMessage(chunk.err));
          useSendfile = true;
        }
        // sendfile writes at the current offset of the sink.
        if (::lseek(dstFd, outOffset, SEEK_SET) == -1) {
          return ChunkResult{0, ChunkStatus::Error, errno};
        }
        const ChunkResult chunk =
            ToChunkResult(RetryOnEintr([&] { return Sendfile(dstFd, srcFd, inOffset, count); }));
        moved += chunk.bytes;
        return chunk;
      },
      srcStart, total, maxChunk);
  srcGuard.commit();
  dstGuard.commit();
  return res;
}

ChunkedTransferResult PullFromPipe(NativeHandle srcFd, NativeHandle dstFd, std::size_t maxChunk) {
  const std::uint64_t dstStart = CurrentOffset(dstFd);

  std::uint64_t moved = 0;
  OffsetCommitGuard dstGuard(dstFd, dstStart, moved);
  // A pipe has no position: the driver position only counts bytes.
  auto res = RunChunkedTransfer(
      [&](std::uint64_t, std::size_t count) {
        const std::uint64_t dstPos = dstStart + moved;
        AdvanceFileOffset(dstPos, count);
        off_t outOffset = ToFileOffset(dstPos);
        const ChunkResult chunk =
            ToChunkResult(RetryOnEintr([&] { return Splice(srcFd, nullptr, dstFd, &outOffset, count); }));
        moved += chunk.bytes;
        return chunk;
      },
      0, std::nullopt, maxChunk);
  dstGuard.commit();
  return res;
}

ChunkedTransferResult PullThroughPipe(NativeHandle srcFd, NativeHandle dstFd, std::size_t maxChunk) {
  const std::uint64_t dstStart = CurrentOffset(dstFd);
  Pipe pipe;
  const std::size_t pipeCapacity = pipe.capacity();
  const NativeHandle pipeIn = pipe.writeEnd().fd();
  const NativeHandle pipeOut = pipe.readEnd().fd();

  std::uint64_t moved = 0;
  OffsetCommitGuard dstGuard(dstFd, dstStart, moved);
  auto res = RunChunkedTransfer(
      [&](std::uint64_t, std::size_t count) {
        const std::size_t request = std::min(count, pipeCapacity);
        const std::uint64_t dstPos = dstStart + moved;
        AdvanceFileOffset(dstPos, request);
        const int64_t filled = RetryOnEintr([&] { return Splice(srcFd, nullptr, pipeIn, nullptr, request); });
        if (filled <= 0) {
          return ToChunkResult(filled);
        }

        // Drain everything the pipe took before the next fill, so no byte stays behind in it.
        std::size_t drained = 0;
        while (drained < static_cast<std::size_t>(filled)) {
          off_t outOffset = ToFileOffset(dstPos + drained);
          const int64_t ret = RetryOnEintr(
              [&] { return Splice(pipeOut, nullptr, dstFd, &outOffset, static_cast<std::size_t>(filled) - drained); });
          if (ret <= 0) {
            const int err = ret == 0 ? EIO : errno;
            moved += drained;
            return ChunkResult{drained, ChunkStatus::Error, err};
          }
          drained += static_cast<std::size_t>(ret);
        }
        moved += drained;
        return ChunkResult{drained, ChunkStatus::Ok, 0};
      },
      0, std::nullopt, maxChunk);
  dstGuard.commit();
  return res;
}

}  // namespace

ChunkedTransferResult RunDirectTransfer(const TransferPlan& plan, std::size_t maxChunk) {
  const NativeHandle srcFd = plan.source.fd;
  const NativeHandle dstFd = plan.sink.fd;

  ChunkedTransferResult res;
  switch (plan.strategy) {
    case TransferStrategy::SourcePush:
      res = PushFromFile(srcFd, dstFd, maxChunk);
      break;
    case TransferStrategy::SinkPull:
      switch (plan.source.kind) {
        case EndpointKind::File:
          res = PullFromFile(srcFd, dstFd, maxChunk);
          break;
        case EndpointKind::Pipe:
          res = PullFromPipe(srcFd, dstFd, maxChunk);
          break;
        case EndpointKind::Descriptor:
          res = PullThroughPipe(srcFd, dstFd, maxChunk);
          break;
        default:
          throw std::invalid_argument("RunDirectTransfer: sink-pull requires a descriptor source");
      }
      break;
    default:
      throw std::invalid_argument("RunDirectTransfer: plan is not a direct strategy");
  }

  log::debug("{} transfer fd # {} -> fd # {}: {} bytes in {} calls ({})", TransferStrategyName(plan.strategy), srcFd,
             dstFd, res.bytesTransferred, res.nbCalls, ChunkedStopReasonName(res.stopReason));
  if (res.stopReason == ChunkedStopReason::Error) {
    throw_system_error(res.err, "{} transfer from fd # {} to fd # {} failed after {} bytes",
                       TransferStrategyName(plan.strategy), srcFd, dstFd, res.bytesTransferred);
  }
  return res;
}

}  // namespace conduit
