#include "conduit/transfer.hpp"

#include <gtest/gtest.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <tuple>
#include <utility>
#include <vector>

#include "conduit/base-fd.hpp"
#include "conduit/fake-endpoints.hpp"
#include "conduit/fd-endpoints.hpp"
#include "conduit/file.hpp"
#include "conduit/io-result.hpp"
#include "conduit/memory-endpoints.hpp"
#include "conduit/pipe.hpp"
#include "conduit/platform.hpp"
#include "conduit/random-bytes.hpp"
#include "conduit/temp-file.hpp"
#include "conduit/transfer-config.hpp"
#include "conduit/transfer-errors.hpp"
#include "conduit/transfer-strategy.hpp"

using namespace conduit;

using test::ScopedTempDir;
using test::ScopedTempFile;
using test::ScriptedSink;
using test::ScriptedSource;

namespace {

using Bytes = std::vector<std::byte>;

std::vector<std::byte> DrainPipe(Pipe& pipe) {
  pipe.writeEnd().close();
  std::vector<std::byte> out;
  std::byte buf[4096];
  for (;;) {
    const auto ret = ::read(pipe.readEnd().fd(), buf, sizeof(buf));
    if (ret <= 0) {
      break;
    }
    out.insert(out.end(), buf, buf + ret);
  }
  return out;
}

void FillPipe(Pipe& pipe, std::span<const std::byte> data) {
  std::size_t written = 0;
  while (written < data.size()) {
    const auto ret = ::write(pipe.writeEnd().fd(), data.data() + written, data.size() - written);
    ASSERT_GT(ret, 0);
    written += static_cast<std::size_t>(ret);
  }
}

enum class Kind : std::uint8_t { Memory, File, Pipe };

const char* KindName(Kind kind) {
  switch (kind) {
    case Kind::Memory:
      return "Memory";
    case Kind::File:
      return "File";
    default:
      return "Pipe";
  }
}

// Payload classes of the endpoint matrix. Pipe endpoints are filled before the transfer, so payloads stay
// below the default pipe capacity.
enum class Payload : std::uint8_t { Empty, Small, Medium, RandomOffset };

const char* PayloadName(Payload payload) {
  switch (payload) {
    case Payload::Empty:
      return "Empty";
    case Payload::Small:
      return "Small";
    case Payload::Medium:
      return "Medium";
    default:
      return "RandomOffset";
  }
}

// Source endpoint together with what keeps it alive.
struct SourceHolder {
  std::optional<ScopedTempFile> tmp;
  std::optional<File> file;
  std::optional<Pipe> pipe;
  std::unique_ptr<ByteSource> source;
  MemorySource* memory{nullptr};
};

struct SinkHolder {
  std::optional<File> file;
  std::optional<Pipe> pipe;
  std::unique_ptr<ByteSink> sink;
  MemorySink* memory{nullptr};
  std::string path;
};

class TransferTest : public ::testing::Test {
 protected:
  SourceHolder makeSource(Kind kind, const Bytes& data, std::size_t offset) {
    SourceHolder holder;
    switch (kind) {
      case Kind::Memory: {
        auto memory = std::make_unique<MemorySource>(data);
        memory->seek(offset);
        holder.memory = memory.get();
        holder.source = std::move(memory);
        break;
      }
      case Kind::File:
        holder.tmp.emplace(dir, data);
        holder.file.emplace(holder.tmp->filePath().string());
        holder.file->seek(offset);
        holder.source = std::make_unique<FdSource>(holder.file->fd());
        break;
      case Kind::Pipe:
        holder.pipe.emplace();
        if (offset < data.size()) {
          FillPipe(*holder.pipe, std::span<const std::byte>(data).subspan(offset));
        }
        holder.pipe->writeEnd().close();
        holder.source = std::make_unique<FdSource>(holder.pipe->readEnd().fd());
        break;
    }
    return holder;
  }

  SinkHolder makeSink(Kind kind) {
    SinkHolder holder;
    switch (kind) {
      case Kind::Memory: {
        auto memory = std::make_unique<MemorySink>();
        holder.memory = memory.get();
        holder.sink = std::move(memory);
        break;
      }
      case Kind::File:
        holder.path = (dir.dirPath() / ("sink-" + std::to_string(++sinkCounter))).string();
        holder.file.emplace(holder.path, File::OpenMode::ReadWrite);
        holder.sink = std::make_unique<FdSink>(holder.file->fd());
        break;
      case Kind::Pipe:
        holder.pipe.emplace();
        holder.sink = std::make_unique<FdSink>(holder.pipe->writeEnd().fd());
        break;
    }
    return holder;
  }

  static Bytes content(SinkHolder& holder) {
    if (holder.memory != nullptr) {
      return {holder.memory->data().begin(), holder.memory->data().end()};
    }
    if (holder.pipe) {
      return DrainPipe(*holder.pipe);
    }
    return test::ReadFileBytes(holder.path);
  }

  Bytes payload(std::size_t min, std::size_t maxAdditive) { return test::RandomBytes(rng, min, maxAdditive); }

  ScopedTempDir dir;
  std::mt19937_64 rng{20240917};
  int sinkCounter{0};
};

class TransferMatrixTest : public TransferTest,
                           public ::testing::WithParamInterface<std::tuple<Kind, Kind, Payload>> {};

TransferStrategy ExpectedStrategy(Kind source, Kind sink) {
  if (!kDirectTransferSupported) {
    return TransferStrategy::Buffered;
  }
  if (sink == Kind::File && source != Kind::Memory) {
    return TransferStrategy::SinkPull;
  }
  if (source == Kind::File && sink == Kind::Pipe) {
    return TransferStrategy::SourcePush;
  }
  return TransferStrategy::Buffered;
}

}  // namespace

TEST_P(TransferMatrixTest, MovesRemainingBytesExactly) {
  const auto [sourceKind, sinkKind, payloadClass] = GetParam();
  rng.seed(static_cast<std::uint64_t>(sourceKind) * 100 + static_cast<std::uint64_t>(sinkKind) * 10 +
           static_cast<std::uint64_t>(payloadClass));

  Bytes data;
  std::size_t offset = 0;
  switch (payloadClass) {
    case Payload::Empty:
      break;
    case Payload::Small:
      data = payload(1, 4096);
      break;
    case Payload::Medium:
      data = payload(16384, 16384);
      break;
    case Payload::RandomOffset:
      data = payload(1, 32768);
      offset = std::uniform_int_distribution<std::size_t>(0, data.size())(rng);
      break;
  }

  auto source = makeSource(sourceKind, data, offset);
  auto sink = makeSink(sinkKind);

  const TransferStats stats = TransferWithStats(*source.source, sink.sink.get());
  EXPECT_EQ(stats.bytesTransferred, data.size() - offset);
  EXPECT_EQ(stats.strategy, ExpectedStrategy(sourceKind, sinkKind));
  EXPECT_EQ(content(sink), Bytes(data.begin() + static_cast<std::ptrdiff_t>(offset), data.end()));

  if (source.memory != nullptr) {
    EXPECT_EQ(source.memory->position(), data.size());
  }
  if (source.file) {
    EXPECT_EQ(source.file->position(), data.size());
  }
  if (sink.file) {
    EXPECT_EQ(sink.file->position(), data.size() - offset);
  }

  // Everything was consumed: a second call moves nothing.
  if (!sink.pipe) {
    EXPECT_EQ(Transfer(*source.source, sink.sink.get()), 0U);
  }
}

INSTANTIATE_TEST_SUITE_P(Endpoints, TransferMatrixTest,
                         ::testing::Combine(::testing::Values(Kind::Memory, Kind::File, Kind::Pipe),
                                            ::testing::Values(Kind::Memory, Kind::File, Kind::Pipe),
                                            ::testing::Values(Payload::Empty, Payload::Small, Payload::Medium,
                                                              Payload::RandomOffset)),
                         [](const auto& info) {
                           return std::string(KindName(std::get<0>(info.param))) + "To" +
                                  KindName(std::get<1>(info.param)) + PayloadName(std::get<2>(info.param));
                         });

TEST_F(TransferTest, NullSinkThrowsBeforeTouchingSource) {
  for (std::size_t size : {0U, 1U, 2U}) {
    const auto data = payload(size, 0);
    ScriptedSource scripted(data);
    EXPECT_THROW((void)Transfer(scripted, nullptr), std::invalid_argument);
    EXPECT_EQ(scripted.nbReads(), 0U);
    EXPECT_EQ(scripted.nbCapabilityQueries(), 0U);

    auto fileSource = makeSource(Kind::File, data, 0);
    EXPECT_THROW((void)Transfer(*fileSource.source, nullptr), std::invalid_argument);
    EXPECT_EQ(fileSource.file->position(), 0U);
  }
}

TEST_F(TransferTest, NullSinkIsCheckedBeforeConfig) {
  ScriptedSource source(payload(10, 0));
  try {
    (void)Transfer(source, nullptr, TransferConfig{}.withBufferSize(0));
    FAIL() << "Expected std::invalid_argument";
  } catch (const std::invalid_argument& e) {
    EXPECT_NE(std::string(e.what()).find("sink"), std::string::npos);
  }
}

TEST_F(TransferTest, InvalidConfigIsRejectedBeforeAnyRead) {
  ScriptedSource source(payload(10, 0));
  ScriptedSink sink;
  EXPECT_THROW((void)Transfer(source, &sink, TransferConfig{}.withBufferSize(0)), std::invalid_argument);
  EXPECT_THROW((void)Transfer(source, &sink, TransferConfig{}.withMaxDirectChunkSize(0)), std::invalid_argument);
  EXPECT_EQ(source.nbReads(), 0U);
  EXPECT_EQ(source.position(), 0U);
}

TEST_F(TransferTest, CapabilitiesAreQueriedOncePerTransfer) {
  const auto data = payload(20000, 0);
  ScriptedSource source(data);
  ScriptedSink sink(1000);
  EXPECT_EQ(Transfer(source, &sink), data.size());
  EXPECT_EQ(source.nbCapabilityQueries(), 1U);
  EXPECT_EQ(sink.nbCapabilityQueries(), 1U);
}

TEST_F(TransferTest, TwoBufferFillsForTwiceTheBufferSize) {
  const auto data = payload(16384, 0);
  MemorySource source(data);
  MemorySink sink;
  const auto stats = TransferWithStats(source, &sink, TransferConfig{}.withBufferSize(8192));
  EXPECT_EQ(stats.bytesTransferred, 16384U);
  EXPECT_EQ(stats.strategy, TransferStrategy::Buffered);
  EXPECT_EQ(stats.nbCalls, 2U);
}

TEST_F(TransferTest, PartialWritesNeverLoseBytes) {
  const auto data = payload(10000, 0);
  ScriptedSource source(data);
  source.pushStep({7, IoStatus::Ok, 0});
  source.pushStep({0, IoStatus::Interrupted, 0});
  ScriptedSink sink(123);
  EXPECT_EQ(Transfer(source, &sink, TransferConfig{}.withBufferSize(1000)), data.size());
  EXPECT_EQ(sink.data(), data);
}

TEST_F(TransferTest, MidStreamWriteFailureKeepsFirstBytes) {
  const auto data = payload(10000, 0);
  MemorySource source(data);
  ScriptedSink sink;
  sink.failAfter(4321, ENOSPC);
  try {
    (void)Transfer(source, &sink, TransferConfig{}.withBufferSize(1024));
    FAIL() << "Expected std::system_error";
  } catch (const std::system_error& e) {
    EXPECT_EQ(e.code().value(), ENOSPC);
  }
  ASSERT_EQ(sink.data().size(), 4321U);
  EXPECT_TRUE(std::equal(sink.data().begin(), sink.data().end(), data.begin()));
  // The source gave out the whole failing buffer.
  EXPECT_EQ(source.position(), 5U * 1024U);
}

TEST_F(TransferTest, MidStreamReadFailurePropagates) {
  const auto data = payload(10000, 0);
  ScriptedSource source(data);
  source.pushStep({3000, IoStatus::Ok, 0});
  source.pushStep({0, IoStatus::Error, EIO});
  MemorySink sink;
  EXPECT_THROW((void)Transfer(source, &sink), std::system_error);
  EXPECT_EQ(sink.size(), 3000U);
}

TEST_F(TransferTest, SourcePositionedPastEndTransfersNothing) {
  const auto data = payload(100, 0);
  auto source = makeSource(Kind::File, data, 0);
  source.file->seek(1000);
  auto sink = makeSink(Kind::File);
  EXPECT_EQ(Transfer(*source.source, sink.sink.get()), 0U);
  EXPECT_EQ(source.file->position(), 1000U);
  EXPECT_EQ(sink.file->size(), 0U);

  MemorySource memory(data);
  memory.seek(500);
  MemorySink memorySink;
  EXPECT_EQ(Transfer(memory, &memorySink), 0U);
  EXPECT_EQ(memorySink.size(), 0U);
}

TEST_F(TransferTest, SinkPositionedPastEndIsExtended) {
  const auto data = payload(3000, 0);
  auto source = makeSource(Kind::File, data, 1000);
  auto sink = makeSink(Kind::File);
  sink.file->seek(5000);

  EXPECT_EQ(Transfer(*source.source, sink.sink.get()), 2000U);
  EXPECT_EQ(sink.file->position(), 7000U);
  const auto written = test::ReadFileBytes(sink.path);
  ASSERT_EQ(written.size(), 7000U);
  EXPECT_TRUE(std::all_of(written.begin(), written.begin() + 5000, [](std::byte b) { return b == std::byte{0}; }));
  EXPECT_TRUE(std::equal(written.begin() + 5000, written.end(), data.begin() + 1000));
}

TEST_F(TransferTest, RepeatedTransferMovesOnlyTheRemainder) {
  const auto first = payload(5000, 0);
  auto source = makeSource(Kind::File, first, 0);
  auto sink = makeSink(Kind::Memory);
  EXPECT_EQ(Transfer(*source.source, sink.sink.get()), 5000U);

  // The source file grows behind the endpoint's back.
  const auto second = payload(777, 0);
  File appender(source.tmp->filePath().string(), File::OpenMode::Append);
  ASSERT_EQ(::write(appender.fd(), second.data(), second.size()), static_cast<ssize_t>(second.size()));

  EXPECT_EQ(Transfer(*source.source, sink.sink.get()), 777U);
  Bytes expected = first;
  expected.insert(expected.end(), second.begin(), second.end());
  EXPECT_EQ(content(sink), expected);
}

TEST_F(TransferTest, NonBlockingPipeSourceIsRejected) {
  const auto data = payload(100, 0);
  for (Kind sinkKind : {Kind::Memory, Kind::File}) {
    Pipe pipe;
    FillPipe(pipe, data);
    pipe.readEnd().setNonBlocking(true);
    FdSource source(pipe.readEnd().fd());
    auto sink = makeSink(sinkKind);

    EXPECT_THROW((void)Transfer(source, sink.sink.get()), IllegalBlockingModeError);
    // Nothing was consumed.
    pipe.readEnd().setNonBlocking(false);
    EXPECT_EQ(DrainPipe(pipe), data);
  }
}

TEST_F(TransferTest, NonBlockingPipeSinkIsRejected) {
  const auto data = payload(100, 0);
  Pipe pipe;
  pipe.writeEnd().setNonBlocking(true);
  FdSink sink(pipe.writeEnd().fd());

  MemorySource memory(data);
  EXPECT_THROW((void)Transfer(memory, &sink), IllegalBlockingModeError);
  EXPECT_EQ(memory.position(), 0U);

  auto fileSource = makeSource(Kind::File, data, 0);
  EXPECT_THROW((void)Transfer(*fileSource.source, &sink), IllegalBlockingModeError);
  EXPECT_EQ(fileSource.file->position(), 0U);
}

TEST_F(TransferTest, DisablingDirectTransferUsesBufferedCopy) {
  const auto data = payload(50000, 0);
  auto source = makeSource(Kind::File, data, 0);
  auto sink = makeSink(Kind::File);
  const auto stats = TransferWithStats(*source.source, sink.sink.get(), TransferConfig{}.withDirectTransfer(false));
  EXPECT_EQ(stats.strategy, TransferStrategy::Buffered);
  EXPECT_EQ(stats.bytesTransferred, data.size());
  EXPECT_EQ(content(sink), data);
}

TEST_F(TransferTest, SmallDirectChunkCapIsByteIdentical) {
  const auto data = payload(100000, 0);
  auto source = makeSource(Kind::File, data, 0);
  auto sink = makeSink(Kind::File);
  const auto stats =
      TransferWithStats(*source.source, sink.sink.get(), TransferConfig{}.withMaxDirectChunkSize(4099));
  EXPECT_EQ(stats.bytesTransferred, data.size());
  if (kDirectTransferSupported) {
    EXPECT_EQ(stats.strategy, TransferStrategy::SinkPull);
    EXPECT_GE(stats.nbCalls, (data.size() + 4098) / 4099);
  }
  EXPECT_EQ(content(sink), data);
}

TEST_F(TransferTest, SocketSourceIntoFile) {
  const auto data = payload(30000, 0);
  int fds[2];
  ASSERT_EQ(0, ::socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds));
  BaseFd reader(fds[0]);
  BaseFd writer(fds[1]);
  std::size_t sent = 0;
  while (sent < data.size()) {
    const auto ret = ::send(writer.fd(), data.data() + sent, data.size() - sent, 0);
    ASSERT_GT(ret, 0);
    sent += static_cast<std::size_t>(ret);
  }
  ASSERT_EQ(0, ::shutdown(writer.fd(), SHUT_WR));

  FdSource source(reader.fd());
  auto sink = makeSink(Kind::File);
  const auto stats = TransferWithStats(source, sink.sink.get());
  EXPECT_EQ(stats.bytesTransferred, data.size());
  EXPECT_EQ(stats.strategy, kDirectTransferSupported ? TransferStrategy::SinkPull : TransferStrategy::Buffered);
  EXPECT_EQ(content(sink), data);
}

TEST_F(TransferTest, AppendModeFileSinkIsBufferedAndAppends) {
  const auto existing = payload(10, 0);
  ScopedTempFile target(dir, existing);
  File appendFile(target.filePath().string(), File::OpenMode::Append);
  FdSink sink(appendFile.fd());

  const auto data = payload(3000, 0);
  MemorySource source(data);
  const auto stats = TransferWithStats(source, &sink);
  EXPECT_EQ(stats.strategy, TransferStrategy::Buffered);
  Bytes expected = existing;
  expected.insert(expected.end(), data.begin(), data.end());
  EXPECT_EQ(test::ReadFileBytes(target.filePath()), expected);
}
