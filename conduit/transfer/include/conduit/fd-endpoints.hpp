#pragma once

#include <cstddef>
#include <span>

#include "conduit/byte-sink.hpp"
#include "conduit/byte-source.hpp"
#include "conduit/endpoint-capabilities.hpp"
#include "conduit/io-result.hpp"
#include "conduit/platform.hpp"

namespace conduit {

// Kind of the object behind fd: File for regular files, Pipe for FIFOs, Descriptor for sockets.
// Anything else (character or block devices), or a descriptor fstat rejects, is a Stream: it is only
// driven through read / write.
// nonBlocking is only reported for Pipe and Descriptor kinds.
[[nodiscard]] EndpointCapabilities DescribeDescriptor(NativeHandle fd);

// Non-owning source reading from a POSIX descriptor at its current file offset.
class FdSource : public ByteSource {
 public:
  explicit FdSource(NativeHandle fd) noexcept : _fd(fd) {}

  IoResult read(std::span<std::byte> dst) override;

  [[nodiscard]] EndpointCapabilities capabilities() const override { return DescribeDescriptor(_fd); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

 private:
  NativeHandle _fd;
};

// Non-owning sink writing to a POSIX descriptor at its current file offset.
// A regular file opened with O_APPEND is described as a Stream, as offset-addressed primitives do not apply.
class FdSink : public ByteSink {
 public:
  explicit FdSink(NativeHandle fd) noexcept : _fd(fd) {}

  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] EndpointCapabilities capabilities() const override;

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

 private:
  NativeHandle _fd;
};

}  // namespace conduit
