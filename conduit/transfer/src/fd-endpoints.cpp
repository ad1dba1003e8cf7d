#include "conduit/fd-endpoints.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <cerrno>
#include <cstddef>
#include <span>

#include "conduit/endpoint-capabilities.hpp"
#include "conduit/io-result.hpp"
#include "conduit/log.hpp"
#include "conduit/platform.hpp"

namespace conduit {

namespace {

static_assert(EAGAIN == EWOULDBLOCK, "conduit assumes EAGAIN and EWOULDBLOCK are the same value");

IoResult FromSyscall(ssize_t ret, IoStatus onZero) noexcept {
  if (ret > 0) {
    return {static_cast<std::size_t>(ret), IoStatus::Ok, 0};
  }
  if (ret == 0) {
    return {0, onZero, 0};
  }
  const int err = errno;
  switch (err) {
    case error::kWouldBlock:
      return {0, IoStatus::WouldBlock, 0};
    case error::kInterrupted:
      return {0, IoStatus::Interrupted, 0};
    default:
      return {0, IoStatus::Error, err};
  }
}

int StatusFlags(NativeHandle fd) noexcept { return ::fcntl(fd, F_GETFL); }

}  // namespace

EndpointCapabilities DescribeDescriptor(NativeHandle fd) {
  struct stat st{};
  if (::fstat(fd, &st) == -1) {
    log::debug("fstat failed for fd # {} (errno {}), described as stream", fd, errno);
    return {};
  }

  EndpointCapabilities caps{EndpointKind::Stream, fd, false};
  if (S_ISREG(st.st_mode)) {
    caps.kind = EndpointKind::File;
  } else if (S_ISFIFO(st.st_mode)) {
    caps.kind = EndpointKind::Pipe;
  } else if (S_ISSOCK(st.st_mode)) {
    caps.kind = EndpointKind::Descriptor;
  } else {
    return {};
  }

  if (caps.kind != EndpointKind::File) {
    const int flags = StatusFlags(fd);
    caps.nonBlocking = flags != -1 && (flags & O_NONBLOCK) != 0;
  }
  return caps;
}

IoResult FdSource::read(std::span<std::byte> dst) {
  if (dst.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  return FromSyscall(::read(_fd, dst.data(), dst.size()), IoStatus::EndOfData);
}

IoResult FdSink::write(std::span<const std::byte> src) {
  if (src.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  const ssize_t ret = ::write(_fd, src.data(), src.size());
  if (ret == 0) {
    // write(2) never returns 0 for a non-empty request on the descriptors we drive.
    return {0, IoStatus::Error, EIO};
  }
  return FromSyscall(ret, IoStatus::Error);
}

EndpointCapabilities FdSink::capabilities() const {
  EndpointCapabilities caps = DescribeDescriptor(_fd);
  if (caps.kind == EndpointKind::File) {
    const int flags = StatusFlags(_fd);
    if (flags == -1 || (flags & O_APPEND) != 0) {
      return {};
    }
  }
  return caps;
}

}  // namespace conduit
