#include "conduit/base-fd.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <utility>

#include "conduit/errno-throw.hpp"
#include "conduit/log.hpp"

namespace conduit {

BaseFd& BaseFd::operator=(BaseFd&& other) noexcept {
  if (this != &other) {
    close();
    _fd = other.release();
  }
  return *this;
}

void BaseFd::close() noexcept {
  if (_fd != kClosedFd) {
    while (true) {
      if (CloseNativeHandle(_fd) == 0) {
        break;
      }
      if (errno == EINTR) {
        continue;
      }
      // EBADF is benign if the descriptor was closed behind our back.
      log::error("close fd # {} failed: {}", _fd, std::strerror(errno));
      break;
    }
    log::debug("fd # {} closed", _fd);
    _fd = kClosedFd;
  }
}

NativeHandle BaseFd::release() noexcept { return std::exchange(_fd, kClosedFd); }

void BaseFd::setNonBlocking(bool enable) const {
  const int flags = ::fcntl(_fd, F_GETFL);
  if (flags == -1) {
    throw_errno("fcntl(F_GETFL) failed for fd # {}", _fd);
  }
  const int newFlags = enable ? (flags | O_NONBLOCK) : (flags & ~O_NONBLOCK);
  if (newFlags != flags && ::fcntl(_fd, F_SETFL, newFlags) == -1) {
    throw_errno("fcntl(F_SETFL) failed for fd # {}", _fd);
  }
}

bool BaseFd::isNonBlocking() const {
  const int flags = ::fcntl(_fd, F_GETFL);
  if (flags == -1) {
    throw_errno("fcntl(F_GETFL) failed for fd # {}", _fd);
  }
  return (flags & O_NONBLOCK) != 0;
}

}  // namespace conduit
