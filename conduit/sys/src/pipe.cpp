#include "conduit/pipe.hpp"

#include <fcntl.h>
#include <unistd.h>

#include <cstddef>

#include "conduit/errno-throw.hpp"
#include "conduit/platform.hpp"

namespace conduit {

Pipe::Pipe() {
  int fds[2];
#ifdef CONDUIT_LINUX
  if (::pipe2(fds, O_CLOEXEC) == -1) {
    throw_errno("pipe2 failed");
  }
  _readEnd = BaseFd(fds[0]);
  _writeEnd = BaseFd(fds[1]);
#else
  if (::pipe(fds) == -1) {
    throw_errno("pipe failed");
  }
  _readEnd = BaseFd(fds[0]);
  _writeEnd = BaseFd(fds[1]);
  if (::fcntl(fds[0], F_SETFD, FD_CLOEXEC) == -1 || ::fcntl(fds[1], F_SETFD, FD_CLOEXEC) == -1) {
    throw_errno("fcntl(F_SETFD) failed for pipe");
  }
#endif
}

std::size_t Pipe::capacity() const {
#ifdef CONDUIT_LINUX
  const int size = ::fcntl(_writeEnd.fd(), F_GETPIPE_SZ);
  if (size == -1) {
    throw_errno("fcntl(F_GETPIPE_SZ) failed for fd # {}", _writeEnd.fd());
  }
  return static_cast<std::size_t>(size);
#else
  // Darwin pipes grow up to 64 KiB.
  return 65536;
#endif
}

}  // namespace conduit
