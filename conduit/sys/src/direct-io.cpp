#include "conduit/direct-io.hpp"

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include "conduit/platform.hpp"

#ifdef CONDUIT_LINUX
#include <fcntl.h>  // splice
#include <sys/sendfile.h>
#include <sys/types.h>
#include <unistd.h>  // copy_file_range
#endif

namespace conduit {

#ifdef CONDUIT_LINUX

static_assert(sizeof(ssize_t) <= sizeof(int64_t), "ssize_t must fit in int64_t");

int64_t Sendfile(NativeHandle outFd, NativeHandle inFd, off_t& offset, std::size_t count) noexcept {
  return static_cast<int64_t>(::sendfile(outFd, inFd, &offset, count));
}

int64_t CopyFileRange(NativeHandle inFd, off_t& inOffset, NativeHandle outFd, off_t& outOffset,
                      std::size_t count) noexcept {
  return static_cast<int64_t>(::copy_file_range(inFd, &inOffset, outFd, &outOffset, count, 0));
}

int64_t Splice(NativeHandle inFd, off_t* inOffset, NativeHandle outFd, off_t* outOffset, std::size_t count) noexcept {
  return static_cast<int64_t>(::splice(inFd, inOffset, outFd, outOffset, count, SPLICE_F_MOVE));
}

#else

int64_t Sendfile([[maybe_unused]] NativeHandle outFd, [[maybe_unused]] NativeHandle inFd,
                 [[maybe_unused]] off_t& offset, [[maybe_unused]] std::size_t count) noexcept {
  errno = ENOSYS;
  return -1;
}

int64_t CopyFileRange([[maybe_unused]] NativeHandle inFd, [[maybe_unused]] off_t& inOffset,
                      [[maybe_unused]] NativeHandle outFd, [[maybe_unused]] off_t& outOffset,
                      [[maybe_unused]] std::size_t count) noexcept {
  errno = ENOSYS;
  return -1;
}

int64_t Splice([[maybe_unused]] NativeHandle inFd, [[maybe_unused]] off_t* inOffset,
               [[maybe_unused]] NativeHandle outFd, [[maybe_unused]] off_t* outOffset,
               [[maybe_unused]] std::size_t count) noexcept {
  errno = ENOSYS;
  return -1;
}

#endif

}  // namespace conduit
