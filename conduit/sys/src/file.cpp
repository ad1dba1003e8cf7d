#include "conduit/file.hpp"

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <unistd.h>

#include <cerrno>
#include <cstdint>
#include <cstring>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>

#include "conduit/errno-throw.hpp"
#include "conduit/file-offset.hpp"
#include "conduit/log.hpp"

namespace conduit {

namespace {

constexpr mode_t kCreatePermissions = 0644;

int Flags(File::OpenMode mode) {
  switch (mode) {
    case File::OpenMode::ReadOnly:
      return O_RDONLY | O_CLOEXEC;
    case File::OpenMode::WriteOnly:
      return O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC;
    case File::OpenMode::ReadWrite:
      return O_RDWR | O_CREAT | O_CLOEXEC;
    case File::OpenMode::Append:
      return O_WRONLY | O_CREAT | O_APPEND | O_CLOEXEC;
    default:
      std::unreachable();
  }
}

int OpenFileFd(const char* path, File::OpenMode mode) {
  int fd = ::open(path, Flags(mode), kCreatePermissions);
  if (fd < 0) {
    log::error("Unable to open file '{}' (errno {}: {})", path, errno, std::strerror(errno));
    fd = -1;
  }
  return fd;
}

}  // namespace

File::File(std::string_view path, OpenMode mode) : _fd(OpenFileFd(std::string(path).c_str(), mode)) {}

File::File(const char* path, OpenMode mode) : _fd(OpenFileFd(path, mode)) {}

std::uint64_t File::size() const {
  struct stat st{};
  if (_fd && ::fstat(_fd.fd(), &st) == 0) {
    return static_cast<std::uint64_t>(st.st_size);
  }
  throw std::runtime_error("File::size failed");
}

std::uint64_t File::position() const {
  const off_t pos = ::lseek(_fd.fd(), 0, SEEK_CUR);
  if (pos == -1) {
    throw_errno("File::position: lseek failed for fd # {}", _fd.fd());
  }
  return FromFileOffset(pos);
}

void File::seek(std::uint64_t position) const {
  if (::lseek(_fd.fd(), ToFileOffset(position), SEEK_SET) == -1) {
    throw_errno("File::seek: lseek to {} failed for fd # {}", position, _fd.fd());
  }
}

std::string File::loadAllContent() const {
  if (!_fd) {
    throw std::runtime_error("File is not opened");
  }

  // Read with pread from the start so the file offset stays untouched.
  std::string content;
  content.reserve(size());

  constexpr std::size_t kBufSize = 8192;
  off_t offset = 0;
  for (;;) {
    const std::size_t oldSize = content.size();

    ssize_t lastRead = 0;
    content.resize_and_overwrite(oldSize + kBufSize,
                                 [this, oldSize, offset, &lastRead](char* data, [[maybe_unused]] std::size_t newCap) {
                                   lastRead = ::pread(_fd.fd(), data + oldSize, kBufSize, offset);
                                   if (lastRead > 0) {
                                     return oldSize + static_cast<std::size_t>(lastRead);
                                   }
                                   return oldSize;
                                 });

    if (lastRead > 0) {
      offset += lastRead;
      continue;
    }
    if (lastRead == 0) {
      break;  // EOF
    }
    if (errno == EINTR) {
      continue;
    }
    log::error("Unable to read file (fd {}): errno {}: {}", _fd.fd(), errno, std::strerror(errno));
    throw std::runtime_error("File::loadAllContent read error");
  }

  return content;
}

}  // namespace conduit
