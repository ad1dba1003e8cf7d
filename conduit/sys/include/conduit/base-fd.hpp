#pragma once

#include "conduit/platform.hpp"

namespace conduit {

// Simple RAII class owning a file descriptor.
class BaseFd {
 public:
  static constexpr NativeHandle kClosedFd = kInvalidHandle;

  explicit BaseFd(NativeHandle fd = kClosedFd) noexcept : _fd(fd) {}

  BaseFd(const BaseFd& other) = delete;
  BaseFd(BaseFd&& other) noexcept : _fd(other.release()) {}
  BaseFd& operator=(const BaseFd& other) = delete;
  BaseFd& operator=(BaseFd&& other) noexcept;

  ~BaseFd() { close(); }

  [[nodiscard]] NativeHandle fd() const noexcept { return _fd; }

  // Returns true if the underlying fd is valid (not closed).
  explicit operator bool() const noexcept { return _fd != kClosedFd; }

  // Release ownership of the underlying fd without closing it.
  // Returns the raw fd and sets this object to closed state.
  [[nodiscard]] NativeHandle release() noexcept;

  // Close the underlying descriptor immediately. Closing an endpoint out-of-band is the way to make
  // an in-flight blocking transfer on it fail promptly.
  // Idempotent: multiple calls after first successful/failed close are no-ops.
  void close() noexcept;

  // Toggle O_NONBLOCK on the descriptor. Throws std::system_error on failure.
  void setNonBlocking(bool enable) const;

  // Whether O_NONBLOCK is set. Throws std::system_error on failure.
  [[nodiscard]] bool isNonBlocking() const;

  bool operator==(const BaseFd&) const noexcept = default;

 private:
  NativeHandle _fd;
};

}  // namespace conduit
