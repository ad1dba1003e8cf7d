#pragma once

#include <fmt/format.h>

#include <cerrno>
#include <string_view>
#include <system_error>

namespace conduit {

// Throw std::system_error for the given errno value with a formatted message.
// Usage: throw_system_error(result.err, "write failed on fd # {}", fd);
template <typename... Args>
[[noreturn]] void throw_system_error(int err, std::string_view fmt, const Args&... args) {
  std::error_code ec(err, std::generic_category());
  throw std::system_error(ec, fmt::format(fmt::runtime(fmt), args...));
}

// Capture errno immediately and throw std::system_error with a formatted message.
// Usage: throw_errno("lseek failed for fd # {}", fd);
template <typename... Args>
[[noreturn]] void throw_errno(std::string_view fmt, const Args&... args) {
  const int savedErr = errno;
  throw_system_error(savedErr, fmt, args...);
}

}  // namespace conduit
