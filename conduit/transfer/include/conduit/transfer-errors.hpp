#pragma once

#include <stdexcept>
#include <string>

namespace conduit {

// Thrown when a blocking transfer meets an endpoint configured in non-blocking mode.
// Never silently downgraded to another path: callers rely on non-blocking endpoints not being driven
// as blocking ones.
class IllegalBlockingModeError : public std::runtime_error {
 public:
  explicit IllegalBlockingModeError(const std::string& what) : std::runtime_error(what) {}
  explicit IllegalBlockingModeError(const char* what) : std::runtime_error(what) {}
};

}  // namespace conduit
