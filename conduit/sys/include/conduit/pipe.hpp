#pragma once

#include <cstddef>

#include "conduit/base-fd.hpp"

namespace conduit {

// Anonymous pipe owning both of its ends (O_CLOEXEC).
class Pipe {
 public:
  // Throws std::system_error if the pipe cannot be created.
  Pipe();

  [[nodiscard]] BaseFd& readEnd() noexcept { return _readEnd; }
  [[nodiscard]] BaseFd& writeEnd() noexcept { return _writeEnd; }

  [[nodiscard]] const BaseFd& readEnd() const noexcept { return _readEnd; }
  [[nodiscard]] const BaseFd& writeEnd() const noexcept { return _writeEnd; }

  // Kernel buffer size of the pipe in bytes.
  [[nodiscard]] std::size_t capacity() const;

 private:
  BaseFd _readEnd;
  BaseFd _writeEnd;
};

}  // namespace conduit
