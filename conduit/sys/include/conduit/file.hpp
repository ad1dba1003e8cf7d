#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "conduit/base-fd.hpp"
#include "conduit/platform.hpp"

namespace conduit {

// Owner of a regular-file descriptor.
// The descriptor's file offset is the file position seen by FdSource / FdSink built on fd().
class File {
 public:
  enum class OpenMode : uint8_t {
    ReadOnly,   // existing file, read only
    WriteOnly,  // create or truncate, write only
    ReadWrite,  // create if missing, keep content
    Append      // create if missing, every write appends
  };

  // Default-constructed File is closed / empty.
  File() noexcept = default;

  // Open a file by path.
  // On success, the File owns the underlying descriptor and will close it on destruction.
  // On failure, the error is logged and operator bool() returns false.
  explicit File(const std::string& path, OpenMode mode = OpenMode::ReadOnly) : File(path.c_str(), mode) {}

  explicit File(std::string_view path, OpenMode mode = OpenMode::ReadOnly);

  // Path must be null-terminated.
  explicit File(const char* path, OpenMode mode = OpenMode::ReadOnly);

  // Returns true when the File currently holds an opened descriptor.
  explicit operator bool() const noexcept { return static_cast<bool>(_fd); }

  // Current size in bytes. Throws std::runtime_error if the file is not opened or fstat fails.
  [[nodiscard]] std::uint64_t size() const;

  // Current file offset. Throws std::system_error on failure.
  [[nodiscard]] std::uint64_t position() const;

  // Set the file offset. Seeking past the end is allowed; a later write extends the file.
  // Throws std::system_error on failure.
  void seek(std::uint64_t position) const;

  // Read the whole file content, leaving the file offset where it was.
  [[nodiscard]] std::string loadAllContent() const;

  // Returns the raw underlying file descriptor. The File keeps ownership.
  [[nodiscard]] NativeHandle fd() const noexcept { return _fd.fd(); }

  // Close the descriptor now.
  void close() noexcept { _fd.close(); }

 private:
  BaseFd _fd;
};

}  // namespace conduit
