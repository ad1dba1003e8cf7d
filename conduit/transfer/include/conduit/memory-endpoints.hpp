#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

#include "conduit/byte-sink.hpp"
#include "conduit/byte-source.hpp"
#include "conduit/io-result.hpp"

namespace conduit {

// Source reading from an owned in-memory byte buffer.
class MemorySource : public ByteSource {
 public:
  MemorySource() noexcept = default;

  explicit MemorySource(std::span<const std::byte> data) : _data(data.begin(), data.end()) {}

  explicit MemorySource(std::string_view data);

  IoResult read(std::span<std::byte> dst) override;

  [[nodiscard]] std::size_t size() const noexcept { return _data.size(); }

  [[nodiscard]] std::size_t position() const noexcept { return _pos; }

  // Bytes left to read; 0 when positioned at or past the end.
  [[nodiscard]] std::size_t remaining() const noexcept { return _pos < _data.size() ? _data.size() - _pos : 0; }

  // Positioning past the end is allowed, reads then report end of data.
  void seek(std::size_t position) noexcept { _pos = position; }

 private:
  std::vector<std::byte> _data;
  std::size_t _pos{0};
};

// Sink writing into an owned, growing in-memory byte buffer.
// Writes overwrite existing bytes at the current position and extend the buffer past its end.
class MemorySink : public ByteSink {
 public:
  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] std::span<const std::byte> data() const noexcept { return _data; }

  [[nodiscard]] std::size_t size() const noexcept { return _data.size(); }

  [[nodiscard]] std::size_t position() const noexcept { return _pos; }

  // Positioning past the end is allowed, the gap is zero-filled by the next write.
  void seek(std::size_t position) noexcept { _pos = position; }

  void clear() noexcept {
    _data.clear();
    _pos = 0;
  }

 private:
  std::vector<std::byte> _data;
  std::size_t _pos{0};
};

}  // namespace conduit
