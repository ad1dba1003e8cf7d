#include "conduit/memory-endpoints.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>
#include <string_view>

#include "conduit/io-result.hpp"

namespace conduit {

MemorySource::MemorySource(std::string_view data) : MemorySource(std::as_bytes(std::span<const char>(data))) {}

IoResult MemorySource::read(std::span<std::byte> dst) {
  if (dst.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  const std::size_t avail = remaining();
  if (avail == 0) {
    return {0, IoStatus::EndOfData, 0};
  }
  const std::size_t nbBytes = std::min(avail, dst.size());
  std::memcpy(dst.data(), _data.data() + _pos, nbBytes);
  _pos += nbBytes;
  return {nbBytes, IoStatus::Ok, 0};
}

IoResult MemorySink::write(std::span<const std::byte> src) {
  if (src.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  const std::size_t end = _pos + src.size();
  if (_data.size() < end) {
    _data.resize(end);
  }
  std::memcpy(_data.data() + _pos, src.data(), src.size());
  _pos = end;
  return {src.size(), IoStatus::Ok, 0};
}

}  // namespace conduit
