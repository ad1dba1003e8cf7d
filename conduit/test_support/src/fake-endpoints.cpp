#include "conduit/fake-endpoints.hpp"

#include <algorithm>
#include <cstddef>
#include <cstring>
#include <span>

#include "conduit/io-result.hpp"

namespace conduit::test {

IoResult ScriptedSource::serve(std::span<std::byte> dst, std::size_t maxBytes) {
  if (dst.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  if (_pos >= _data.size()) {
    return {0, IoStatus::EndOfData, 0};
  }
  const std::size_t nbBytes = std::min({dst.size(), maxBytes, _data.size() - _pos});
  std::memcpy(dst.data(), _data.data() + _pos, nbBytes);
  _pos += nbBytes;
  return {nbBytes, IoStatus::Ok, 0};
}

IoResult ScriptedSource::read(std::span<std::byte> dst) {
  ++_nbReads;
  if (_steps.empty()) {
    return serve(dst, dst.size());
  }
  const IoResult step = _steps.front();
  _steps.pop_front();
  if (step.status == IoStatus::Ok) {
    return serve(dst, step.bytes);
  }
  return step;
}

IoResult ScriptedSink::accept(std::span<const std::byte> src, std::size_t maxBytes) {
  if (src.empty()) {
    return {0, IoStatus::Ok, 0};
  }
  if (_data.size() >= _failAfter) {
    return {0, IoStatus::Error, _failErr};
  }
  const std::size_t nbBytes = std::min({src.size(), maxBytes, _maxPerWrite, _failAfter - _data.size()});
  _data.insert(_data.end(), src.begin(), src.begin() + static_cast<std::ptrdiff_t>(nbBytes));
  return {nbBytes, IoStatus::Ok, 0};
}

IoResult ScriptedSink::write(std::span<const std::byte> src) {
  ++_nbWrites;
  if (_steps.empty()) {
    return accept(src, src.size());
  }
  const IoResult step = _steps.front();
  _steps.pop_front();
  if (step.status == IoStatus::Ok) {
    return accept(src, step.bytes);
  }
  return step;
}

}  // namespace conduit::test
