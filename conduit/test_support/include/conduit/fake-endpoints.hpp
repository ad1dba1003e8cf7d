#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>
#include <limits>
#include <span>
#include <vector>

#include "conduit/byte-sink.hpp"
#include "conduit/byte-source.hpp"
#include "conduit/endpoint-capabilities.hpp"
#include "conduit/io-result.hpp"

namespace conduit::test {

// Source serving an in-memory payload, with a script of outcomes consumed by the next reads.
// A scripted Ok step serves at most step.bytes of the payload; any other step is returned as is.
// Once the script is empty, reads serve the payload normally.
class ScriptedSource : public ByteSource {
 public:
  explicit ScriptedSource(std::span<const std::byte> data, EndpointCapabilities caps = {})
      : _data(data.begin(), data.end()), _caps(caps) {}

  IoResult read(std::span<std::byte> dst) override;

  [[nodiscard]] EndpointCapabilities capabilities() const override {
    ++_nbCapabilityQueries;
    return _caps;
  }

  void pushStep(IoResult step) { _steps.push_back(step); }

  [[nodiscard]] std::size_t position() const noexcept { return _pos; }
  [[nodiscard]] std::uint64_t nbReads() const noexcept { return _nbReads; }
  [[nodiscard]] std::uint64_t nbCapabilityQueries() const noexcept { return _nbCapabilityQueries; }

 private:
  IoResult serve(std::span<std::byte> dst, std::size_t maxBytes);

  std::vector<std::byte> _data;
  std::deque<IoResult> _steps;
  EndpointCapabilities _caps;
  std::size_t _pos{0};
  std::uint64_t _nbReads{0};
  mutable std::uint64_t _nbCapabilityQueries{0};
};

// Sink recording written bytes.
// Accepts at most maxPerWrite bytes per call, fails with failErr once failAfter bytes were accepted,
// and returns scripted steps first (a scripted Ok step accepts at most step.bytes).
class ScriptedSink : public ByteSink {
 public:
  explicit ScriptedSink(std::size_t maxPerWrite = std::numeric_limits<std::size_t>::max(),
                        EndpointCapabilities caps = {})
      : _maxPerWrite(maxPerWrite), _caps(caps) {}

  IoResult write(std::span<const std::byte> src) override;

  [[nodiscard]] EndpointCapabilities capabilities() const override {
    ++_nbCapabilityQueries;
    return _caps;
  }

  void pushStep(IoResult step) { _steps.push_back(step); }

  void failAfter(std::size_t nbBytes, int err) {
    _failAfter = nbBytes;
    _failErr = err;
  }

  [[nodiscard]] const std::vector<std::byte>& data() const noexcept { return _data; }
  [[nodiscard]] std::uint64_t nbWrites() const noexcept { return _nbWrites; }
  [[nodiscard]] std::uint64_t nbCapabilityQueries() const noexcept { return _nbCapabilityQueries; }

 private:
  IoResult accept(std::span<const std::byte> src, std::size_t maxBytes);

  std::vector<std::byte> _data;
  std::deque<IoResult> _steps;
  std::size_t _maxPerWrite;
  std::size_t _failAfter{std::numeric_limits<std::size_t>::max()};
  int _failErr{0};
  EndpointCapabilities _caps;
  std::uint64_t _nbWrites{0};
  mutable std::uint64_t _nbCapabilityQueries{0};
};

}  // namespace conduit::test
