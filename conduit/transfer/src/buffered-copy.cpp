#include "conduit/buffered-copy.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <stdexcept>

#include "conduit/errno-throw.hpp"
#include "conduit/io-result.hpp"
#include "conduit/transfer-errors.hpp"

namespace conduit {

namespace {

void WriteFully(ByteSink& sink, std::span<const std::byte> data, std::uint64_t alreadyTransferred) {
  while (!data.empty()) {
    const auto [nbWritten, status, err] = sink.write(data);
    switch (status) {
      case IoStatus::Ok:
        if (nbWritten == 0 || nbWritten > data.size()) [[unlikely]] {
          throw std::logic_error("sink reported an invalid write count");
        }
        data = data.subspan(nbWritten);
        alreadyTransferred += nbWritten;
        break;
      case IoStatus::Interrupted:
        break;
      case IoStatus::WouldBlock:
        throw IllegalBlockingModeError("buffered copy: sink would block");
      case IoStatus::Error:
        throw_system_error(err, "buffered copy: write failed after {} bytes", alreadyTransferred);
      default:
        throw std::logic_error(fmt::format("buffered copy: unexpected write status '{}'", IoStatusName(status)));
    }
  }
}

}  // namespace

BufferedCopyResult BufferedCopy(ByteSource& source, ByteSink& sink, std::span<std::byte> buffer) {
  if (buffer.empty()) {
    throw std::invalid_argument("buffered copy: empty buffer");
  }

  BufferedCopyResult result{0, 0};
  for (;;) {
    const auto [nbRead, status, err] = source.read(buffer);
    switch (status) {
      case IoStatus::Ok:
        if (nbRead > buffer.size()) [[unlikely]] {
          throw std::logic_error("source reported more bytes than requested");
        }
        if (nbRead == 0) {
          // Nothing for a non-empty buffer: same as end of data, never spin.
          return result;
        }
        ++result.nbReads;
        WriteFully(sink, buffer.first(nbRead), result.bytesTransferred);
        result.bytesTransferred += nbRead;
        break;
      case IoStatus::EndOfData:
        return result;
      case IoStatus::Interrupted:
        break;
      case IoStatus::WouldBlock:
        throw IllegalBlockingModeError("buffered copy: source would block");
      case IoStatus::Error:
        throw_system_error(err, "buffered copy: read failed after {} bytes", result.bytesTransferred);
      default:
        throw std::logic_error(fmt::format("buffered copy: unexpected read status '{}'", IoStatusName(status)));
    }
  }
}

}  // namespace conduit
