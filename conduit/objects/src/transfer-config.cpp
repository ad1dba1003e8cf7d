#include "conduit/transfer-config.hpp"

#include <cstddef>
#include <stdexcept>

namespace conduit {

TransferConfig& TransferConfig::withBufferSize(std::size_t bufferSize) {
  this->bufferSize = bufferSize;
  return *this;
}

TransferConfig& TransferConfig::withMaxDirectChunkSize(std::size_t maxDirectChunkSize) {
  this->maxDirectChunkSize = maxDirectChunkSize;
  return *this;
}

TransferConfig& TransferConfig::withDirectTransfer(bool on) {
  this->enableDirectTransfer = on;
  return *this;
}

void TransferConfig::validate() const {
  if (bufferSize == 0) {
    throw std::invalid_argument("TransferConfig.bufferSize must be > 0");
  }
  if (bufferSize > kMaxBufferSize) {
    throw std::invalid_argument("TransferConfig.bufferSize must be <= 64 MiB");
  }
  if (maxDirectChunkSize == 0) {
    throw std::invalid_argument("TransferConfig.maxDirectChunkSize must be > 0");
  }
  if (maxDirectChunkSize > kDefaultMaxDirectChunk) {
    throw std::invalid_argument("TransferConfig.maxDirectChunkSize exceeds the per-call kernel limit");
  }
}

}  // namespace conduit
