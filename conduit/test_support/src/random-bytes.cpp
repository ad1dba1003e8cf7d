#include "conduit/random-bytes.hpp"

#include <cstddef>
#include <cstdint>
#include <random>
#include <vector>

namespace conduit::test {

std::vector<std::byte> RandomBytes(std::mt19937_64& rng, std::size_t min, std::size_t maxAdditive) {
  std::size_t size = min;
  if (maxAdditive > 0) {
    size += std::uniform_int_distribution<std::size_t>(0, maxAdditive - 1)(rng);
  }

  std::vector<std::byte> bytes(size);
  std::uniform_int_distribution<unsigned> byteDist(0, UINT8_MAX);
  for (auto& byte : bytes) {
    byte = static_cast<std::byte>(byteDist(rng));
  }
  return bytes;
}

}  // namespace conduit::test
