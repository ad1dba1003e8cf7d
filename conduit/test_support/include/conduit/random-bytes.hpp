#pragma once

#include <cstddef>
#include <random>
#include <vector>

namespace conduit::test {

// Random payload of min + [0, maxAdditive) bytes, drawn from the caller's generator so that failures
// reproduce with the seed.
std::vector<std::byte> RandomBytes(std::mt19937_64& rng, std::size_t min, std::size_t maxAdditive);

}  // namespace conduit::test
