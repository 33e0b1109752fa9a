// include/npp/known.hpp
#pragma once
#include <array>
#include <cstdint>
#include <optional>

#include "mp.hpp"

namespace npp {

struct KnownPrime {
  std::uint64_t index;
  const char *prime; // decimal; p_{10^18} does not fit in 64 bits
};

// Reference values p_{10^k}, k = 0..18.
const std::array<KnownPrime, 19> &known_primes() noexcept;

// Exact p_n when n is a power of ten up to 10^18 or n <= 25 (the trial
// division table); std::nullopt otherwise.
std::optional<BigInt> lookup_known(const BigInt &n);

} // namespace npp
