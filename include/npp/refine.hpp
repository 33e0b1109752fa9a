// include/npp/refine.hpp
#pragma once
#include <cstdint>

#include "mp.hpp"

namespace npp {

struct RefineSettings {
  std::uint32_t min_window = 256;          // lower bound of the search radius
  std::uint64_t fallback_limit = 1u << 20; // forward-scan steps after it
};

// One probe of the expanding search: c + direction*step, made odd and
// snapped to 6k±1 in the same direction.
struct RefinementCandidate {
  BigInt value;
  std::int64_t offset; // value - c
  int direction;       // +1 forward, -1 backward
};

struct RefineResult {
  BigInt prime;
  std::uint64_t candidates_tested = 0;
  std::int64_t offset = 0; // prime minus the snapped starting candidate
  bool used_fallback = false;
};

// Moves n to the nearest value ≡ ±1 (mod 6) in `direction`; no-op if n
// already has that form.
void snap_to_6k_pm1(BigInt &n, int direction);

RefinementCandidate make_candidate(const BigInt &center, std::uint64_t step,
                                   int direction);

// Turns a continuous estimate into a probable prime: round half-up, snap,
// sieve + Miller–Rabin, then a symmetric search of radius
// max(min_window, ceil(4 ln c)), then a forward scan capped at
// fallback_limit steps. Throws RefinementExhaustion when all of that fails
// and InputError for a non-finite x.
RefineResult refine_to_prime(const Real &x, const RefineSettings &s = {});
RefineResult refine_to_prime(const BigInt &start, const RefineSettings &s = {});

} // namespace npp
