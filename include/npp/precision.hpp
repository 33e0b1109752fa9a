// include/npp/precision.hpp
#pragma once
#include <cstddef>

#include <mpfr.h>

#include "mp.hpp"

namespace npp {

// Lowest precision any call runs at, in decimal digits.
inline constexpr unsigned kPrecisionFloorDigits = 50;
// Highest precision, also the ceiling for explicit overrides.
inline constexpr unsigned kPrecisionMaxDigits = 1024;
// Indices of 10^kMagnitudeCapDigits or more are rejected.
inline constexpr std::size_t kMagnitudeCapDigits = 1000;

// Working precision for one call. Passed explicitly to every numeric
// routine; MPFR's process-wide default precision is never touched.
struct PrecisionContext {
  unsigned digits = kPrecisionFloorDigits; // decimal digits
  mpfr_prec_t bits = 231;                  // MPFR mantissa bits

  // Series truncation threshold, 10^-(digits-5).
  Real tolerance() const;
  Real make() const { return Real(bits); }
};

// Context for a magnitude expressed as the decimal digit count of the index.
// Throws PrecisionError when `magnitude_digits` reaches the cap.
PrecisionContext required_precision(std::size_t magnitude_digits);
PrecisionContext required_precision(const BigInt &magnitude);

// Applies an explicit digit count on top of the magnitude's requirement.
// Throws PrecisionError if `digits` is below the requirement or the floor,
// or above kPrecisionMaxDigits.
PrecisionContext with_override(const PrecisionContext &required,
                               unsigned digits);

} // namespace npp
