// src/precision.cpp
#include "npp/precision.hpp"
#include "npp/errors.hpp"

#include <cmath>
#include <string>

namespace npp {
namespace {

struct Band {
  std::size_t below_digits; // applies while the index has fewer digits
  unsigned digits;
};

// n < 1e14 -> 128, n < 1e15 -> 160, ... ; monotone by construction.
constexpr Band kBands[] = {
    {15, 128}, {16, 160}, {17, 192}, {18, 224},
    {19, 256}, {21, 320}, {kMagnitudeCapDigits + 1, kPrecisionMaxDigits},
};

mpfr_prec_t digits_to_bits(unsigned digits) {
  // log2(10) ~ 3.3219; 64 guard bits on top.
  return static_cast<mpfr_prec_t>(std::ceil(digits * 3.321928094887362)) + 64;
}

PrecisionContext make_context(unsigned digits) {
  PrecisionContext ctx;
  ctx.digits = digits;
  ctx.bits = digits_to_bits(digits);
  return ctx;
}

} // namespace

Real PrecisionContext::tolerance() const {
  Real t(bits);
  mpfr_set_ui(t.get(), 10, MPFR_RNDN);
  mpfr_pow_si(t.get(), t.get(), -static_cast<long>(digits - 5), MPFR_RNDN);
  return t;
}

PrecisionContext required_precision(std::size_t magnitude_digits) {
  for (const Band &b : kBands) {
    if (magnitude_digits < b.below_digits)
      return make_context(b.digits);
  }
  throw PrecisionError("magnitude of " + std::to_string(magnitude_digits) +
                       " digits exceeds the supported cap of " +
                       std::to_string(kMagnitudeCapDigits) + " digits");
}

PrecisionContext required_precision(const BigInt &magnitude) {
  return required_precision(magnitude.decimal_digits());
}

PrecisionContext with_override(const PrecisionContext &required,
                               unsigned digits) {
  if (digits < kPrecisionFloorDigits)
    throw PrecisionError("precision override " + std::to_string(digits) +
                         " is below the floor of " +
                         std::to_string(kPrecisionFloorDigits) + " digits");
  if (digits < required.digits)
    throw PrecisionError("precision override " + std::to_string(digits) +
                         " is below the " + std::to_string(required.digits) +
                         " digits this magnitude requires");
  if (digits > kPrecisionMaxDigits)
    throw PrecisionError("precision override " + std::to_string(digits) +
                         " exceeds the maximum of " +
                         std::to_string(kPrecisionMaxDigits) + " digits");
  return make_context(digits);
}

} // namespace npp
