// include/npp/special.hpp
#pragma once
#include "mp.hpp"
#include "precision.hpp"

namespace npp {

// Default number of terms in the Riemann R series.
inline constexpr unsigned kDefaultSeriesTerms = 10;

// Möbius function: 0 if k has a squared prime factor, otherwise
// (-1)^(number of distinct prime factors); mobius(1) == 1.
// Throws InputError for k < 1.
int mobius(long k);

// Logarithmic integral via li(x) = ln ln x + gamma + sum (ln x)^j / (j * j!),
// summed until a term drops below ctx.tolerance(). Requires x > 1.
Real li(const Real &x, const PrecisionContext &ctx);

// R(x) = sum_{k=1..K} mu(k)/k * li(x^{1/k}). Requires x > 1 and K >= 1.
Real riemann_r(const Real &x, unsigned K, const PrecisionContext &ctx);

// R'(x) = (1/ln x) * sum_{k=1..K} mu(k)/k * x^{1/k - 1}.
Real riemann_r_prime(const Real &x, unsigned K, const PrecisionContext &ctx);

} // namespace npp
