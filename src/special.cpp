// src/special.cpp
#include "npp/special.hpp"
#include "npp/errors.hpp"

#include <string>

namespace npp {
namespace {

// mu(0..15); index 0 unused.
constexpr int kMobiusTable[] = {0,  1, -1, -1, 0, -1, 1, -1,
                                0,  0, 1,  -1, 0, -1, 1, 1};

void require_domain(const Real &x, unsigned K, const char *fn) {
  if (mpfr_nan_p(x.get()) || mpfr_cmp_ui(x.get(), 1) <= 0)
    throw InputError(std::string(fn) + " requires x > 1");
  if (K < 1)
    throw InputError(std::string(fn) + " requires K >= 1");
}

} // namespace

int mobius(long k) {
  if (k < 1)
    throw InputError("mobius requires k >= 1, got " + std::to_string(k));
  if (k <= 15)
    return kMobiusTable[k];

  int factors = 0;
  long rest = k;
  for (long p = 2; p * p <= rest; ++p) {
    if (rest % p != 0)
      continue;
    rest /= p;
    if (rest % p == 0)
      return 0; // p^2 | k
    ++factors;
  }
  if (rest > 1)
    ++factors;
  return (factors & 1) ? -1 : 1;
}

Real li(const Real &x, const PrecisionContext &ctx) {
  require_domain(x, 1, "li");

  Real ln_x(ctx.bits), sum(ctx.bits), power(ctx.bits), factorial(ctx.bits),
      term(ctx.bits), gamma(ctx.bits);
  const Real tol = ctx.tolerance();

  mpfr_log(ln_x.get(), x.get(), MPFR_RNDN);
  mpfr_log(sum.get(), ln_x.get(), MPFR_RNDN);
  mpfr_const_euler(gamma.get(), MPFR_RNDN);
  mpfr_add(sum.get(), sum.get(), gamma.get(), MPFR_RNDN);

  mpfr_set_ui(power.get(), 1, MPFR_RNDN);
  mpfr_set_ui(factorial.get(), 1, MPFR_RNDN);

  // Terms grow until j ~ ln x and then fall off factorially.
  for (unsigned long j = 1;; ++j) {
    mpfr_mul(power.get(), power.get(), ln_x.get(), MPFR_RNDN);
    mpfr_mul_ui(factorial.get(), factorial.get(), j, MPFR_RNDN);

    mpfr_div_ui(term.get(), power.get(), j, MPFR_RNDN);
    mpfr_div(term.get(), term.get(), factorial.get(), MPFR_RNDN);
    mpfr_add(sum.get(), sum.get(), term.get(), MPFR_RNDN);

    if (mpfr_cmpabs(term.get(), tol.get()) < 0)
      break;
  }
  return sum;
}

Real riemann_r(const Real &x, unsigned K, const PrecisionContext &ctx) {
  require_domain(x, K, "riemann_r");

  Real sum(ctx.bits), root(ctx.bits), term(ctx.bits);
  mpfr_set_ui(sum.get(), 0, MPFR_RNDN);

  for (unsigned k = 1; k <= K; ++k) {
    const int mu = mobius(k);
    if (mu == 0)
      continue;
    mpfr_rootn_ui(root.get(), x.get(), k, MPFR_RNDN); // x^(1/k)
    Real li_k = li(root, ctx);
    mpfr_div_ui(term.get(), li_k.get(), k, MPFR_RNDN);
    if (mu < 0)
      mpfr_sub(sum.get(), sum.get(), term.get(), MPFR_RNDN);
    else
      mpfr_add(sum.get(), sum.get(), term.get(), MPFR_RNDN);
  }
  return sum;
}

Real riemann_r_prime(const Real &x, unsigned K, const PrecisionContext &ctx) {
  require_domain(x, K, "riemann_r_prime");

  Real sum(ctx.bits), root(ctx.bits), term(ctx.bits), ln_x(ctx.bits);
  mpfr_set_ui(sum.get(), 0, MPFR_RNDN);

  for (unsigned k = 1; k <= K; ++k) {
    const int mu = mobius(k);
    if (mu == 0)
      continue;
    // x^(1/k - 1) = x^(1/k) / x
    mpfr_rootn_ui(root.get(), x.get(), k, MPFR_RNDN);
    mpfr_div(term.get(), root.get(), x.get(), MPFR_RNDN);
    mpfr_div_ui(term.get(), term.get(), k, MPFR_RNDN);
    if (mu < 0)
      mpfr_sub(sum.get(), sum.get(), term.get(), MPFR_RNDN);
    else
      mpfr_add(sum.get(), sum.get(), term.get(), MPFR_RNDN);
  }

  mpfr_log(ln_x.get(), x.get(), MPFR_RNDN);
  mpfr_div(sum.get(), sum.get(), ln_x.get(), MPFR_RNDN);
  return sum;
}

} // namespace npp
