// src/newton.cpp
#include "npp/errors.hpp"
#include "npp/estimator.hpp"
#include "npp/log.hpp"

#include <string>

namespace npp {

Real dusart_initializer(const BigInt &n, const PrecisionContext &ctx) {
  if (mpz_cmp_ui(n.get(), 2) < 0)
    throw InputError("Dusart initializer requires n >= 2, got n = " +
                     n.to_string());

  Real k(ctx.bits), L(ctx.bits), L2(ctx.bits), sum(ctx.bits), t(ctx.bits),
      num(ctx.bits);
  mpfr_set_z(k.get(), n.get(), MPFR_RNDN);
  mpfr_log(L.get(), k.get(), MPFR_RNDN);
  mpfr_log(L2.get(), L.get(), MPFR_RNDN);

  // L + L2 - 1
  mpfr_add(sum.get(), L.get(), L2.get(), MPFR_RNDN);
  mpfr_sub_ui(sum.get(), sum.get(), 1, MPFR_RNDN);

  // + (L2 - 2) / L
  mpfr_sub_ui(t.get(), L2.get(), 2, MPFR_RNDN);
  mpfr_div(t.get(), t.get(), L.get(), MPFR_RNDN);
  mpfr_add(sum.get(), sum.get(), t.get(), MPFR_RNDN);

  // - (L2^2 - 6 L2 + 11) / (2 L^2)
  mpfr_sqr(num.get(), L2.get(), MPFR_RNDN);
  mpfr_mul_ui(t.get(), L2.get(), 6, MPFR_RNDN);
  mpfr_sub(num.get(), num.get(), t.get(), MPFR_RNDN);
  mpfr_add_ui(num.get(), num.get(), 11, MPFR_RNDN);
  mpfr_sqr(t.get(), L.get(), MPFR_RNDN);
  mpfr_mul_ui(t.get(), t.get(), 2, MPFR_RNDN);
  mpfr_div(num.get(), num.get(), t.get(), MPFR_RNDN);
  mpfr_sub(sum.get(), sum.get(), num.get(), MPFR_RNDN);

  Real x0(ctx.bits);
  mpfr_mul(x0.get(), k.get(), sum.get(), MPFR_RNDN);
  return x0;
}

Real RiemannObjective::value(const Real &x, const PrecisionContext &ctx) const {
  if (mpfr_cmp_ui(x.get(), 1) <= 0)
    throw NumericDegeneracy("newton iterate left the domain of R (x <= 1)");
  return riemann_r(x, K_, ctx);
}

Real RiemannObjective::derivative(const Real &x,
                                  const PrecisionContext &ctx) const {
  if (mpfr_cmp_ui(x.get(), 1) <= 0)
    throw NumericDegeneracy("newton iterate left the domain of R (x <= 1)");
  return riemann_r_prime(x, K_, ctx);
}

NewtonOutcome newton_solve(const RootObjective &f, const Real &target,
                           const Real &seed, const NewtonSettings &s,
                           const PrecisionContext &ctx) {
  if (s.max_iterations < 1)
    throw InputError("max_iterations must be >= 1");
  if (!(s.tolerance > 0))
    throw InputError("tolerance must be > 0");

  Real x(ctx.bits), next(ctx.bits), delta(ctx.bits), bound(ctx.bits),
      tol(ctx.bits);
  mpfr_set(x.get(), seed.get(), MPFR_RNDN);
  mpfr_set_d(tol.get(), s.tolerance, MPFR_RNDN);

  for (unsigned i = 1; i <= s.max_iterations; ++i) {
    Real fx = f.value(x, ctx);
    Real dfx = f.derivative(x, ctx);
    if (mpfr_zero_p(dfx.get()))
      throw DerivativeZero("derivative vanished at iteration " +
                           std::to_string(i) + ", x = " + x.to_string(6));

    // delta = (f(x) - target) / f'(x)
    mpfr_sub(delta.get(), fx.get(), target.get(), MPFR_RNDN);
    mpfr_div(delta.get(), delta.get(), dfx.get(), MPFR_RNDN);
    mpfr_sub(next.get(), x.get(), delta.get(), MPFR_RNDN);
    if (!mpfr_number_p(next.get()))
      throw NumericDegeneracy("newton iterate is not finite at iteration " +
                              std::to_string(i));

    // |x_{i+1} - x_i| < tol * |x_{i+1}|
    mpfr_abs(bound.get(), next.get(), MPFR_RNDN);
    mpfr_mul(bound.get(), bound.get(), tol.get(), MPFR_RNDN);
    const bool done = mpfr_cmpabs(delta.get(), bound.get()) < 0;

    mpfr_swap(x.get(), next.get());
    logger()->debug("newton: iter={} x={:.12e} step={:.3e}", i, x.to_double(),
                    mpfr_get_d(delta.get(), MPFR_RNDN));
    if (done)
      return NewtonOutcome{std::move(x), i, true};
  }
  return NewtonOutcome{std::move(x), s.max_iterations, false};
}

} // namespace npp
