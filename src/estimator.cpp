// src/estimator.cpp
#include "npp/estimator.hpp"
#include "npp/errors.hpp"
#include "npp/log.hpp"

#include <cstring>
#include <string>

namespace npp {

const char *to_string(Method m) noexcept {
  switch (m) {
  case Method::lookup:
    return "lookup";
  case Method::closed_form:
    return "closed_form";
  case Method::newton:
    return "newton";
  }
  return "?";
}

Method method_from_string(const char *name) {
  if (std::strcmp(name, "lookup") == 0)
    return Method::lookup;
  if (std::strcmp(name, "closed_form") == 0)
    return Method::closed_form;
  if (std::strcmp(name, "newton") == 0)
    return Method::newton;
  throw InputError(std::string("unknown method '") + name + "'");
}

std::unique_ptr<Estimator> make_estimator(Method m, const Calibration &cal,
                                          const NewtonSettings &newton) {
  switch (m) {
  case Method::closed_form:
    return std::make_unique<ClosedFormEstimator>(cal);
  case Method::newton:
    return std::make_unique<NewtonEstimator>(newton);
  case Method::lookup:
    break;
  }
  throw InputError("'lookup' is not an estimator");
}

Estimate ClosedFormEstimator::estimate(const BigInt &n,
                                       const PrecisionContext &ctx) const {
  Real res(ctx.bits);
  if (mpz_cmp_ui(n.get(), 2) < 0) {
    mpfr_set_ui(res.get(), 2, MPFR_RNDN);
    return Estimate{std::move(res), Method::closed_form, 1, true};
  }

  Real k(ctx.bits), ln_k(ctx.bits), ln_ln_k(ctx.bits), pnt(ctx.bits),
      ln_pnt(ctx.bits), d_term(ctx.bits), e_term(ctx.bits), tmp(ctx.bits),
      corr(ctx.bits);

  mpfr_set_z(k.get(), n.get(), MPFR_RNDN);
  mpfr_log(ln_k.get(), k.get(), MPFR_RNDN);
  mpfr_log(ln_ln_k.get(), ln_k.get(), MPFR_RNDN);

  // pnt = k * (ln k + ln ln k - 1 + (ln ln k - 2) / ln k)
  mpfr_add(tmp.get(), ln_k.get(), ln_ln_k.get(), MPFR_RNDN);
  mpfr_sub_ui(tmp.get(), tmp.get(), 1, MPFR_RNDN);
  mpfr_sub_ui(corr.get(), ln_ln_k.get(), 2, MPFR_RNDN);
  mpfr_div(corr.get(), corr.get(), ln_k.get(), MPFR_RNDN);
  mpfr_add(tmp.get(), tmp.get(), corr.get(), MPFR_RNDN);
  mpfr_mul(pnt.get(), k.get(), tmp.get(), MPFR_RNDN);
  if (mpfr_sgn(pnt.get()) <= 0) // tiny k: the expansion goes negative
    mpfr_set(pnt.get(), k.get(), MPFR_RNDN);

  // d_term = (ln pnt / e^4)^2 * pnt * c
  mpfr_set_ui(d_term.get(), 0, MPFR_RNDN);
  mpfr_log(ln_pnt.get(), pnt.get(), MPFR_RNDN);
  if (mpfr_sgn(ln_pnt.get()) > 0) {
    mpfr_set_ui(tmp.get(), 4, MPFR_RNDN);
    mpfr_exp(tmp.get(), tmp.get(), MPFR_RNDN);
    mpfr_div(tmp.get(), ln_pnt.get(), tmp.get(), MPFR_RNDN);
    mpfr_sqr(d_term.get(), tmp.get(), MPFR_RNDN);
    mpfr_mul(d_term.get(), d_term.get(), pnt.get(), MPFR_RNDN);
    mpfr_mul_d(d_term.get(), d_term.get(), cal_.c, MPFR_RNDN);
  }

  // e_term = pnt^(-1/3) * pnt * kappa_star  (= pnt^(2/3) * kappa_star)
  mpfr_cbrt(tmp.get(), pnt.get(), MPFR_RNDN);
  mpfr_div(e_term.get(), pnt.get(), tmp.get(), MPFR_RNDN);
  mpfr_mul_d(e_term.get(), e_term.get(), cal_.kappa_star, MPFR_RNDN);

  mpfr_add(res.get(), pnt.get(), d_term.get(), MPFR_RNDN);
  mpfr_add(res.get(), res.get(), e_term.get(), MPFR_RNDN);
  if (mpfr_sgn(res.get()) < 0)
    mpfr_set(res.get(), pnt.get(), MPFR_RNDN);
  mpfr_round(res.get(), res.get()); // ties away from zero == half-up here

  auto log = logger();
  if (log->should_log(spdlog::level::debug))
    log->debug("closed_form: n={} pnt={:.6e} d={:.6e} e={:.6e}", n.to_string(),
               pnt.to_double(), d_term.to_double(), e_term.to_double());
  return Estimate{std::move(res), Method::closed_form, 1, true};
}

Estimate NewtonEstimator::estimate(const BigInt &n,
                                   const PrecisionContext &ctx) const {
  Real seed = dusart_initializer(n, ctx);
  Real target(ctx.bits);
  mpfr_set_z(target.get(), n.get(), MPFR_RNDN);

  RiemannObjective objective(s_.series_terms);
  NewtonOutcome out = newton_solve(objective, target, seed, s_, ctx);
  if (!out.converged)
    logger()->warn("newton: n={} did not converge in {} iterations "
                   "(raise max_iterations or precision)",
                   n.to_string(), out.iterations);
  return Estimate{std::move(out.x), Method::newton, out.iterations,
                  out.converged};
}

} // namespace npp
