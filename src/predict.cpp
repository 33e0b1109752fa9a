// src/predict.cpp
#include "npp/errors.hpp"
#include "npp/known.hpp"
#include "npp/log.hpp"
#include "npp/npp.hpp"
#include "npp/precision.hpp"
#include "npp/refine.hpp"

#include <chrono>
#include <cstdint>
#include <string>

namespace npp {
namespace {

void validate(const PredictConfig &cfg) {
  if (cfg.method == Method::lookup)
    throw InputError("method 'lookup' cannot be requested; it is chosen by "
                     "the fast path");
  if (cfg.series_terms < 1 || cfg.series_terms > kMaxSeriesTerms)
    throw InputError("series_terms must be in [1, " +
                     std::to_string(kMaxSeriesTerms) + "], got " +
                     std::to_string(cfg.series_terms));
  if (cfg.max_iterations < 1 || cfg.max_iterations > kMaxNewtonIterations)
    throw InputError("max_iterations must be in [1, " +
                     std::to_string(kMaxNewtonIterations) + "], got " +
                     std::to_string(cfg.max_iterations));
  if (!(cfg.tolerance > 0))
    throw InputError("tolerance must be > 0");
}

std::string rounded_decimal(const Real &x) {
  Real r(x.precision());
  mpfr_round(r.get(), x.get());
  BigInt z;
  mpfr_get_z(z.get(), r.get(), MPFR_RNDN);
  return z.to_string();
}

PredictResult predict_index(const BigInt &n, const PredictConfig &cfg) {
  validate(cfg);
  if (mpz_sgn(n.get()) <= 0)
    throw InputError("n must be >= 1, got " + n.to_string());

  auto t0 = std::chrono::steady_clock::now();
  auto elapsed = [&t0] {
    auto t1 = std::chrono::steady_clock::now();
    return static_cast<std::uint64_t>(
        std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0)
            .count());
  };

  PredictResult out;

  // Fast path: exact reference value, no estimation.
  if (cfg.use_fast_path) {
    if (auto known = lookup_known(n)) {
      out.prime = known->to_string();
      out.estimate = out.prime;
      out.iterations = 0;
      out.converged = true;
      out.method = Method::lookup;
      out.ns_elapsed = elapsed();
      logger()->debug("predict: n={} lookup -> {}", n.to_string(), out.prime);
      return out;
    }
  }

  PrecisionContext ctx = required_precision(n);
  if (cfg.precision_digits != 0)
    ctx = with_override(ctx, cfg.precision_digits);

  NewtonSettings newton;
  newton.series_terms = cfg.series_terms;
  newton.max_iterations = cfg.max_iterations;
  newton.tolerance = cfg.tolerance;
  auto estimator = make_estimator(cfg.method, cfg.calibration, newton);

  Estimate est = estimator->estimate(n, ctx);

  RefineSettings rs;
  rs.min_window = cfg.min_window;
  rs.fallback_limit = cfg.fallback_limit;
  RefineResult refined = refine_to_prime(est.x, rs);

  out.prime = refined.prime.to_string();
  out.estimate = rounded_decimal(est.x);
  out.iterations = est.iterations;
  out.converged = est.converged;
  out.method = est.method;
  out.candidates_tested = refined.candidates_tested;
  out.offset = refined.offset;
  out.precision_digits = ctx.digits;
  out.ns_elapsed = elapsed();

  logger()->debug("predict: n={} method={} digits={} estimate={} prime={} "
                  "tested={} offset={}",
                  n.to_string(), to_string(out.method), ctx.digits,
                  out.estimate, out.prime, out.candidates_tested, out.offset);
  return out;
}

} // namespace

PredictResult predict(std::int64_t n, const PredictConfig &cfg) {
  if (n < 1)
    throw InputError("n must be >= 1, got " + std::to_string(n));
  return predict_index(BigInt(static_cast<unsigned long>(n)), cfg);
}

PredictResult predict(const std::string &n, const PredictConfig &cfg) {
  return predict_index(BigInt::from_string(n), cfg);
}

const char *version() noexcept { return NPP_VERSION; }

} // namespace npp
