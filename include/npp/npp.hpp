// include/npp/npp.hpp
#pragma once
#include <cstdint>
#include <string>
#include <vector>

#include "estimator.hpp"
#include "special.hpp"

namespace npp {

// Bump when the result contract changes (handy for logging/UI).
inline constexpr const char *NPP_VERSION = "1.0.0";

// Optional knobs; every default is usable as-is.
struct PredictConfig {
  Method method = Method::closed_form;          // estimator on a fast-path miss
  unsigned precision_digits = 0;                // 0 = derive from magnitude
  unsigned series_terms = kDefaultSeriesTerms;  // K (newton only)
  unsigned max_iterations = 10;                 // newton only
  double tolerance = 1e-50;                     // newton only, relative
  Calibration calibration{};                    // closed_form only
  bool use_fast_path = true;
  std::uint32_t min_window = 256;               // refinement search radius
  std::uint64_t fallback_limit = 1u << 20;      // forward-scan cap
};

// Result summary; no multiprecision types leaked.
struct PredictResult {
  std::string prime;                  // decimal
  std::string estimate;               // estimator output rounded half-up
  std::uint64_t iterations = 0;       // 0 for lookup, 1 for closed_form
  bool converged = false;
  std::uint64_t ns_elapsed = 0;       // wall-clock nanoseconds (best effort)
  Method method = Method::lookup;
  std::uint64_t candidates_tested = 0;
  std::int64_t offset = 0;            // prime - first snapped candidate
  unsigned precision_digits = 0;      // 0 for lookup
};

// Predicts p_n. Canonical indices are exact; everything else is a probable
// prime near the estimate.
// Throws InputError (n < 1 or bad config), PrecisionError, DerivativeZero /
// NumericDegeneracy (newton) and RefinementExhaustion.
PredictResult predict(std::int64_t n, const PredictConfig &cfg = {});

// Same for an index of any size given in base 10 ("123456789012345678901").
PredictResult predict(const std::string &n, const PredictConfig &cfg = {});

// Runs predict() for each index on `threads` workers (0 = hardware
// concurrency). Results keep input order; the first failure is rethrown
// once every worker has stopped.
std::vector<PredictResult> predict_batch(const std::vector<std::int64_t> &n,
                                         const PredictConfig &cfg = {},
                                         unsigned threads = 0);
std::vector<PredictResult> predict_batch(const std::vector<std::string> &n,
                                         const PredictConfig &cfg = {},
                                         unsigned threads = 0);

const char *version() noexcept;

} // namespace npp
