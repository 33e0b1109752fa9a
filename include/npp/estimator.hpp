// include/npp/estimator.hpp
#pragma once
#include <memory>

#include "mp.hpp"
#include "precision.hpp"
#include "special.hpp"

namespace npp {

// Provenance of a prediction.
enum class Method { lookup, closed_form, newton };

const char *to_string(Method m) noexcept;
// Accepts "lookup", "closed_form" and "newton"; throws InputError otherwise.
Method method_from_string(const char *name);

// Offline-fitted constants of the closed-form corrections. Defaults are the
// pair fitted against the 10^0..10^18 reference grid (see DESIGN.md).
struct Calibration {
  double c = -0.00016667;   // d-term weight
  double kappa_star = 0.065; // e-term weight
};

// Accepted ranges for NewtonSettings; predict() rejects anything larger.
inline constexpr unsigned kMaxSeriesTerms = 100;
inline constexpr unsigned kMaxNewtonIterations = 1000;

struct NewtonSettings {
  unsigned series_terms = kDefaultSeriesTerms; // K in R(x)
  unsigned max_iterations = 10;
  double tolerance = 1e-50; // on |x_{i+1} - x_i| / |x_{i+1}|
};

// Continuous estimate of p_n.
struct Estimate {
  Real x;
  Method method;
  unsigned iterations;
  bool converged;
};

// Common contract of both estimators: estimate(n, precision) -> x.
class Estimator {
public:
  virtual ~Estimator() = default;
  virtual Method method() const noexcept = 0;
  virtual Estimate estimate(const BigInt &n,
                            const PrecisionContext &ctx) const = 0;
};

// n(L + L2 - 1 + (L2 - 2)/L) plus the calibrated d- and e-terms, rounded
// half-up. Returns exactly 2 for n < 2.
class ClosedFormEstimator final : public Estimator {
public:
  explicit ClosedFormEstimator(Calibration cal = {}) : cal_(cal) {}
  Method method() const noexcept override { return Method::closed_form; }
  Estimate estimate(const BigInt &n,
                    const PrecisionContext &ctx) const override;

private:
  Calibration cal_;
};

// Solves R(x) = n by Newton-Raphson from the Dusart/Cipolla seed.
// Throws InputError for n < 2 and DerivativeZero if R'(x) vanishes.
class NewtonEstimator final : public Estimator {
public:
  explicit NewtonEstimator(NewtonSettings s = {}) : s_(s) {}
  Method method() const noexcept override { return Method::newton; }
  Estimate estimate(const BigInt &n,
                    const PrecisionContext &ctx) const override;

private:
  NewtonSettings s_;
};

std::unique_ptr<Estimator> make_estimator(Method m, const Calibration &cal,
                                          const NewtonSettings &newton);

// 3-term Dusart/Cipolla seed
//   x0 = n(L + L2 - 1 + (L2-2)/L - (L2^2 - 6 L2 + 11)/(2 L^2)).
// Throws InputError for n < 2.
Real dusart_initializer(const BigInt &n, const PrecisionContext &ctx);

// f(x) and f'(x) for the root finder.
class RootObjective {
public:
  virtual ~RootObjective() = default;
  virtual Real value(const Real &x, const PrecisionContext &ctx) const = 0;
  virtual Real derivative(const Real &x,
                          const PrecisionContext &ctx) const = 0;
};

// f = R(x) with K series terms. Throws NumericDegeneracy when x <= 1.
class RiemannObjective final : public RootObjective {
public:
  explicit RiemannObjective(unsigned K) : K_(K) {}
  Real value(const Real &x, const PrecisionContext &ctx) const override;
  Real derivative(const Real &x, const PrecisionContext &ctx) const override;

private:
  unsigned K_;
};

struct NewtonOutcome {
  Real x;
  unsigned iterations;
  bool converged;
};

// Iterates x <- x - (f(x) - target) / f'(x). Stops early once the relative
// step drops below s.tolerance; otherwise returns the last iterate with
// converged == false.
NewtonOutcome newton_solve(const RootObjective &f, const Real &target,
                           const Real &seed, const NewtonSettings &s,
                           const PrecisionContext &ctx);

} // namespace npp
