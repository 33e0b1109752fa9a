#include "npp/errors.hpp"
#include "npp/estimator.hpp"
#include "npp/known.hpp"
#include "npp/precision.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <memory>

namespace {

npp::Estimate run(const npp::Estimator &e, unsigned long n) {
  npp::BigInt idx(n);
  return e.estimate(idx, npp::required_precision(idx));
}

// Derivative that vanishes everywhere.
class FlatObjective final : public npp::RootObjective {
public:
  npp::Real value(const npp::Real &x,
                  const npp::PrecisionContext &) const override {
    return x;
  }
  npp::Real derivative(const npp::Real &x,
                       const npp::PrecisionContext &ctx) const override {
    npp::Real d(ctx.bits);
    mpfr_set_zero(d.get(), 1);
    (void)x;
    return d;
  }
};

// f(x) = x^2, root of f = target by Newton.
class SquareObjective final : public npp::RootObjective {
public:
  npp::Real value(const npp::Real &x,
                  const npp::PrecisionContext &ctx) const override {
    npp::Real v(ctx.bits);
    mpfr_sqr(v.get(), x.get(), MPFR_RNDN);
    return v;
  }
  npp::Real derivative(const npp::Real &x,
                       const npp::PrecisionContext &ctx) const override {
    npp::Real d(ctx.bits);
    mpfr_mul_ui(d.get(), x.get(), 2, MPFR_RNDN);
    return d;
  }
};

} // namespace

TEST_CASE("Closed form: constant 2 below n = 2") {
  npp::ClosedFormEstimator cf;
  auto e = run(cf, 1);
  REQUIRE(e.method == npp::Method::closed_form);
  REQUIRE(mpfr_cmp_ui(e.x.get(), 2) == 0);
  REQUIRE(e.converged);
}

TEST_CASE("Closed form: integer output for n = 1234567") {
  npp::ClosedFormEstimator cf;
  auto e = run(cf, 1234567);
  REQUIRE(mpfr_integer_p(e.x.get()));
  REQUIRE(e.x.to_string(0) == "19402960"); // 19402959.7198... rounded
  REQUIRE(e.iterations == 1);
}

TEST_CASE("Closed form stays within 100 ppm on the 1e9..1e18 grid") {
  npp::ClosedFormEstimator cf;
  for (const auto &k : npp::known_primes()) {
    if (k.index < 1000000000ull)
      continue;
    npp::BigInt n(static_cast<unsigned long>(k.index));
    auto ctx = npp::required_precision(n);
    auto e = cf.estimate(n, ctx);
    npp::Real ref(ctx.bits), ppm(ctx.bits);
    mpfr_set_str(ref.get(), k.prime, 10, MPFR_RNDN);
    mpfr_sub(ppm.get(), e.x.get(), ref.get(), MPFR_RNDN);
    mpfr_div(ppm.get(), ppm.get(), ref.get(), MPFR_RNDN);
    mpfr_mul_ui(ppm.get(), ppm.get(), 1000000, MPFR_RNDN);
    INFO("n = " << k.index << ", ppm = " << ppm.to_double());
    REQUIRE(std::fabs(ppm.to_double()) < 100.0);
  }
}

TEST_CASE("Closed form responds to calibration constants") {
  npp::Calibration other{-0.00247, 0.04449};
  auto a = run(npp::ClosedFormEstimator{}, 1000000);
  auto b = run(npp::ClosedFormEstimator{other}, 1000000);
  REQUIRE(mpfr_cmp(a.x.get(), b.x.get()) != 0);
  // The older pair is fitted tightly around 1e6..1e7.
  REQUIRE(std::fabs(b.x.to_double() - 15485863.0) < 100.0);
}

TEST_CASE("Dusart initializer") {
  npp::BigInt n(1000000ul);
  auto x0 = npp::dusart_initializer(n, npp::required_precision(n));
  REQUIRE(std::fabs(x0.to_double() - 15480992.7599) < 0.01);

  npp::BigInt one(1ul);
  REQUIRE_THROWS_AS(npp::dusart_initializer(one, npp::required_precision(one)),
                    npp::InputError);
}

TEST_CASE("Newton converges on R(x) = n") {
  npp::NewtonEstimator newton;
  auto e = run(newton, 1234567);
  REQUIRE(e.method == npp::Method::newton);
  REQUIRE(e.converged);
  REQUIRE(e.iterations >= 2);
  REQUIRE(e.iterations <= 8);
  REQUIRE(std::fabs(e.x.to_double() - 19395201.3237) < 0.01);

  auto m = run(newton, 1000000);
  REQUIRE(m.converged);
  REQUIRE(std::fabs(m.x.to_double() - 15485863.0) / 15485863.0 < 2e-4);

  REQUIRE_THROWS_AS(run(newton, 1), npp::InputError);
}

TEST_CASE("Newton reports an exhausted iteration budget") {
  npp::NewtonSettings s;
  s.max_iterations = 1;
  auto e = run(npp::NewtonEstimator{s}, 1234567);
  REQUIRE_FALSE(e.converged);
  REQUIRE(e.iterations == 1);
}

TEST_CASE("Newton solver: zero derivative is fatal") {
  auto ctx = npp::required_precision(std::size_t{1});
  npp::Real seed(ctx.bits, 10), target(ctx.bits, 3);
  REQUIRE_THROWS_AS(
      npp::newton_solve(FlatObjective{}, target, seed, {}, ctx),
      npp::DerivativeZero);
  REQUIRE_THROWS_AS(
      npp::newton_solve(FlatObjective{}, target, seed, {}, ctx),
      npp::NumericDegeneracy);
}

TEST_CASE("Newton solver works on any objective") {
  auto ctx = npp::required_precision(std::size_t{1});
  npp::Real seed(ctx.bits, 2), target(ctx.bits, 2);
  auto out = npp::newton_solve(SquareObjective{}, target, seed, {}, ctx);
  REQUIRE(out.converged);
  REQUIRE(out.x.to_double() == std::sqrt(2.0));
}

TEST_CASE("Riemann objective guards its domain") {
  auto ctx = npp::required_precision(std::size_t{1});
  npp::RiemannObjective r(10);
  npp::Real x(ctx.bits, 1);
  REQUIRE_THROWS_AS(r.value(x, ctx), npp::NumericDegeneracy);
  REQUIRE_THROWS_AS(r.derivative(x, ctx), npp::NumericDegeneracy);
}

TEST_CASE("Estimators share one interface") {
  npp::NewtonSettings ns;
  auto cf = npp::make_estimator(npp::Method::closed_form, {}, ns);
  auto nt = npp::make_estimator(npp::Method::newton, {}, ns);
  REQUIRE(cf->method() == npp::Method::closed_form);
  REQUIRE(nt->method() == npp::Method::newton);
  REQUIRE_THROWS_AS(npp::make_estimator(npp::Method::lookup, {}, ns),
                    npp::InputError);

  REQUIRE(npp::method_from_string("newton") == npp::Method::newton);
  REQUIRE(std::string(npp::to_string(npp::Method::closed_form)) ==
          "closed_form");
  REQUIRE_THROWS_AS(npp::method_from_string("secant"), npp::InputError);
}
