#include "npp/errors.hpp"
#include "npp/known.hpp"
#include "npp/npp.hpp"
#include "npp/prime.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

TEST_CASE("Fast path: canonical indices are exact") {
  using npp::predict;
  auto one = predict(1);
  REQUIRE(one.prime == "2");
  REQUIRE(one.method == npp::Method::lookup);

  for (const auto &k : npp::known_primes()) {
    auto res = predict(std::to_string(k.index));
    INFO("n = " << k.index);
    REQUIRE(res.prime == k.prime);
    REQUIRE(res.method == npp::Method::lookup);
    REQUIRE(res.iterations == 0);
    REQUIRE(res.converged);
    REQUIRE(res.estimate == res.prime);
  }
  REQUIRE(predict(1000000).prime == "15485863");
  REQUIRE(predict(25).prime == "97");
}

TEST_CASE("Closed form: a probable prime near the estimate") {
  auto res = npp::predict(1234567);
  REQUIRE(res.method == npp::Method::closed_form);
  REQUIRE(res.estimate == "19402960");
  REQUIRE(res.prime == "19402949");
  REQUIRE(res.offset < 0);
  REQUIRE(res.iterations == 1);
  REQUIRE(res.converged);
  REQUIRE(res.precision_digits == 128);

  auto p = npp::BigInt::from_string(res.prime);
  REQUIRE(mpz_odd_p(p.get()));
  REQUIRE(npp::is_probable_prime(p));

  REQUIRE(npp::predict(2000000).prime == "32465893");
}

TEST_CASE("Newton mode without the fast path") {
  npp::PredictConfig cfg;
  cfg.method = npp::Method::newton;
  cfg.use_fast_path = false;
  auto res = npp::predict(1000000, cfg);
  REQUIRE(res.method == npp::Method::newton);
  REQUIRE(res.converged);
  REQUIRE(res.iterations >= 1);
  REQUIRE(res.iterations <= cfg.max_iterations);
  REQUIRE(res.estimate == "15484035");
  REQUIRE(res.prime == "15484039");
}

TEST_CASE("Invalid indices are rejected") {
  using npp::InputError;
  REQUIRE_THROWS_AS(npp::predict(0), InputError);
  REQUIRE_THROWS_AS(npp::predict(-5), InputError);
  REQUIRE_THROWS_AS(npp::predict(std::string("0")), InputError);
  REQUIRE_THROWS_AS(npp::predict(std::string("-5")), InputError);
  REQUIRE_THROWS_AS(npp::predict(std::string("abc")), InputError);
  REQUIRE_THROWS_AS(npp::predict(std::string("1.5")), InputError);
  REQUIRE_THROWS_AS(npp::predict(std::string("")), InputError);

  const std::string huge = "1" + std::string(1000, '0');
  REQUIRE_THROWS_AS(npp::predict(huge), npp::PrecisionError);
}

TEST_CASE("Invalid configuration is rejected") {
  npp::PredictConfig cfg;
  cfg.method = npp::Method::lookup;
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::InputError);

  cfg = {};
  cfg.max_iterations = 0;
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::InputError);

  cfg = {};
  cfg.precision_digits = 60; // below the 128 digits needed for 1234567
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::PrecisionError);

  cfg = {};
  cfg.precision_digits = 200;
  REQUIRE(npp::predict(1234567, cfg).precision_digits == 200);

  cfg = {};
  cfg.precision_digits = 4000000000u; // what a wrapped "-1" becomes
  REQUIRE_THROWS_AS(npp::predict(12345, cfg), npp::PrecisionError);

  cfg = {};
  cfg.method = npp::Method::newton;
  cfg.series_terms = 4294967295u;
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::InputError);
  cfg.series_terms = npp::kMaxSeriesTerms + 1;
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::InputError);

  cfg = {};
  cfg.max_iterations = npp::kMaxNewtonIterations + 1;
  REQUIRE_THROWS_AS(npp::predict(1234567, cfg), npp::InputError);
}

TEST_CASE("Predictions are idempotent") {
  auto a = npp::predict(12345);
  auto b = npp::predict(12345);
  REQUIRE(a.prime == b.prime);
  REQUIRE(a.estimate == b.estimate);
  REQUIRE(a.prime == "132137");
}

TEST_CASE("Estimator results are monotone from the end of the table") {
  npp::PredictConfig cfg;
  cfg.use_fast_path = false;
  npp::BigInt last(0ul);
  for (std::int64_t n = 26; n <= 600; ++n) {
    auto p = npp::BigInt::from_string(npp::predict(n, cfg).prime);
    INFO("n = " << n);
    REQUIRE(last <= p);
    last = p;
  }
  for (std::int64_t n = 10000; n <= 10200; ++n) {
    auto p = npp::BigInt::from_string(npp::predict(n, cfg).prime);
    INFO("n = " << n);
    REQUIRE(last <= p);
    last = p;
  }
}

TEST_CASE("Lookup answers may sit above their estimated neighbours") {
  REQUIRE(npp::predict(25).prime == "97");
  REQUIRE(npp::predict(26).prime == "89");
  REQUIRE(npp::predict(100).prime == "541");
  REQUIRE(npp::predict(101).prime == "521");
}

TEST_CASE("Indices past 64 bits use the top precision band") {
  const std::string n = "100000000000000000000001"; // 10^23 + 1

  auto cf = npp::predict(n);
  REQUIRE(cf.method == npp::Method::closed_form);
  REQUIRE(cf.precision_digits == 1024);
  REQUIRE(cf.estimate == "5595601215577628079927236");
  REQUIRE(cf.prime == "5595601215577628079927229");

  npp::PredictConfig cfg;
  cfg.method = npp::Method::newton;
  auto nt = npp::predict(n, cfg);
  REQUIRE(nt.method == npp::Method::newton);
  REQUIRE(nt.precision_digits == 1024);
  REQUIRE(nt.converged);
  REQUIRE(nt.iterations <= cfg.max_iterations);
  REQUIRE(nt.estimate == "5596564467987648427918838");
  REQUIRE(nt.prime == "5596564467987648427918859");

  for (const auto *r : {&cf, &nt}) {
    auto p = npp::BigInt::from_string(r->prime);
    REQUIRE(mpz_odd_p(p.get()));
    REQUIRE(npp::is_probable_prime(p));
  }

  // The closed form stays within 500 ppm of the Newton estimate.
  npp::Real a(256), b(256);
  mpfr_set_str(a.get(), cf.estimate.c_str(), 10, MPFR_RNDN);
  mpfr_set_str(b.get(), nt.estimate.c_str(), 10, MPFR_RNDN);
  mpfr_sub(a.get(), a.get(), b.get(), MPFR_RNDN);
  mpfr_div(a.get(), a.get(), b.get(), MPFR_RNDN);
  REQUIRE(std::fabs(a.to_double()) < 5e-4);
}

TEST_CASE("Batch keeps input order") {
  const std::vector<std::int64_t> idx = {1000000, 12345, 1, 999999, 1000001,
                                         1234567, 25, 2000000};
  auto batch = npp::predict_batch(idx, {}, 3);
  REQUIRE(batch.size() == idx.size());
  for (std::size_t i = 0; i < idx.size(); ++i) {
    INFO("n = " << idx[i]);
    REQUIRE(batch[i].prime == npp::predict(idx[i]).prime);
  }
  REQUIRE(batch[3].prime == "15490393");
  REQUIRE(batch[4].prime == "15490429");

  REQUIRE(npp::predict_batch(std::vector<std::int64_t>{}, {}, 4).empty());
}

TEST_CASE("Batch over decimal strings") {
  const std::vector<std::string> idx = {"12345", "1000000",
                                        "100000000000000000000001"};
  auto batch = npp::predict_batch(idx, {}, 2);
  REQUIRE(batch.size() == 3);
  REQUIRE(batch[0].prime == "132137");
  REQUIRE(batch[1].prime == "15485863");
  REQUIRE(batch[2].prime == "5595601215577628079927229");

  // Every setting reaches each worker.
  npp::PredictConfig cfg;
  cfg.method = npp::Method::newton;
  cfg.use_fast_path = false;
  auto nt = npp::predict_batch(std::vector<std::string>{"1000000"}, cfg, 2);
  REQUIRE(nt[0].method == npp::Method::newton);
  REQUIRE(nt[0].prime == "15484039");

  // Malformed text is never truncated to a leading number.
  for (const char *bad : {"1.5", "12abc", "1e6", " 7", "+7"}) {
    INFO("index '" << bad << "'");
    REQUIRE_THROWS_AS(npp::BigInt::from_string(bad), npp::InputError);
    REQUIRE_THROWS_AS(
        npp::predict_batch(std::vector<std::string>{"12345", bad}, {}, 2),
        npp::InputError);
  }
}

TEST_CASE("Batch rethrows the first failure") {
  const std::vector<std::int64_t> idx = {12345, 0, 1234567};
  REQUIRE_THROWS_AS(npp::predict_batch(idx, {}, 2), npp::InputError);
}

TEST_CASE("Version string") {
  REQUIRE(std::string(npp::version()) == npp::NPP_VERSION);
}
