#include "npp/errors.hpp"
#include "npp/estimator.hpp"
#include "npp/known.hpp"
#include "npp/log.hpp"
#include "npp/npp.hpp"
#include "npp/precision.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

// Strict unsigned flag value: digits only, no sign, no trailing text.
unsigned parse_unsigned(const std::string &flag, const std::string &v) {
  if (v.empty() || v.find_first_not_of("0123456789") != std::string::npos)
    throw std::invalid_argument(flag + " expects a non-negative integer, got '" +
                                v + "'");
  const unsigned long x = std::stoul(v);
  if (x > UINT32_MAX)
    throw std::out_of_range(flag + " value " + v + " is too large");
  return static_cast<unsigned>(x);
}

void usage(const char *prog) {
  std::cout
      << "npp " << npp::version() << " - nth prime predictor\n"
      << "usage: " << prog << " [options] <n>...\n"
      << "  --method=closed_form|newton  estimator on a lookup miss\n"
      << "  --k=K            Riemann R series terms (newton, default 10)\n"
      << "  --iters=N        max Newton iterations (default 10)\n"
      << "  --tol=T          relative Newton tolerance (default 1e-50)\n"
      << "  --prec=D         working precision in decimal digits\n"
      << "  --c=C --kappa=K  closed-form calibration constants\n"
      << "  --no-fast-path   always estimate and refine\n"
      << "  --bench=N        repeat each prediction N times\n"
      << "  --threads=T      predict all indices as one batch on T workers\n"
      << "  --check          closed-form error (ppm) on the reference grid\n"
      << "  --verbose        debug logging\n";
}

// Closed-form estimate against p_{10^k}, k = 1..18, in parts per million.
int run_check(const npp::Calibration &cal) {
  npp::ClosedFormEstimator est(cal);
  double worst = 0;
  for (const auto &k : npp::known_primes()) {
    if (k.index < 10)
      continue;
    npp::BigInt n(static_cast<unsigned long>(k.index));
    npp::BigInt ref = npp::BigInt::from_string(k.prime);
    auto ctx = npp::required_precision(n);
    npp::Estimate e = est.estimate(n, ctx);

    npp::Real r(ctx.bits), ppm(ctx.bits);
    mpfr_set_z(r.get(), ref.get(), MPFR_RNDN);
    mpfr_sub(ppm.get(), e.x.get(), r.get(), MPFR_RNDN);
    mpfr_div(ppm.get(), ppm.get(), r.get(), MPFR_RNDN);
    mpfr_mul_ui(ppm.get(), ppm.get(), 1000000, MPFR_RNDN);
    const double v = ppm.to_double();
    if (k.index >= 1000000000ull && (v < 0 ? -v : v) > worst)
      worst = v < 0 ? -v : v;

    char line[160];
    std::snprintf(line, sizeof line, "n=%-20llu ref=%-22s est=%-22s ppm=%+10.3f",
                  static_cast<unsigned long long>(k.index), k.prime,
                  e.x.to_string(0).c_str(), v);
    std::cout << line << "\n";
  }
  std::cout << "max |ppm| for n >= 1e9: " << worst << "\n";
  return 0;
}

void print_result(const std::string &n, const npp::PredictResult &r) {
  std::cout << "p_" << n << " = " << r.prime
            << " | method=" << npp::to_string(r.method)
            << " | estimate=" << r.estimate << " | iters=" << r.iterations
            << " | converged=" << (r.converged ? "yes" : "NO")
            << " | tested=" << r.candidates_tested << " | offset=" << r.offset
            << " | digits=" << r.precision_digits
            << " | core(ns)=" << r.ns_elapsed << "\n";
  if (!r.converged)
    std::cout << "  warning: not converged; raise --iters or --prec\n";
}

} // namespace

int main(int argc, char **argv) {
  unsigned repeats = 1, threads = 0;
  bool batch = false, check = false;
  npp::PredictConfig cfg;
  std::vector<std::string> indices;

  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "-h" || a == "--help") {
        usage(argv[0]);
        return 0;
      } else if (a.rfind("--method=", 0) == 0) {
        cfg.method = npp::method_from_string(a.substr(9).c_str());
      } else if (a.rfind("--k=", 0) == 0) {
        cfg.series_terms = parse_unsigned("--k", a.substr(4));
      } else if (a.rfind("--iters=", 0) == 0) {
        cfg.max_iterations = parse_unsigned("--iters", a.substr(8));
      } else if (a.rfind("--tol=", 0) == 0) {
        cfg.tolerance = std::stod(a.substr(6));
      } else if (a.rfind("--prec=", 0) == 0) {
        cfg.precision_digits = parse_unsigned("--prec", a.substr(7));
      } else if (a.rfind("--c=", 0) == 0) {
        cfg.calibration.c = std::stod(a.substr(4));
      } else if (a.rfind("--kappa=", 0) == 0) {
        cfg.calibration.kappa_star = std::stod(a.substr(8));
      } else if (a == "--no-fast-path") {
        cfg.use_fast_path = false;
      } else if (a.rfind("--bench=", 0) == 0) {
        repeats = std::max(1u, parse_unsigned("--bench", a.substr(8)));
      } else if (a.rfind("--threads=", 0) == 0) {
        threads = parse_unsigned("--threads", a.substr(10));
        batch = true;
      } else if (a == "--check") {
        check = true;
      } else if (a == "--verbose") {
        npp::set_log_level(spdlog::level::debug);
      } else if (a.rfind("--", 0) == 0) {
        std::cerr << "unknown option '" << a << "'\n";
        usage(argv[0]);
        return 2;
      } else {
        indices.push_back(a);
      }
    }
  } catch (const std::logic_error &e) { // parse errors and bad --method
    std::cerr << "bad option value: " << e.what() << "\n";
    return 2;
  }

  if (check)
    return run_check(cfg.calibration);
  if (indices.empty()) {
    usage(argv[0]);
    return 1;
  }

  int status = 0;

  if (batch) {
    // Bad entries are reported and skipped before the batch starts.
    std::vector<std::string> ns;
    for (const auto &s : indices) {
      try {
        npp::BigInt v = npp::BigInt::from_string(s);
        if (mpz_sgn(v.get()) <= 0)
          throw npp::InputError("n must be >= 1");
        ns.push_back(s);
      } catch (const npp::InputError &e) {
        std::cerr << "skip '" << s << "': " << e.what() << "\n";
        status = 1;
      }
    }
    try {
      auto t0 = std::chrono::steady_clock::now();
      auto results = npp::predict_batch(ns, cfg, threads);
      auto t1 = std::chrono::steady_clock::now();
      for (std::size_t i = 0; i < ns.size(); ++i)
        print_result(ns[i], results[i]);
      std::cout << "batch of " << ns.size() << " in "
                << std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0)
                       .count()
                << " ns\n";
    } catch (const std::exception &e) {
      std::cerr << "batch failed: " << e.what() << "\n";
      return 1;
    }
    return status;
  }

  for (const auto &n : indices) {
    std::uint64_t best = UINT64_MAX, sum = 0;
    try {
      for (unsigned r = 0; r < repeats; ++r) {
        auto res = npp::predict(n, cfg);
        sum += res.ns_elapsed;
        if (res.ns_elapsed < best)
          best = res.ns_elapsed;
        if (repeats == 1)
          print_result(n, res);
      }
    } catch (const npp::InputError &e) {
      std::cerr << "skip '" << n << "': " << e.what() << "\n";
      status = 1;
      continue;
    } catch (const std::exception &e) {
      std::cerr << "p_" << n << " failed: " << e.what() << "\n";
      status = 1;
      continue;
    }
    if (repeats > 1) {
      std::cout << "p_" << n << " bench repeats=" << repeats
                << " | best(ns)=" << best << " | avg(ns)=" << (sum / repeats)
                << "\n";
    }
  }
  return status;
}
