// src/refine.cpp
#include "npp/refine.hpp"
#include "npp/errors.hpp"
#include "npp/log.hpp"
#include "npp/prime.hpp"

#include <algorithm>
#include <cmath>
#include <string>

namespace npp {
namespace {

std::uint64_t search_window(const BigInt &c, std::uint32_t min_window) {
  long exp2 = 0;
  const double mant = mpz_get_d_2exp(&exp2, c.get()); // c = mant * 2^exp2
  const double ln_c = std::log(mant) + exp2 * std::log(2.0);
  const auto w = static_cast<std::uint64_t>(std::ceil(4.0 * ln_c));
  return std::max<std::uint64_t>(min_window, w);
}

std::int64_t signed_offset(const BigInt &value, const BigInt &origin) {
  mpz_t d;
  mpz_init(d);
  mpz_sub(d, value.get(), origin.get());
  const auto out = static_cast<std::int64_t>(mpz_get_si(d));
  mpz_clear(d);
  return out;
}

} // namespace

void snap_to_6k_pm1(BigInt &n, int direction) {
  const unsigned long r = mpz_fdiv_ui(n.get(), 6);
  unsigned long delta = 0;
  if (direction < 0) {
    switch (r) {
    case 0: delta = 1; break;
    case 2: delta = 1; break;
    case 3: delta = 2; break;
    case 4: delta = 3; break;
    default: break;
    }
    if (delta)
      mpz_sub_ui(n.get(), n.get(), delta);
  } else {
    switch (r) {
    case 0: delta = 1; break;
    case 2: delta = 3; break;
    case 3: delta = 2; break;
    case 4: delta = 1; break;
    default: break;
    }
    if (delta)
      mpz_add_ui(n.get(), n.get(), delta);
  }
}

RefinementCandidate make_candidate(const BigInt &center, std::uint64_t step,
                                   int direction) {
  BigInt t(center);
  if (direction < 0)
    mpz_sub_ui(t.get(), t.get(), step);
  else
    mpz_add_ui(t.get(), t.get(), step);
  if (mpz_even_p(t.get())) {
    if (direction < 0)
      mpz_sub_ui(t.get(), t.get(), 1);
    else
      mpz_add_ui(t.get(), t.get(), 1);
  }
  snap_to_6k_pm1(t, direction);
  const std::int64_t off = signed_offset(t, center);
  return RefinementCandidate{std::move(t), off, direction};
}

RefineResult refine_to_prime(const Real &x, const RefineSettings &s) {
  if (!mpfr_number_p(x.get()))
    throw InputError("cannot refine a non-finite estimate");
  Real r(x.precision());
  mpfr_round(r.get(), x.get());
  BigInt start;
  mpfr_get_z(start.get(), r.get(), MPFR_RNDN);
  return refine_to_prime(start, s);
}

RefineResult refine_to_prime(const BigInt &start, const RefineSettings &s) {
  RefineResult out;

  // 2 and 3 sit outside the 6k±1 lattice.
  if (mpz_cmp_ui(start.get(), 3) <= 0) {
    out.prime = BigInt(mpz_cmp_ui(start.get(), 3) == 0 ? 3ul : 2ul);
    out.candidates_tested = 1;
    return out;
  }

  BigInt c(start);
  if (mpz_even_p(c.get()))
    mpz_add_ui(c.get(), c.get(), 1);
  snap_to_6k_pm1(c, +1);

  out.candidates_tested = 1;
  if (is_probable_prime(c)) {
    out.prime = std::move(c);
    return out;
  }

  const std::uint64_t window = search_window(c, s.min_window);
  // Neighbouring steps often snap to the same value; test each one once.
  BigInt last_fwd(c), last_back(c);
  for (std::uint64_t step = 1; step <= window; ++step) {
    for (int dir : {+1, -1}) {
      RefinementCandidate cand = make_candidate(c, step, dir);
      if (mpz_cmp_ui(cand.value.get(), 3) < 0)
        continue;
      BigInt &last = dir > 0 ? last_fwd : last_back;
      if (cand.value == last)
        continue;
      last = cand.value;
      ++out.candidates_tested;
      if (is_probable_prime(cand.value)) {
        out.prime = std::move(cand.value);
        out.offset = cand.offset;
        logger()->debug("refine: hit at offset {} after {} candidates",
                        out.offset, out.candidates_tested);
        return out;
      }
    }
  }

  // Window exhausted: bounded forward scan from its upper edge.
  logger()->warn("refine: no probable prime within ±{} of {}; scanning "
                 "forward (limit {} steps)",
                 window, c.to_string(), s.fallback_limit);
  out.used_fallback = true;
  BigInt t = make_candidate(c, window, +1).value;
  for (std::uint64_t i = 0; i < s.fallback_limit; ++i) {
    mpz_add_ui(t.get(), t.get(), 2);
    snap_to_6k_pm1(t, +1);
    ++out.candidates_tested;
    if (is_probable_prime(t)) {
      out.offset = signed_offset(t, c);
      out.prime = std::move(t);
      return out;
    }
  }
  throw RefinementExhaustion("no probable prime near " + c.to_string() +
                             " (window ±" + std::to_string(window) +
                             ", forward limit " +
                             std::to_string(s.fallback_limit) + ")");
}

} // namespace npp
