// src/mp.cpp
#include "npp/mp.hpp"
#include "npp/errors.hpp"

#include <cstdlib>
#include <memory>
#include <stdexcept>
#include <string>

namespace npp {
namespace {

struct GmpFree {
  void operator()(char *p) const noexcept {
    void (*freefn)(void *, std::size_t) = nullptr;
    mp_get_memory_functions(nullptr, nullptr, &freefn);
    freefn(p, std::char_traits<char>::length(p) + 1);
  }
};

} // namespace

std::string Real::to_string(int fraction_digits) const {
  if (fraction_digits < 0)
    fraction_digits = 0;
  char *raw = nullptr;
  if (mpfr_asprintf(&raw, "%.*RNf", fraction_digits, v_) < 0)
    throw std::runtime_error("mpfr_asprintf failed");
  std::string out(raw);
  mpfr_free_str(raw);
  return out;
}

BigInt BigInt::from_string(const std::string &decimal) {
  if (decimal.empty())
    throw InputError("empty integer literal");
  for (char ch : decimal) {
    if (ch < '0' || ch > '9')
      throw InputError("not a non-negative integer: '" + decimal + "'");
  }
  BigInt out;
  if (mpz_set_str(out.v_, decimal.c_str(), 10) != 0)
    throw InputError("not a non-negative integer: '" + decimal + "'");
  return out;
}

std::string BigInt::to_string() const {
  std::unique_ptr<char, GmpFree> s(mpz_get_str(nullptr, 10, v_));
  return std::string(s.get());
}

std::size_t BigInt::decimal_digits() const {
  // mpz_sizeinbase may overshoot by one for base 10.
  std::size_t n = mpz_sizeinbase(v_, 10);
  if (n > 1) {
    mpz_t p;
    mpz_init(p);
    mpz_ui_pow_ui(p, 10, n - 1);
    if (mpz_cmpabs(v_, p) < 0)
      --n;
    mpz_clear(p);
  }
  return n;
}

std::uint64_t BigInt::to_u64() const noexcept {
  std::uint64_t out = 0;
  std::size_t count = 0;
  mpz_export(&out, &count, -1, sizeof(out), 0, 0, v_);
  return count ? out : 0;
}

} // namespace npp
