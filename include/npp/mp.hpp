// include/npp/mp.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <string>

#include <gmp.h>
#include <mpfr.h>

namespace npp {

// Owning MPFR real. Precision is fixed at construction; copies keep it.
class Real {
public:
  explicit Real(mpfr_prec_t prec) { mpfr_init2(v_, prec); }
  Real(mpfr_prec_t prec, long value) : Real(prec) {
    mpfr_set_si(v_, value, MPFR_RNDN);
  }
  Real(const Real &o) : Real(mpfr_get_prec(o.v_)) {
    mpfr_set(v_, o.v_, MPFR_RNDN);
  }
  Real(Real &&o) noexcept {
    mpfr_init2(v_, MPFR_PREC_MIN);
    mpfr_swap(v_, o.v_);
  }
  Real &operator=(const Real &o) {
    if (this != &o) {
      mpfr_set_prec(v_, mpfr_get_prec(o.v_));
      mpfr_set(v_, o.v_, MPFR_RNDN);
    }
    return *this;
  }
  Real &operator=(Real &&o) noexcept {
    mpfr_swap(v_, o.v_);
    return *this;
  }
  ~Real() { mpfr_clear(v_); }

  mpfr_ptr get() noexcept { return v_; }
  mpfr_srcptr get() const noexcept { return v_; }
  mpfr_prec_t precision() const noexcept { return mpfr_get_prec(v_); }

  double to_double() const noexcept { return mpfr_get_d(v_, MPFR_RNDN); }

  // Fixed-point decimal rendering with `fraction_digits` after the point.
  std::string to_string(int fraction_digits = 6) const;

private:
  mpfr_t v_;
};

// Owning GMP integer.
class BigInt {
public:
  BigInt() { mpz_init(v_); }
  explicit BigInt(unsigned long value) { mpz_init_set_ui(v_, value); }
  BigInt(const BigInt &o) { mpz_init_set(v_, o.v_); }
  BigInt(BigInt &&o) noexcept {
    mpz_init(v_);
    mpz_swap(v_, o.v_);
  }
  BigInt &operator=(const BigInt &o) {
    if (this != &o)
      mpz_set(v_, o.v_);
    return *this;
  }
  BigInt &operator=(BigInt &&o) noexcept {
    mpz_swap(v_, o.v_);
    return *this;
  }
  ~BigInt() { mpz_clear(v_); }

  // Parses a base-10 string; throws npp::InputError on malformed text.
  static BigInt from_string(const std::string &decimal);

  mpz_ptr get() noexcept { return v_; }
  mpz_srcptr get() const noexcept { return v_; }

  std::string to_string() const;
  std::size_t decimal_digits() const;
  bool fits_u64() const noexcept { return mpz_sizeinbase(v_, 2) <= 64; }
  std::uint64_t to_u64() const noexcept;

  friend bool operator==(const BigInt &a, const BigInt &b) noexcept {
    return mpz_cmp(a.v_, b.v_) == 0;
  }
  friend bool operator!=(const BigInt &a, const BigInt &b) noexcept {
    return !(a == b);
  }
  friend bool operator<(const BigInt &a, const BigInt &b) noexcept {
    return mpz_cmp(a.v_, b.v_) < 0;
  }
  friend bool operator<=(const BigInt &a, const BigInt &b) noexcept {
    return mpz_cmp(a.v_, b.v_) <= 0;
  }

private:
  mpz_t v_;
};

} // namespace npp
