// src/prime.cpp
#include "npp/prime.hpp"
#include <cstdint>

namespace npp {
namespace {

constexpr std::array<std::uint32_t, 25> kSmallPrimes = {
    2u,  3u,  5u,  7u,  11u, 13u, 17u, 19u, 23u, 29u, 31u, 37u, 41u,
    43u, 47u, 53u, 59u, 61u, 67u, 71u, 73u, 79u, 83u, 89u, 97u};

constexpr std::array<std::uint32_t, 12> kWitnesses = {
    2u, 3u, 5u, 7u, 11u, 13u, 17u, 19u, 23u, 29u, 31u, 37u};

// Above this the witness set is no longer a proof.
constexpr const char *kDeterministicBound = "318665857834031151167461";

// Extra GMP rounds past the deterministic bound.
constexpr int kExtraRounds = 25;

inline std::uint64_t mod_mul(std::uint64_t a, std::uint64_t b,
                             std::uint64_t m) {
  return static_cast<std::uint64_t>((__uint128_t)a * b %
                                    m); // safe for 64-bit intermediates
}

inline std::uint64_t mod_pow(std::uint64_t a, std::uint64_t e,
                             std::uint64_t m) {
  std::uint64_t r = 1 % m;
  while (e) {
    if (e & 1)
      r = mod_mul(r, a, m);
    a = mod_mul(a, a, m);
    e >>= 1;
  }
  return r;
}

bool mr_witness(std::uint64_t n, std::uint64_t a) {
  if (a % n == 0)
    return true; // base equals 0 mod n → “passes” this base
  std::uint64_t d = n - 1;
  unsigned s = 0;
  while ((d & 1u) == 0) {
    d >>= 1;
    ++s;
  } // n-1 = d * 2^s with d odd
  std::uint64_t x = mod_pow(a, d, n);
  if (x == 1 || x == n - 1)
    return true;
  for (unsigned i = 1; i < s; ++i) {
    x = mod_mul(x, x, n);
    if (x == n - 1)
      return true;
  }
  return false; // composite for this base
}

// Same test over GMP integers; d, s precomputed by the caller.
bool mr_witness(const mpz_t n, const mpz_t n_minus_1, const mpz_t d,
                unsigned long s, unsigned long a, mpz_t x) {
  mpz_set_ui(x, a);
  mpz_powm(x, x, d, n);
  if (mpz_cmp_ui(x, 1) == 0 || mpz_cmp(x, n_minus_1) == 0)
    return true;
  for (unsigned long i = 1; i < s; ++i) {
    mpz_powm_ui(x, x, 2, n);
    if (mpz_cmp(x, n_minus_1) == 0)
      return true;
  }
  return false;
}

} // namespace

const std::array<std::uint32_t, 25> &small_primes() noexcept {
  return kSmallPrimes;
}

const std::array<std::uint32_t, 12> &mr_witnesses() noexcept {
  return kWitnesses;
}

bool divisible_by_small_prime(const BigInt &n) noexcept {
  for (std::uint32_t q : kSmallPrimes) {
    if (mpz_cmp_ui(n.get(), q) == 0)
      return false;
    if (mpz_divisible_ui_p(n.get(), q))
      return true;
  }
  return false;
}

bool miller_rabin(std::uint64_t n) noexcept {
  for (std::uint32_t a : kWitnesses) {
    if (!mr_witness(n, a))
      return false;
  }
  return true;
}

bool miller_rabin(const BigInt &n) {
  if (n.fits_u64())
    return miller_rabin(n.to_u64());

  mpz_t nm1, d, x;
  mpz_init(nm1);
  mpz_init(d);
  mpz_init(x);
  mpz_sub_ui(nm1, n.get(), 1);
  const unsigned long s = mpz_scan1(nm1, 0);
  mpz_tdiv_q_2exp(d, nm1, s);

  bool ok = true;
  for (std::uint32_t a : kWitnesses) {
    if (!mr_witness(n.get(), nm1, d, s, a, x)) {
      ok = false;
      break;
    }
  }
  mpz_clear(nm1);
  mpz_clear(d);
  mpz_clear(x);
  return ok;
}

bool is_probable_prime(std::uint64_t n) noexcept {
  if (n < 2)
    return false;
  for (std::uint32_t q : kSmallPrimes) {
    if (n == q)
      return true;
    if (n % q == 0)
      return false;
  }
  return miller_rabin(n);
}

bool is_probable_prime(const BigInt &n) {
  if (n.fits_u64())
    return is_probable_prime(n.to_u64());
  if (divisible_by_small_prime(n) || !miller_rabin(n))
    return false;

  static const BigInt bound = BigInt::from_string(kDeterministicBound);
  if (n < bound)
    return true;
  return mpz_probab_prime_p(n.get(), kExtraRounds) != 0;
}

} // namespace npp
