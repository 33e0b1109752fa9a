// src/known.cpp
#include "npp/known.hpp"
#include "npp/prime.hpp"

namespace npp {
namespace {

constexpr std::array<KnownPrime, 19> kKnown = {{
    {1ull, "2"},
    {10ull, "29"},
    {100ull, "541"},
    {1000ull, "7919"},
    {10000ull, "104729"},
    {100000ull, "1299709"},
    {1000000ull, "15485863"},
    {10000000ull, "179424673"},
    {100000000ull, "2038074743"},
    {1000000000ull, "22801763489"},
    {10000000000ull, "252097800623"},
    {100000000000ull, "2760727302517"},
    {1000000000000ull, "29996224275833"},
    {10000000000000ull, "323780508946331"},
    {100000000000000ull, "3475385758524527"},
    {1000000000000000ull, "37124508045065437"},
    {10000000000000000ull, "394906913903735329"},
    {100000000000000000ull, "4185296581467695669"},
    {1000000000000000000ull, "44211790234832169331"},
}};

} // namespace

const std::array<KnownPrime, 19> &known_primes() noexcept { return kKnown; }

std::optional<BigInt> lookup_known(const BigInt &n) {
  if (mpz_sgn(n.get()) <= 0 || !n.fits_u64())
    return std::nullopt;
  const std::uint64_t idx = n.to_u64();

  const auto &table = small_primes();
  if (idx <= table.size())
    return BigInt(static_cast<unsigned long>(table[idx - 1]));

  for (const KnownPrime &k : kKnown) {
    if (k.index == idx)
      return BigInt::from_string(k.prime);
  }
  return std::nullopt;
}

} // namespace npp
