// include/npp/prime.hpp
#pragma once
#include <array>
#include <cstdint>

#include "mp.hpp"

namespace npp {

// Trial-division table: the 25 primes up to 97.
const std::array<std::uint32_t, 25> &small_primes() noexcept;

// Miller–Rabin witnesses {2, 3, ..., 37}. Deterministic below
// 318665857834031151167461 (~3.2e23); larger inputs additionally get GMP's
// probabilistic rounds in is_probable_prime.
const std::array<std::uint32_t, 12> &mr_witnesses() noexcept;

// True if some table prime divides n and n is not that prime.
bool divisible_by_small_prime(const BigInt &n) noexcept;

// Strong-probable-prime test with the fixed witness set. Expects odd n > 37.
bool miller_rabin(std::uint64_t n) noexcept;
bool miller_rabin(const BigInt &n);

// Sieve against small_primes() then Miller–Rabin. Handles every n >= 0.
bool is_probable_prime(std::uint64_t n) noexcept;
bool is_probable_prime(const BigInt &n);

} // namespace npp
