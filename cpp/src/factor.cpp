// src/factor.cpp
#include "sieve/factor.hpp"
#include "sieve/prime_generator.hpp"

#include <limits>
#include <stdexcept>

namespace sieve {
namespace {
constexpr std::int64_t kMaxSigned = std::numeric_limits<std::int64_t>::max();
} // namespace

bool is_prime(std::int64_t n) noexcept {
  if (n < 2)
    return false;
  if (n < 4)
    return true;
  if (n % 2 == 0 || n % 3 == 0)
    return false;
  // i <= n / i instead of i * i <= n keeps this clear of overflow near 2^63.
  for (std::int64_t i = 5; i <= n / i; i += 6) {
    if (n % i == 0 || n % (i + 2) == 0)
      return false;
  }
  return true;
}

std::uint64_t isqrt(std::uint64_t n) noexcept {
  if (n < 2)
    return n;
  // Newton iteration from above; converges to floor(sqrt(n)).
  std::uint64_t x = n;
  std::uint64_t y = x / 2 + (x & 1u);
  while (y < x) {
    x = y;
    y = (x + n / x) / 2;
  }
  return x;
}

std::vector<std::uint64_t> prime_factors(std::uint64_t n) {
  if (n == 0)
    throw std::invalid_argument("prime_factors: n must be >= 1");

  std::vector<std::uint64_t> factors;
  std::uint64_t rest = n;
  while (rest > 1) {
    if (rest <= static_cast<std::uint64_t>(kMaxSigned) &&
        is_prime(static_cast<std::int64_t>(rest))) {
      factors.push_back(rest);
      break;
    }
    // Every composite has a prime factor <= sqrt(rest); a fresh stream bounded
    // just above it finds the smallest one.
    std::uint64_t divisor = rest;
    for (std::uint64_t p : primes(isqrt(rest) + 1)) {
      if (rest % p == 0) {
        divisor = p;
        break;
      }
    }
    factors.push_back(divisor);
    rest /= divisor;
  }
  return factors;
}

std::uint64_t largest_prime_factor(std::uint64_t n) {
  if (n < 2)
    throw std::invalid_argument("largest_prime_factor: n must be >= 2");
  return prime_factors(n).back();
}

std::uint64_t nth_prime(std::uint64_t n) {
  if (n == 0)
    throw std::invalid_argument("nth_prime: n must be >= 1");
  PrimeGenerator gen;
  std::uint64_t p = 0;
  for (std::uint64_t i = 0; i < n; ++i)
    p = *gen.next(); // unbounded: never nullopt short of overflow
  return p;
}

} // namespace sieve
