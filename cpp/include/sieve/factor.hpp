// include/sieve/factor.hpp
#pragma once
#include <cstdint>
#include <vector>

namespace sieve {

// Trial division by 2, 3 and 6k +/- 1 up to sqrt(n). False for n < 2.
bool is_prime(std::int64_t n) noexcept;

// floor(sqrt(n)) without going through floating point.
std::uint64_t isqrt(std::uint64_t n) noexcept;

// Prime factors of n in ascending order, repeated for multiplicity.
// prime_factors(1) is empty. Throws std::invalid_argument for 0.
std::vector<std::uint64_t> prime_factors(std::uint64_t n);

// Largest prime factor of n. Throws std::invalid_argument if n < 2.
std::uint64_t largest_prime_factor(std::uint64_t n);

// The n-th prime, 1-based (nth_prime(1) == 2). Throws std::invalid_argument
// for n == 0.
std::uint64_t nth_prime(std::uint64_t n);

} // namespace sieve
