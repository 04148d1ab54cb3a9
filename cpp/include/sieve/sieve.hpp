// include/sieve/sieve.hpp
#pragma once
#include <cstdint>
#include <functional>
#include <string>

#include "factor.hpp"
#include "prime_generator.hpp"

namespace sieve {

// Bump when the result contract changes (handy for logging/UI).
inline constexpr const char* SIEVE_VERSION = "0.1.0";

struct ScanConfig {
  std::uint64_t max_exclusive;         // scan primes < max_exclusive
  bool enable_progress = true;         // allow callbacks
  std::uint64_t progress_stride = 0;   // 0 = auto (~1% of expected count)
  bool verify = false;                 // cross-check every odd value with GMP
};

struct ScanResult {
  std::uint64_t max_exclusive = 0;
  std::uint64_t count = 0;             // primes found below max_exclusive
  std::uint64_t largest = 0;           // 0 if none
  std::uint64_t ns_elapsed = 0;        // wall-clock nanoseconds (best effort)
  bool verified = false;               // true iff cfg.verify ran and agreed
  std::string engine_info;             // e.g. "sieve:0.1.0; gmp:6.3.0; gcc:13.2.0"
};

// Progress callback: primes found so far and the latest prime.
using ProgressCb = std::function<void(std::uint64_t, std::uint64_t)>;

// Runs the incremental sieve up to cfg.max_exclusive.
// Throws std::logic_error if verification disagrees with the sieve.
ScanResult scan_primes(const ScanConfig& cfg, ProgressCb cb = {});

} // namespace sieve
