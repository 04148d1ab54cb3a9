// src/scan.cpp
#include "sieve/sieve.hpp"

#include <algorithm> // std::max
#include <chrono>
#include <cmath>
#include <cstdint>
#include <gmp.h>
#include <stdexcept>
#include <string>

namespace {
inline std::string compiler_info() {
#if defined(__clang__)
  return std::string("clang:") + __clang_version__;
#elif defined(__GNUC__)
  return std::string("gcc:") + __VERSION__;
#else
  return "cxx:?";
#endif
}

// n / ln(n): close enough to pi(n) for picking a progress stride.
inline std::uint64_t expected_count(std::uint64_t n) {
  if (n < 3)
    return 0;
  return static_cast<std::uint64_t>(static_cast<double>(n) /
                                    std::log(static_cast<double>(n)));
}

// GMP's BPSW-backed test is exact for anything that fits in 64 bits.
bool gmp_is_prime(mpz_t scratch, std::uint64_t v) {
  mpz_set_ui(scratch, static_cast<unsigned long>(v));
  return mpz_probab_prime_p(scratch, 25) != 0;
}

[[noreturn]] void verify_failed(std::uint64_t v, const char *what) {
  throw std::logic_error("sieve verification failed at " + std::to_string(v) +
                         ": " + what);
}
} // namespace

namespace sieve {

ScanResult scan_primes(const ScanConfig &cfg, ProgressCb cb) {
  ScanResult out;
  out.max_exclusive = cfg.max_exclusive;

  const std::uint64_t stride =
      (cfg.progress_stride != 0)
          ? cfg.progress_stride
          : std::max<std::uint64_t>(1, expected_count(cfg.max_exclusive) / 100);

  mpz_t scratch;
  mpz_init(scratch);

  auto t0 = std::chrono::steady_clock::now();

  // Walk the stream one step behind so the final prime can be reported as
  // the last progress tick.
  PrimeGenerator gen(cfg.max_exclusive);
  std::uint64_t prev = 0;
  try {
    for (std::uint64_t p : gen) {
      if (cfg.verify) {
        if (!gmp_is_prime(scratch, p))
          verify_failed(p, "emitted a composite");
        // Every odd value skipped since the previous prime must be composite.
        for (std::uint64_t q = (prev < 3 ? 3 : prev + 2); q < p; q += 2)
          if (gmp_is_prime(scratch, q))
            verify_failed(q, "skipped a prime");
      }
      if (out.count > 0 && cb && cfg.enable_progress && out.count % stride == 0)
        cb(out.count, prev);
      ++out.count;
      prev = p;
    }
    if (cfg.verify) {
      for (std::uint64_t q = (prev < 3 ? 3 : prev + 2); q < cfg.max_exclusive;
           q += 2)
        if (gmp_is_prime(scratch, q))
          verify_failed(q, "stopped before a prime");
      out.verified = true;
    }
  } catch (...) {
    mpz_clear(scratch);
    throw;
  }
  mpz_clear(scratch);

  if (out.count > 0 && cb && cfg.enable_progress)
    cb(out.count, prev);
  out.largest = prev;

  auto t1 = std::chrono::steady_clock::now();
  out.ns_elapsed = static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count());

  out.engine_info = std::string("sieve:") + SIEVE_VERSION + "; gmp:" +
                    (::gmp_version ? ::gmp_version : "?") + "; " +
                    compiler_info();
  return out;
}

} // namespace sieve
