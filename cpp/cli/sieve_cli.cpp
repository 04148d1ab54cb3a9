#include "sieve/sieve.hpp"
#include <iostream>
#include <vector>
#include <string>
#include <limits>
#include <chrono>
#include <stdexcept>

namespace {
bool parse_u64(const std::string& s, std::uint64_t& out) {
  if (s.empty() || s[0] == '-') return false;
  try {
    std::size_t used = 0;
    unsigned long long v = std::stoull(s, &used);
    if (used != s.size()) return false;
    out = static_cast<std::uint64_t>(v);
    return true;
  } catch (const std::exception&) {
    return false;
  }
}

void print_factors(std::uint64_t v) {
  auto fs = sieve::prime_factors(v);
  std::cout << v << " =";
  if (fs.empty()) std::cout << " 1";
  for (std::size_t i = 0; i < fs.size(); ++i)
    std::cout << (i ? " x " : " ") << fs[i];
  std::cout << "\n";
}
}

int main(int argc, char** argv) {
  // Flags: --bench=N (repeat), --stride=K, --no-progress, --verify,
  //        --factor=V, --nth=N, --is-prime=V
  unsigned long repeats = 1;
  std::uint64_t stride = 0;   // 0 = auto (~1%)
  bool enable_progress = true, verify = false;
  std::vector<std::uint64_t> bounds, factor_qs, nth_qs;
  std::vector<long long> prime_qs;

  for (int i = 1; i < argc; ++i) {
    std::string a = argv[i];
    std::uint64_t v = 0;
    if (a.rfind("--bench=", 0) == 0) {
      if (!parse_u64(a.substr(8), v) || v == 0) { std::cerr << "skip '"<<a<<"'\n"; continue; }
      repeats = static_cast<unsigned long>(v);
    } else if (a.rfind("--stride=", 0) == 0) {
      if (!parse_u64(a.substr(9), stride)) { std::cerr << "skip '"<<a<<"'\n"; stride = 0; }
    } else if (a == "--no-progress") {
      enable_progress = false;
    } else if (a == "--verify") {
      verify = true;
    } else if (a.rfind("--factor=", 0) == 0) {
      if (!parse_u64(a.substr(9), v)) { std::cerr << "skip '"<<a<<"'\n"; continue; }
      factor_qs.push_back(v);
    } else if (a.rfind("--nth=", 0) == 0) {
      if (!parse_u64(a.substr(6), v)) { std::cerr << "skip '"<<a<<"'\n"; continue; }
      nth_qs.push_back(v);
    } else if (a.rfind("--is-prime=", 0) == 0) {
      long long s = 0;
      try { s = std::stoll(a.substr(11)); } catch (const std::exception&) { std::cerr << "skip '"<<a<<"'\n"; continue; }
      prime_qs.push_back(s);
    } else {
      if (!parse_u64(a, v)) { std::cerr << "skip '"<<a<<"'\n"; continue; }
      bounds.push_back(v);
    }
  }
  if (bounds.empty() && factor_qs.empty() && nth_qs.empty() && prime_qs.empty())
    bounds = {100};

  try {
    for (auto q : prime_qs)
      std::cout << q << (sieve::is_prime(q) ? " is prime\n" : " is not prime\n");
    for (auto q : factor_qs)
      print_factors(q);
    for (auto q : nth_qs)
      std::cout << "prime #" << q << " = " << sieve::nth_prime(q) << "\n";

    for (auto b : bounds) {
      int last = -1;
      auto progress = [&](std::uint64_t count, std::uint64_t prime) {
        if (b < 3) return;
        int pct = int(prime * 100 / b);
        if (pct / 20 > last) {  // print at ~20% steps
          std::cout << "  <"<<b<<" "<<pct<<"% ("<<count<<" primes)\n";
          last = pct / 20;
        }
      };

      std::uint64_t best = std::numeric_limits<std::uint64_t>::max(), sum = 0;
      for (unsigned long r = 0; r < repeats; ++r) {
        sieve::ScanConfig cfg{b, enable_progress, stride, verify};
        auto t0 = std::chrono::steady_clock::now();
        auto res = sieve::scan_primes(cfg, enable_progress ? progress : sieve::ProgressCb{});
        auto t1 = std::chrono::steady_clock::now();
        auto ns = std::chrono::duration_cast<std::chrono::nanoseconds>(t1 - t0).count();
        sum += ns; if ((std::uint64_t)ns < best) best = ns;
        if (repeats == 1) {
          std::cout << "primes <"<<b<<" → count="<<res.count<<" | largest="<<res.largest
                    <<(verify ? (res.verified ? " | verified" : " | UNVERIFIED") : "")
                    <<" | core(ns)="<<ns<<" | engine="<<res.engine_info<<"\n";
        }
      }
      if (repeats > 1) {
        std::cout << "primes <"<<b<<" bench repeats="<<repeats
                  <<" | best(ns)="<<best<<" | avg(ns)="<< (sum / repeats) << "\n";
      }
    }
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
  return 0;
}
