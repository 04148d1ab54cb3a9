#include "sieve/prime_generator.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdint>
#include <optional>
#include <vector>

namespace {
std::vector<std::uint64_t> collect(std::optional<std::uint64_t> bound) {
  std::vector<std::uint64_t> out;
  for (auto p : sieve::primes(bound)) out.push_back(p);
  return out;
}

// Plain array sieve used as the reference.
std::vector<std::uint64_t> reference_primes(std::uint64_t bound) {
  std::vector<bool> composite(bound, false);
  std::vector<std::uint64_t> out;
  for (std::uint64_t i = 2; i < bound; ++i) {
    if (composite[i]) continue;
    out.push_back(i);
    for (std::uint64_t j = i * i; j < bound; j += i) composite[j] = true;
  }
  return out;
}
}

TEST_CASE("First ten primes from an unbounded stream") {
  auto gen = sieve::primes();
  std::vector<std::uint64_t> got;
  for (int i = 0; i < 10; ++i) {
    auto p = gen.next();
    REQUIRE(p.has_value());
    got.push_back(*p);
  }
  REQUIRE(got == std::vector<std::uint64_t>{2, 3, 5, 7, 11, 13, 17, 19, 23, 29});
  REQUIRE_FALSE(gen.done());
}

TEST_CASE("Bounded stream matches a reference sieve") {
  for (std::uint64_t bound : {4u, 8u, 11u, 12u, 13u, 14u, 50u, 121u, 122u, 1000u, 10000u}) {
    INFO("bound = " << bound);
    REQUIRE(collect(bound) == reference_primes(bound));
  }
}

TEST_CASE("Bounds that exclude every prime give an empty stream") {
  REQUIRE(collect(0u).empty());
  REQUIRE(collect(1u).empty());
  REQUIRE(collect(2u).empty());
}

TEST_CASE("Seeds are filtered by the bound like any other prime") {
  REQUIRE(collect(3u) == std::vector<std::uint64_t>{2});
  REQUIRE(collect(4u) == std::vector<std::uint64_t>{2, 3});
  REQUIRE(collect(7u) == std::vector<std::uint64_t>{2, 3, 5});
  REQUIRE(collect(8u) == std::vector<std::uint64_t>{2, 3, 5, 7});
}

TEST_CASE("Exhausted stream stays exhausted") {
  auto gen = sieve::primes(20u);
  while (gen.next()) {}
  REQUIRE(gen.done());
  REQUIRE_FALSE(gen.next().has_value());
  REQUIRE_FALSE(gen.next().has_value());
}

TEST_CASE("Independent streams do not share state") {
  auto a = sieve::primes();
  auto b = sieve::primes();
  for (int i = 0; i < 100; ++i) a.next();
  REQUIRE(*b.next() == 2);
  REQUIRE(*a.next() == 547);  // the 101st prime
}

TEST_CASE("One cursor is kept per odd prime emitted") {
  auto gen = sieve::primes();
  REQUIRE(gen.cursor_count() == 3);  // 3, 5, 7
  std::uint64_t last = 0;
  for (int i = 0; i < 1000; ++i) last = *gen.next();
  REQUIRE(last == 7919);
  // The cursor for the last prime is added on the following pull.
  REQUIRE(gen.cursor_count() == 998);
  gen.next();
  REQUIRE(gen.cursor_count() == 999);
}

TEST_CASE("Moved-from generator hands over its position") {
  auto a = sieve::primes(100u);
  a.next();
  a.next();
  sieve::PrimeGenerator b = std::move(a);
  REQUIRE(*b.next() == 5);
  REQUIRE(b.max_exclusive() == std::optional<std::uint64_t>{100u});
}
