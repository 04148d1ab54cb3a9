#include "sieve/cursor.hpp"
#include "sieve/ordered_list.hpp"
#include <catch2/catch_test_macros.hpp>
#include <algorithm>
#include <cstdint>
#include <limits>
#include <stdexcept>
#include <vector>

namespace {
struct IntCompare {
  int operator()(int a, int b) const { return a < b ? -1 : (a > b ? 1 : 0); }
};
using IntList = sieve::OrderedList<int, IntCompare>;

std::vector<int> drain(IntList& list) {
  std::vector<int> out;
  while (!list.empty()) out.push_back(list.pop_min());
  return out;
}
}

TEST_CASE("Any insertion order drains in sorted order") {
  std::vector<int> values{9, 4, 4, 17, 1, 0, 12};
  std::vector<int> sorted = values;
  std::sort(sorted.begin(), sorted.end());

  std::sort(values.begin(), values.end());
  do {
    IntList list{IntCompare{}};
    for (int v : values) list.insert(v);
    REQUIRE(list.size() == values.size());
    REQUIRE(list.is_sorted());
    REQUIRE(drain(list) == sorted);
  } while (std::next_permutation(values.begin(), values.end()));
}

TEST_CASE("Construction sorts the initial values once") {
  IntList list{IntCompare{}, {7, 3, 5}};
  REQUIRE(list.size() == 3);
  REQUIRE(list.peek_min() == 3);
  list.insert(4);
  list.insert(3);
  REQUIRE(drain(list) == std::vector<int>{3, 3, 4, 5, 7});
}

TEST_CASE("Insert into an empty list gives a single node") {
  IntList list{IntCompare{}};
  REQUIRE(list.empty());
  list.insert(42);
  REQUIRE(list.size() == 1);
  REQUIRE(list.peek_min() == 42);
}

TEST_CASE("Empty list fails fast") {
  IntList list{IntCompare{}};
  REQUIRE_THROWS_AS(list.peek_min(), sieve::EmptyError);
  REQUIRE_THROWS_AS(list.pop_min(), sieve::EmptyError);
  REQUIRE_THROWS_AS(list.resift_min(), sieve::EmptyError);
}

TEST_CASE("Mutating the head then resifting keeps the list sorted") {
  using sieve::Cursor;
  sieve::OrderedList<Cursor, sieve::CursorCompare> list{
      sieve::CursorCompare{}, {Cursor(7), Cursor(3), Cursor(5)}};

  std::vector<std::uint64_t> seen;
  for (int i = 0; i < 12; ++i) {
    Cursor& min = list.peek_min();
    seen.push_back(min.current());
    min.advance();
    list.resift_min();
    REQUIRE(list.is_sorted());
    REQUIRE(list.size() == 3);
  }
  // Merged multiples of 3, 5 and 7; ties come out adjacent.
  REQUIRE(seen == std::vector<std::uint64_t>{3, 5, 6, 7, 9, 10, 12, 14, 15, 15, 18, 20});
}

TEST_CASE("Long chains tear down without recursion") {
  IntList list{IntCompare{}};
  for (int i = 200000; i > 0; --i) list.insert(i);  // each lands at the head
  REQUIRE(list.size() == 200000);
  REQUIRE(list.peek_min() == 1);
}

TEST_CASE("Cursor steps by its base and refuses to wrap") {
  sieve::Cursor c(13);
  REQUIRE(c.current() == 13);
  REQUIRE(c.advance() == 26);
  REQUIRE(c.advance() == 39);
  REQUIRE(c.base() == 13);

  // Largest prime below 2^64.
  sieve::Cursor big(18446744073709551557ull);
  REQUIRE_THROWS_AS(big.advance(), std::overflow_error);
  REQUIRE(big.current() == 18446744073709551557ull);

  REQUIRE_THROWS_AS(sieve::checked_add(std::numeric_limits<std::uint64_t>::max(), 1),
                    std::overflow_error);
}
