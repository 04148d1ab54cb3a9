// include/sieve/cursor.hpp
#pragma once
#include <cstdint>
#include <limits>
#include <stdexcept>

namespace sieve {

// a + b, throwing instead of wrapping past 2^64 - 1.
inline std::uint64_t checked_add(std::uint64_t a, std::uint64_t b) {
  if (a > std::numeric_limits<std::uint64_t>::max() - b)
    throw std::overflow_error("sieve: 64-bit overflow");
  return a + b;
}

// Walks the multiples of one base prime: p, 2p, 3p, ...
class Cursor {
public:
  explicit Cursor(std::uint64_t base) noexcept : base_(base), current_(base) {}

  std::uint64_t base() const noexcept { return base_; }
  std::uint64_t current() const noexcept { return current_; }

  // Step to the next multiple. Throws std::overflow_error past 2^64 - 1.
  std::uint64_t advance() {
    current_ = checked_add(current_, base_);
    return current_;
  }

private:
  std::uint64_t base_;
  std::uint64_t current_;
};

// Three-way ordering on the current multiple.
struct CursorCompare {
  int operator()(const Cursor &a, const Cursor &b) const noexcept {
    return a.current() < b.current() ? -1 : (a.current() > b.current() ? 1 : 0);
  }
};

} // namespace sieve
