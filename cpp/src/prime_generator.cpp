// src/prime_generator.cpp
#include "sieve/prime_generator.hpp"

#include <array>
#include <stdexcept>
#include <vector>

namespace sieve {
namespace {
constexpr std::array<std::uint64_t, 4> kSeeds = {2, 3, 5, 7};
} // namespace

PrimeGenerator::PrimeGenerator(std::optional<std::uint64_t> max_exclusive)
    : max_(max_exclusive),
      cursors_(CursorCompare{}, std::vector<Cursor>{Cursor(3), Cursor(5),
                                                    Cursor(7)}) {}

std::optional<std::uint64_t> PrimeGenerator::next() {
  switch (state_) {
  case State::EmitSeeds:
    if (seed_index_ < kSeeds.size()) {
      const std::uint64_t seed = kSeeds[seed_index_++];
      if (!below_max(seed)) {
        state_ = State::Done;
        return std::nullopt;
      }
      last_ = seed;
      return seed;
    }
    state_ = State::Sift;
    break;
  case State::Advance:
    // The prime handed out last time gets its own cursor, starting at itself.
    cursors_.insert(Cursor(candidate_));
    candidate_ = checked_add(candidate_, 2);
    state_ = State::Sift;
    break;
  case State::Sift:
    break;
  case State::Done:
    return std::nullopt;
  }

  auto prime = sift();
  if (!prime) {
    state_ = State::Done;
    return std::nullopt;
  }

#if defined(SIEVE_ENABLE_DEBUG_INVARIANTS) || !defined(NDEBUG)
  if (*prime <= last_ || (*prime & 1u) == 0)
    throw std::logic_error("sieve invariant violated: non-ascending output");
#endif
  last_ = *prime;
  state_ = State::Advance;
  return prime;
}

// Catch the smallest cursors up to candidate_. A cursor landing on it marks
// it composite and moves on to the next odd number; a minimum strictly above
// it means no prime <= candidate_ divides it.
std::optional<std::uint64_t> PrimeGenerator::sift() {
  for (;;) {
    if (!below_max(candidate_))
      return std::nullopt;

    Cursor &min = cursors_.peek_min();
    if (min.current() > candidate_)
      return candidate_;

    if (min.current() == candidate_) {
      candidate_ = checked_add(candidate_, 2);
      continue;
    }

    min.advance();
    cursors_.resift_min();
  }
}

} // namespace sieve
