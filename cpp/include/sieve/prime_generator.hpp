// include/sieve/prime_generator.hpp
#pragma once
#include <cstddef>
#include <cstdint>
#include <iterator>
#include <optional>

#include "cursor.hpp"
#include "ordered_list.hpp"

namespace sieve {

// Incremental (rotating) sieve of Eratosthenes.
//
// Keeps one Cursor per odd prime found so far in an OrderedList keyed by the
// cursor's next multiple. Each odd candidate is tested by catching the
// smallest cursors up to it: if one lands on the candidate it is composite,
// otherwise it is prime and gets a cursor of its own.
//
// Values are pulled one at a time with next(). Memory grows by one cursor per
// prime emitted. A generator is single-use and move-only; call primes() again
// for a fresh stream.
class PrimeGenerator {
public:
  // nullopt => unbounded. Otherwise only primes < max_exclusive are produced.
  explicit PrimeGenerator(std::optional<std::uint64_t> max_exclusive = {});

  PrimeGenerator(PrimeGenerator &&) noexcept = default;
  PrimeGenerator &operator=(PrimeGenerator &&) noexcept = default;

  // Next prime in ascending order, or nullopt once the bound is reached.
  // Throws std::overflow_error if the sieve would pass 2^64 - 1.
  std::optional<std::uint64_t> next();

  bool done() const noexcept { return state_ == State::Done; }
  std::optional<std::uint64_t> max_exclusive() const noexcept { return max_; }

  // Number of cursors held (every prime > 2 emitted so far, plus the seeds).
  std::size_t cursor_count() const noexcept { return cursors_.size(); }

  class iterator {
  public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::uint64_t;
    using difference_type = std::ptrdiff_t;
    using pointer = const std::uint64_t *;
    using reference = const std::uint64_t &;

    iterator() = default;
    explicit iterator(PrimeGenerator *gen) : gen_(gen) { ++*this; }

    reference operator*() const { return value_; }
    iterator &operator++() {
      auto v = gen_->next();
      if (v)
        value_ = *v;
      else
        gen_ = nullptr;
      return *this;
    }
    void operator++(int) { ++*this; }

    bool operator==(const iterator &o) const { return gen_ == o.gen_; }
    bool operator!=(const iterator &o) const { return gen_ != o.gen_; }

  private:
    PrimeGenerator *gen_ = nullptr;
    std::uint64_t value_ = 0;
  };

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

private:
  enum class State { EmitSeeds, Sift, Advance, Done };

  bool below_max(std::uint64_t v) const noexcept { return !max_ || v < *max_; }
  std::optional<std::uint64_t> sift();

  std::optional<std::uint64_t> max_;
  State state_ = State::EmitSeeds;
  std::size_t seed_index_ = 0;
  std::uint64_t candidate_ = 11;
  std::uint64_t last_ = 0;
  OrderedList<Cursor, CursorCompare> cursors_;
};

// Fresh, independent prime stream; infinite when max_exclusive is omitted.
inline PrimeGenerator primes(std::optional<std::uint64_t> max_exclusive = {}) {
  return PrimeGenerator(max_exclusive);
}

} // namespace sieve
