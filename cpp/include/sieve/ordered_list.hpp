// include/sieve/ordered_list.hpp
#pragma once
#include <algorithm>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <utility>
#include <vector>

namespace sieve {

// Thrown when the head of an empty OrderedList is requested.
class EmptyError : public std::out_of_range {
public:
  using std::out_of_range::out_of_range;
};

// Singly linked list kept in ascending order under a three-way comparator
// (compare(a, b) < 0 / == 0 / > 0). Ties sit next to each other in no
// particular order.
//
// The head can be mutated in place through peek_min() and then re-threaded
// with resift_min(); the node is reused, nothing is reallocated.
template <typename T, typename Compare> class OrderedList {
  struct Node {
    explicit Node(T v) : value(std::move(v)) {}
    T value;
    std::unique_ptr<Node> next;
  };

public:
  explicit OrderedList(Compare compare) : compare_(std::move(compare)) {}

  OrderedList(Compare compare, std::vector<T> values)
      : compare_(std::move(compare)) {
    std::sort(values.begin(), values.end(), [this](const T &a, const T &b) {
      return compare_(a, b) < 0;
    });
    std::unique_ptr<Node> *tail = &head_;
    for (auto &v : values) {
      *tail = std::make_unique<Node>(std::move(v));
      tail = &(*tail)->next;
    }
    size_ = values.size();
  }

  OrderedList(OrderedList &&) noexcept = default;
  OrderedList &operator=(OrderedList &&) noexcept = default;
  OrderedList(const OrderedList &) = delete;
  OrderedList &operator=(const OrderedList &) = delete;

  // Unlink iteratively; the default recursive unique_ptr teardown would
  // blow the stack on long chains.
  ~OrderedList() {
    while (head_)
      head_ = std::move(head_->next);
  }

  void insert(T value) {
    link(std::make_unique<Node>(std::move(value)));
    ++size_;
  }

  T &peek_min() {
    if (!head_)
      throw EmptyError("peek_min on empty OrderedList");
    return head_->value;
  }
  const T &peek_min() const {
    if (!head_)
      throw EmptyError("peek_min on empty OrderedList");
    return head_->value;
  }

  // Re-position the head after its key was changed through peek_min().
  void resift_min() {
    if (!head_)
      throw EmptyError("resift_min on empty OrderedList");
    if (!head_->next || compare_(head_->value, head_->next->value) <= 0)
      return; // still the minimum
    std::unique_ptr<Node> node = std::move(head_);
    head_ = std::move(node->next);
    link(std::move(node));
  }

  T pop_min() {
    if (!head_)
      throw EmptyError("pop_min on empty OrderedList");
    std::unique_ptr<Node> node = std::move(head_);
    head_ = std::move(node->next);
    --size_;
    return std::move(node->value);
  }

  std::size_t size() const noexcept { return size_; }
  bool empty() const noexcept { return !head_; }

  // True when every adjacent pair satisfies compare(a, b) <= 0.
  bool is_sorted() const {
    for (const Node *n = head_.get(); n && n->next; n = n->next.get())
      if (compare_(n->value, n->next->value) > 0)
        return false;
    return true;
  }

private:
  // Thread a detached node in front of the first element that is not less
  // than it.
  void link(std::unique_ptr<Node> node) {
    std::unique_ptr<Node> *slot = &head_;
    while (*slot && compare_((*slot)->value, node->value) < 0)
      slot = &(*slot)->next;
    node->next = std::move(*slot);
    *slot = std::move(node);
  }

  Compare compare_;
  std::unique_ptr<Node> head_;
  std::size_t size_ = 0;
};

} // namespace sieve
