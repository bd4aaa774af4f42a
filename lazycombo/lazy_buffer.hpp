#ifndef LAZYCOMBO_LAZY_BUFFER_HPP_
#define LAZYCOMBO_LAZY_BUFFER_HPP_

#include "internal/iterbase.hpp"

#include <cassert>
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace lazycombo {
  namespace impl {
    template <typename Container>
    class LazyBuffer;
  }
}

// LazyBuffer pulls elements out of a sequence one at a time and keeps
// every element it has pulled, so that they can be indexed randomly and
// revisited without touching the sequence again.  The sequence is not
// begun until the first pull.
//
// An lvalue Container is held by reference, an rvalue is moved in and
// owned.  The buffer keeps iterators into the container, so it can be
// neither copied nor moved.
template <typename Container>
class lazycombo::impl::LazyBuffer {
 public:
  using value_type = iterator_value<Container>;
  using size_type = std::size_t;

 private:
  Container container_;
  std::optional<iterator_type<Container>> sub_iter_;
  std::optional<iterator_end_type<Container>> sub_end_;
  std::vector<value_type> cache_;
  bool exhausted_{};

  // pulls one element out of the sequence, returns false at the end.
  // if the sequence throws, the buffer is left as it was.
  bool pull() {
    if (!sub_iter_) {
      sub_iter_.emplace(get_begin(container_));
      sub_end_.emplace(get_end(container_));
    }
    if (!(*sub_iter_ != *sub_end_)) {
      exhausted_ = true;
      return false;
    }
    cache_.push_back(**sub_iter_);
    ++*sub_iter_;
    return true;
  }

 public:
  explicit LazyBuffer(Container&& container)
      : container_(std::forward<Container>(container)) {}

  LazyBuffer(const LazyBuffer&) = delete;
  LazyBuffer& operator=(const LazyBuffer&) = delete;

  size_type size() const noexcept {
    return cache_.size();
  }

  bool exhausted() const noexcept {
    return exhausted_;
  }

  // index must refer to an element that has already been pulled
  const value_type& operator[](size_type index) const {
    assert(index < cache_.size());
    return cache_[index];
  }

  const value_type& at(size_type index) const {
    if (index >= cache_.size()) {
      throw std::out_of_range("LazyBuffer::at: index "
                              + std::to_string(index) + " with only "
                              + std::to_string(cache_.size())
                              + " elements buffered");
    }
    return cache_[index];
  }

  // Pulls the next element into the buffer.  Returns false, without
  // touching the sequence, once the sequence has ended.
  bool fetch() {
    if (exhausted_) {
      return false;
    }
    return pull();
  }

  // Pulls until at least target elements are buffered or the sequence
  // ends, whichever comes first.
  void prefill(size_type target) {
    if (exhausted_) {
      return;
    }
    while (cache_.size() < target && pull()) {
    }
  }
};

#endif
