#ifndef LAZYCOMBO_COMBINATIONS_HPP_
#define LAZYCOMBO_COMBINATIONS_HPP_

#include "internal/iterbase.hpp"
#include "lazy_buffer.hpp"

#include <cassert>
#include <cstddef>
#include <iterator>
#include <memory>
#include <numeric>
#include <utility>
#include <vector>

namespace lazycombo {
  namespace impl {
    template <typename Container>
    class Combinator;

    struct CombinationsName {
      static constexpr const char* value = "combinations: k";
    };

    using CombinationsFn =
        IterToolFnBindCountSecond<Combinator, CombinationsName>;
  }
  constexpr impl::CombinationsFn combinations{};
}

// Yields every k-element selection of the container's elements, ordered
// lexicographically by index.  Elements are pulled from the container only
// when the enumeration first needs them and are kept for the lifetime of
// the Combinator, so iterating a second time yields the same combinations
// without consuming the container again.  Works with infinite sequences as
// long as iteration is stopped by the caller.
template <typename Container>
class lazycombo::impl::Combinator {
 private:
  using Pool = LazyBuffer<Container>;

  std::unique_ptr<Pool> pool_;
  std::size_t k_;

  friend CombinationsFn;

  Combinator(Container&& container, std::size_t k)
      : pool_{std::make_unique<Pool>(std::forward<Container>(container))},
        k_{k} {
    pool_->prefill(k_);
  }

 public:
  Combinator(Combinator&&) = default;

  class Iterator {
   private:
    constexpr static const std::ptrdiff_t COMPLETE = -1;
    Pool* pool_p_{};
    std::vector<std::size_t> indices_;
    std::ptrdiff_t steps_{COMPLETE};

    // Moves indices_ to the next combination, fetching one more element
    // whenever the last index reaches the end of the buffer.  Returns
    // false when there is no next combination.
    bool advance() {
      auto& pool = *pool_p_;
      const std::size_t k = indices_.size();
      if (k == 0 || (pool.exhausted() && pool.size() == 0)) {
        return false;
      }

      if (indices_.back() == pool.size() - 1) {
        pool.fetch();
      }
      const std::size_t n = pool.size();

      // position i is pinned when it holds its largest value, i + n - k
      std::size_t i = k - 1;
      while (indices_[i] == i + n - k) {
        if (i == 0) {
          return false;
        }
        --i;
      }

      ++indices_[i];
      for (std::size_t j = i + 1; j < k; ++j) {
        indices_[j] = indices_[j - 1] + 1;
      }
      return true;
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = std::vector<typename Pool::value_type>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type;

    // the end iterator
    Iterator() = default;

    // indices_ is only sized once the buffer holds k elements
    Iterator(Pool& pool, std::size_t k) : pool_p_{&pool} {
      pool.prefill(k);
      if (k > pool.size()) {
        return;
      }
      indices_.resize(k);
      std::iota(indices_.begin(), indices_.end(), std::size_t{0});
      steps_ = 0;
    }

    // the positions in the buffer of the current combination's elements
    const std::vector<std::size_t>& indices() const noexcept {
      return indices_;
    }

    // Copies the current combination out of the buffer.  Every call
    // returns an independent vector.
    value_type operator*() const {
      assert(steps_ != COMPLETE);
      value_type combination;
      combination.reserve(indices_.size());
      for (auto idx : indices_) {
        combination.push_back((*pool_p_)[idx]);
      }
      return combination;
    }

    ArrowProxy<value_type> operator->() const {
      return {**this};
    }

    Iterator& operator++() {
      assert(steps_ != COMPLETE);
      if (advance()) {
        ++steps_;
      } else {
        steps_ = COMPLETE;
      }
      return *this;
    }

    Iterator operator++(int) {
      auto ret = *this;
      ++*this;
      return ret;
    }

    bool operator!=(const Iterator& other) const {
      return !(*this == other);
    }

    bool operator==(const Iterator& other) const {
      return steps_ == other.steps_;
    }
  };

  // Starts a new traversal from the first combination.  Elements
  // buffered by earlier traversals are reused.
  Iterator begin() {
    return {*pool_, k_};
  }

  Iterator end() {
    return {};
  }

  std::size_t k() const noexcept {
    return k_;
  }

  // number of elements pulled from the container so far
  std::size_t buffered() const noexcept {
    return pool_->size();
  }
};

#endif
