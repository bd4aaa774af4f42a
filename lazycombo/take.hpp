#ifndef LAZYCOMBO_TAKE_HPP_
#define LAZYCOMBO_TAKE_HPP_

#include "internal/iterbase.hpp"

#include <cstddef>
#include <iterator>
#include <utility>

namespace lazycombo {
  namespace impl {
    template <typename Container>
    class Taker;

    struct TakeName {
      static constexpr const char* value = "take: count";
    };

    using TakeFn = IterToolFnBindCountSecond<Taker, TakeName>;
  }
  constexpr impl::TakeFn take{};
}

// The first n elements of a sequence.  Once n elements have been yielded
// the iterator is at the end without asking the sequence for another one,
// so take can bound an infinite or expensive sequence.
template <typename Container>
class lazycombo::impl::Taker {
 private:
  Container container_;
  std::size_t count_;

  friend TakeFn;

  Taker(Container&& container, std::size_t count)
      : container_(std::forward<Container>(container)), count_{count} {}

 public:
  Taker(Taker&&) = default;

  // the end of the sequence, reached when n elements have been yielded or
  // the underlying sequence ends
  struct Sentinel {};

  class Iterator {
   private:
    iterator_type<Container> sub_iter_;
    iterator_end_type<Container> sub_end_;
    std::size_t remaining_;

    bool done() const {
      return remaining_ == 0 || !(sub_iter_ != sub_end_);
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = iterator_value<Container>;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = iterator_deref<Container>;

    Iterator(iterator_type<Container>&& sub_iter,
        iterator_end_type<Container>&& sub_end, std::size_t remaining)
        : sub_iter_{std::move(sub_iter)},
          sub_end_{std::move(sub_end)},
          remaining_{remaining} {}

    decltype(auto) operator*() {
      return *sub_iter_;
    }

    Iterator& operator++() {
      ++sub_iter_;
      --remaining_;
      return *this;
    }

    friend bool operator==(const Iterator& it, Sentinel) {
      return it.done();
    }
    friend bool operator==(Sentinel, const Iterator& it) {
      return it.done();
    }
    friend bool operator!=(const Iterator& it, Sentinel) {
      return !it.done();
    }
    friend bool operator!=(Sentinel, const Iterator& it) {
      return !it.done();
    }
  };

  Iterator begin() {
    return {get_begin(container_), get_end(container_), count_};
  }

  Sentinel end() {
    return {};
  }
};

#endif
