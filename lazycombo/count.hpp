#ifndef LAZYCOMBO_COUNT_HPP_
#define LAZYCOMBO_COUNT_HPP_

#include "internal/iterbase.hpp"

#include <cstddef>
#include <iterator>
#include <type_traits>

namespace lazycombo {
  namespace impl {
    template <typename T>
    class Counter;
  }

  // start, start + step, start + 2 * step, ... without end
  template <typename T>
  constexpr impl::Counter<T> count(T start, T step) noexcept;

  template <typename T = long>
  constexpr impl::Counter<T> count(T start = T(0)) noexcept;
}

template <typename T>
class lazycombo::impl::Counter {
  static_assert(std::is_arithmetic_v<T>, "count requires an arithmetic type");

  template <typename U>
  friend constexpr Counter<U> lazycombo::count(U, U) noexcept;

 private:
  T start_;
  T step_;

  constexpr Counter(T start, T step) noexcept : start_{start}, step_{step} {}

 public:
  // the end of an infinite sequence, never reached
  struct Sentinel {};

  class Iterator {
   private:
    T value_{};
    T step_{};

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = T;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type;

    constexpr Iterator() noexcept = default;
    constexpr Iterator(T value, T step) noexcept : value_{value}, step_{step} {}

    constexpr T operator*() const noexcept {
      return value_;
    }

    constexpr ArrowProxy<T> operator->() const noexcept {
      return {**this};
    }

    Iterator& operator++() noexcept {
      value_ += step_;
      return *this;
    }

    Iterator operator++(int) noexcept {
      auto ret = *this;
      ++*this;
      return ret;
    }

    constexpr bool operator==(const Iterator& other) const noexcept {
      return value_ == other.value_;
    }

    constexpr bool operator!=(const Iterator& other) const noexcept {
      return !(*this == other);
    }

    friend constexpr bool operator==(const Iterator&, Sentinel) noexcept {
      return false;
    }
    friend constexpr bool operator==(Sentinel, const Iterator&) noexcept {
      return false;
    }
    friend constexpr bool operator!=(const Iterator&, Sentinel) noexcept {
      return true;
    }
    friend constexpr bool operator!=(Sentinel, const Iterator&) noexcept {
      return true;
    }
  };

  constexpr Iterator begin() const noexcept {
    return {start_, step_};
  }

  constexpr Sentinel end() const noexcept {
    return {};
  }
};

template <typename T>
constexpr lazycombo::impl::Counter<T> lazycombo::count(
    T start, T step) noexcept {
  return {start, step};
}

template <typename T>
constexpr lazycombo::impl::Counter<T> lazycombo::count(T start) noexcept {
  return count(start, T(1));
}

#endif
