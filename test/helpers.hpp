#ifndef LAZYCOMBO_TEST_HELPERS_HPP_
#define LAZYCOMBO_TEST_HELPERS_HPP_

#include <lazycombo/generate.hpp>

#include <cstddef>
#include <iterator>
#include <optional>
#include <utility>
#include <vector>

namespace itertest {
  // Counts how often a producer has been asked for an element.
  struct PullCounter {
    std::size_t pulls{};
  };

  // 0, 1, 2, ... forever, recording every pull in counter
  inline auto counting_naturals(PullCounter& counter) {
    return lazycombo::generate(
        [&counter, next = 0]() mutable -> std::optional<int> {
          ++counter.pulls;
          return next++;
        });
  }

  // items one by one, recording every pull including the final one that
  // reports the end
  template <typename T>
  auto counting_items(PullCounter& counter, std::vector<T> items) {
    return lazycombo::generate(
        [&counter, items = std::move(items), pos = std::size_t{0}]() mutable
        -> std::optional<T> {
          ++counter.pulls;
          if (pos == items.size()) {
            return std::nullopt;
          }
          return items[pos++];
        });
  }

  // An iterable with only input iteration and an end sentinel of a
  // different type
  template <typename T>
  class InputOnly {
   private:
    std::vector<T> data_;

   public:
    struct Sentinel {};

    class Iterator {
     private:
      const std::vector<T>* data_p_;
      std::size_t pos_;

     public:
      using iterator_category = std::input_iterator_tag;
      using value_type = T;
      using difference_type = std::ptrdiff_t;
      using pointer = const T*;
      using reference = const T&;

      Iterator(const std::vector<T>& data, std::size_t pos)
          : data_p_{&data}, pos_{pos} {}

      const T& operator*() const {
        return (*data_p_)[pos_];
      }

      Iterator& operator++() {
        ++pos_;
        return *this;
      }

      bool operator!=(const Iterator& other) const {
        return pos_ != other.pos_;
      }

      friend bool operator!=(const Iterator& it, Sentinel) {
        return it.pos_ != it.data_p_->size();
      }
      friend bool operator!=(Sentinel s, const Iterator& it) {
        return it != s;
      }
    };

    explicit InputOnly(std::vector<T> data) : data_(std::move(data)) {}

    Iterator begin() const {
      return {data_, 0};
    }

    Sentinel end() const {
      return {};
    }
  };

  inline std::size_t binomial(std::size_t n, std::size_t k) {
    if (k > n) {
      return 0;
    }
    std::size_t result = 1;
    for (std::size_t i = 1; i <= k; ++i) {
      result = result * (n - k + i) / i;
    }
    return result;
  }
}

#endif
