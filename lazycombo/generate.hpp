#ifndef LAZYCOMBO_GENERATE_HPP_
#define LAZYCOMBO_GENERATE_HPP_

#include "internal/iterbase.hpp"

#include <cassert>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>

namespace lazycombo {
  namespace impl {
    template <typename Func>
    class Generator;

    template <typename T>
    struct IsOptional : std::false_type {};

    template <typename T>
    struct IsOptional<std::optional<T>> : std::true_type {};

    struct GenerateFn {
      template <typename Func>
      Generator<std::decay_t<Func>> operator()(Func&& func) const {
        return {std::forward<Func>(func)};
      }
    };
  }
  constexpr impl::GenerateFn generate{};
}

// Turns a pull function into a single pass sequence.  func() returns the
// next element wrapped in a std::optional, or std::nullopt once there are
// no more elements.  func is only called when an element is actually
// needed, once per element, and never again after it returns std::nullopt.
template <typename Func>
class lazycombo::impl::Generator {
 private:
  using Result = std::invoke_result_t<Func&>;
  static_assert(IsOptional<Result>::value,
      "generate requires a function returning std::optional");
  using Item = typename Result::value_type;

  enum class State { Empty, Ready, Done };

  Func func_;
  std::optional<Item> current_;
  State state_{State::Empty};

  friend GenerateFn;

  Generator(Func&& func) : func_(std::move(func)) {}
  Generator(const Func& func) : func_(func) {}

  // makes sure current_ holds the next element if there is one
  bool ready() {
    if (state_ == State::Empty) {
      current_ = std::invoke(func_);
      state_ = current_ ? State::Ready : State::Done;
    }
    return state_ == State::Ready;
  }

  void consume() {
    ready();
    if (state_ == State::Ready) {
      current_.reset();
      state_ = State::Empty;
    }
  }

 public:
  Generator(Generator&&) = default;

  // All iterators of one Generator share its position.  Any two iterators
  // that are not at the end compare equal.
  class Iterator {
   private:
    Generator* gen_p_{};

    bool at_end() const {
      return gen_p_ == nullptr || !gen_p_->ready();
    }

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = Item;
    using difference_type = std::ptrdiff_t;
    using pointer = value_type*;
    using reference = value_type&;

    Iterator() = default;
    explicit Iterator(Generator& gen) : gen_p_{&gen} {}

    Item& operator*() const {
      [[maybe_unused]] bool has_item = gen_p_->ready();
      assert(has_item);
      return *gen_p_->current_;
    }

    Item* operator->() const {
      return &**this;
    }

    Iterator& operator++() {
      gen_p_->consume();
      return *this;
    }

    bool operator==(const Iterator& other) const {
      return at_end() == other.at_end();
    }

    bool operator!=(const Iterator& other) const {
      return !(*this == other);
    }
  };

  Iterator begin() {
    return Iterator{*this};
  }

  Iterator end() {
    return {};
  }
};

#endif
