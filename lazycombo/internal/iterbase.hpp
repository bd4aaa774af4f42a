#ifndef LAZYCOMBO_ITERBASE_HPP_
#define LAZYCOMBO_ITERBASE_HPP_

// This file consists of utilities shared by the lazy sequence tools.  As
// such, the contents of this file should be considered UNDOCUMENTED and
// subject to change without warning.  No user code should include this
// file directly.

#include <cstddef>
#include <iterator>
#include <stdexcept>
#include <string>
#include <type_traits>
#include <utility>

namespace lazycombo {
  namespace impl {
    namespace get_iters {
      // begin() for C arrays
      template <typename T, std::size_t N>
      T* get_begin_impl(T (&array)[N], int) {
        return array;
      }

      // Prefer member begin().
      template <typename T, typename I = decltype(std::declval<T&>().begin())>
      I get_begin_impl(T& r, int) {
        return r.begin();
      }

      // Use ADL otherwise.
      template <typename T, typename I = decltype(begin(std::declval<T&>()))>
      I get_begin_impl(T& r, long) {
        return begin(r);
      }

      template <typename T>
      auto get_begin(T& t) -> decltype(get_begin_impl(std::declval<T&>(), 42)) {
        return get_begin_impl(t, 42);
      }

      // end() for C arrays
      template <typename T, std::size_t N>
      T* get_end_impl(T (&array)[N], int) {
        return array + N;
      }

      // Prefer member end().
      template <typename T, typename I = decltype(std::declval<T&>().end())>
      I get_end_impl(T& r, int) {
        return r.end();
      }

      // Use ADL otherwise.
      template <typename T, typename I = decltype(end(std::declval<T&>()))>
      I get_end_impl(T& r, long) {
        return end(r);
      }

      template <typename T>
      auto get_end(T& t) -> decltype(get_end_impl(std::declval<T&>(), 42)) {
        return get_end_impl(t, 42);
      }
    }
    using get_iters::get_begin;
    using get_iters::get_end;

    template <typename T>
    struct type_is {
      using type = T;
    };

    // iterator_type<C> is the type of C's iterator
    template <typename T>
    using iterator_type = decltype(get_begin(std::declval<T&>()));

    // iterator_end_type<C> is the type of C's end iterator, which may be a
    // sentinel of a different type
    template <typename Container>
    using iterator_end_type = decltype(get_end(std::declval<Container&>()));

    // iterator_deref<C> is the type obtained by dereferencing an iterator
    // to an object of type C
    template <typename Container>
    using iterator_deref = decltype(*std::declval<iterator_type<Container>&>());

    // the type an element of C is stored as once it is copied out of C
    template <typename Container>
    using iterator_value = std::decay_t<iterator_deref<Container>>;

    template <typename T, typename = void>
    struct IsIterable : std::false_type {};

    // Assuming that if a type works with begin, it is an iterable.
    template <typename T>
    struct IsIterable<T, std::void_t<iterator_type<T>>> : std::true_type {};

    template <typename T>
    constexpr bool is_iterable = IsIterable<T>::value;

    // For iterators that have an operator* which returns a value
    // they can return this type from their operator-> instead, which will
    // wrap an object and allow it to be used with arrow
    template <typename T>
    class ArrowProxy {
     private:
      using TPlain = typename std::remove_reference<T>::type;
      T obj;

     public:
      constexpr ArrowProxy(T&& in_obj) : obj(std::forward<T>(in_obj)) {}

      TPlain* operator->() {
        return &obj;
      }
    };

    // Converts a user supplied count to std::size_t, rejecting negative
    // values.  what names the tool and parameter in the error message.
    template <typename Count>
    std::size_t checked_count(Count count, const char* what) {
      static_assert(std::is_integral_v<Count> && !std::is_same_v<Count, bool>,
          "count must be an integral type");
      if constexpr (std::is_signed_v<Count>) {
        if (count < 0) {
          throw std::invalid_argument(std::string{what}
                                      + " must be non-negative, got "
                                      + std::to_string(count));
        }
      }
      return static_cast<std::size_t>(count);
    }

    // allows f(x) to be 'called' as x | f
    template <typename ItTool>
    struct Pipeable {
      template <typename T>
      friend decltype(auto) operator|(T&& x, const Pipeable& p) {
        return static_cast<const ItTool&>(p)(std::forward<T>(x));
      }
    };

    // Pipeable callable which binds an integral count as the second
    // argument: f(container, n) is the same as container | f(n).
    // Negative counts are rejected when the call is made, not when the
    // sequence is first iterated.
    // Name is a type with a static constexpr const char* value used in the
    // error message.
    template <template <typename> class ItImpl, typename Name>
    struct IterToolFnBindCountSecond {
     private:
      using Size = std::size_t;
      struct FnPartial : Pipeable<FnPartial> {
        Size sz{};
        constexpr FnPartial(Size in_sz) : sz{in_sz} {}

        template <typename Container>
        auto operator()(Container&& container) const {
          return IterToolFnBindCountSecond{}(
              std::forward<Container>(container), sz);
        }
      };

     public:
      template <typename Count,
          typename = std::enable_if_t<std::is_integral_v<Count>>>
      FnPartial operator()(Count count) const {
        return {checked_count(count, Name::value)};
      }

      template <typename Container, typename Count,
          typename = std::enable_if_t<is_iterable<Container>>,
          typename = std::enable_if_t<std::is_integral_v<Count>>>
      ItImpl<Container> operator()(Container&& container, Count count) const {
        return {std::forward<Container>(container),
            checked_count(count, Name::value)};
      }
    };
  }
}

#endif
