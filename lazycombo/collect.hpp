#ifndef LAZYCOMBO_COLLECT_HPP_
#define LAZYCOMBO_COLLECT_HPP_

#include "internal/iterbase.hpp"

#include <utility>
#include <vector>

namespace lazycombo {
  namespace impl {
    // Copies every element of a finite sequence into a std::vector.
    // Usable as collect(seq) or seq | collect.
    struct CollectFn : Pipeable<CollectFn> {
      template <typename Container,
          typename = std::enable_if_t<is_iterable<Container>>>
      std::vector<iterator_value<Container>> operator()(
          Container&& container) const {
        std::vector<iterator_value<Container>> result;
        auto end_it = get_end(container);
        for (auto it = get_begin(container); it != end_it; ++it) {
          result.push_back(*it);
        }
        return result;
      }
    };
  }
  constexpr impl::CollectFn collect{};
}

#endif
