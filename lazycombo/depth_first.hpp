#ifndef LAZYCOMBO_DEPTH_FIRST_HPP_
#define LAZYCOMBO_DEPTH_FIRST_HPP_

#include "internal/iterbase.hpp"

#include <cassert>
#include <cstddef>
#include <functional>
#include <iterator>
#include <optional>
#include <type_traits>
#include <utility>
#include <vector>

namespace lazycombo {
  // One step of a depth first traversal.  parent is empty for the root,
  // whose level is 0.
  template <typename Node>
  struct TreeVisit {
    Node node;
    std::size_t level;
    std::optional<Node> parent;
  };

  namespace impl {
    template <typename Node, typename ChildrenFunc>
    class DepthFirst;

    struct DepthFirstFn {
      template <typename Node, typename ChildrenFunc>
      DepthFirst<std::decay_t<Node>, std::decay_t<ChildrenFunc>> operator()(
          Node&& root, ChildrenFunc&& children) const {
        return {std::forward<Node>(root),
            std::forward<ChildrenFunc>(children)};
      }
    };
  }
  constexpr impl::DepthFirstFn depth_first{};
}

// Pre-order traversal of a tree.  Nodes are cheap handles (usually
// pointers) and children(node) returns an iterable of the node's children.
// Pending nodes are kept on an explicit stack, so the depth of the tree is
// limited by memory rather than by the call stack.  A node's children are
// requested when the traversal moves past that node.
template <typename Node, typename ChildrenFunc>
class lazycombo::impl::DepthFirst {
 private:
  Node root_;
  mutable ChildrenFunc children_;

  friend DepthFirstFn;

  DepthFirst(Node root, ChildrenFunc children)
      : root_(std::move(root)), children_(std::move(children)) {}

 public:
  DepthFirst(DepthFirst&&) = default;

  class Iterator {
   private:
    constexpr static const std::ptrdiff_t COMPLETE = -1;
    ChildrenFunc* children_p_{};
    std::vector<TreeVisit<Node>> pending_;
    std::ptrdiff_t steps_{COMPLETE};

   public:
    using iterator_category = std::input_iterator_tag;
    using value_type = TreeVisit<Node>;
    using difference_type = std::ptrdiff_t;
    using pointer = const value_type*;
    using reference = const value_type&;

    Iterator() = default;

    Iterator(const Node& root, ChildrenFunc& children)
        : children_p_{&children}, steps_{0} {
      pending_.push_back({root, 0, std::nullopt});
    }

    const TreeVisit<Node>& operator*() const {
      assert(!pending_.empty());
      return pending_.back();
    }

    const TreeVisit<Node>* operator->() const {
      return &**this;
    }

    Iterator& operator++() {
      assert(!pending_.empty());
      TreeVisit<Node> visited = std::move(pending_.back());
      pending_.pop_back();

      // children go on the stack last first so the first child is on top
      std::vector<Node> children;
      auto&& kids = std::invoke(*children_p_, visited.node);
      auto end_it = get_end(kids);
      for (auto it = get_begin(kids); it != end_it; ++it) {
        children.push_back(*it);
      }
      for (auto it = children.rbegin(); it != children.rend(); ++it) {
        pending_.push_back({std::move(*it), visited.level + 1, visited.node});
      }

      if (pending_.empty()) {
        steps_ = COMPLETE;
      } else {
        ++steps_;
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

  Iterator begin() const {
    return {root_, children_};
  }

  Iterator end() const {
    return {};
  }
};

#endif
