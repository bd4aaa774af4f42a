#include <lazycombo/collect.hpp>
#include <lazycombo/count.hpp>
#include <lazycombo/generate.hpp>
#include <lazycombo/take.hpp>

#include "helpers.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

using itertest::PullCounter;

TEST(Generate, YieldsUntilNullopt) {
  PullCounter counter;
  auto g = itertest::counting_items<std::string>(counter, {"a", "b", "c"});
  auto v = lazycombo::collect(g);
  EXPECT_EQ(v, (std::vector<std::string>{"a", "b", "c"}));
  EXPECT_EQ(counter.pulls, 4u);
}

TEST(Generate, PullsOnlyWhenAnElementIsNeeded) {
  PullCounter counter;
  auto g = itertest::counting_naturals(counter);
  auto it = g.begin();
  EXPECT_EQ(counter.pulls, 0u);

  EXPECT_TRUE(it != g.end());
  EXPECT_TRUE(it != g.end());
  EXPECT_EQ(counter.pulls, 1u);
  EXPECT_EQ(*it, 0);
  EXPECT_EQ(*it, 0);
  EXPECT_EQ(counter.pulls, 1u);

  ++it;
  EXPECT_EQ(counter.pulls, 1u);
  EXPECT_EQ(*it, 1);
  EXPECT_EQ(counter.pulls, 2u);
}

TEST(Generate, IncrementWithoutLookingConsumesAnElement) {
  PullCounter counter;
  auto g = itertest::counting_naturals(counter);
  auto it = g.begin();
  ++it;
  ++it;
  EXPECT_EQ(*it, 2);
  EXPECT_EQ(counter.pulls, 3u);
}

TEST(Generate, NeverCalledAgainAfterTheEnd) {
  PullCounter counter;
  auto g = itertest::counting_items<int>(counter, {1});
  auto it = g.begin();
  ASSERT_TRUE(it != g.end());
  ++it;
  EXPECT_TRUE(it == g.end());
  EXPECT_TRUE(it == g.end());
  ++it;
  EXPECT_TRUE(it == g.end());
  EXPECT_EQ(counter.pulls, 2u);
}

TEST(Generate, SinglePass) {
  PullCounter counter;
  auto g = itertest::counting_naturals(counter);
  auto first = lazycombo::collect(lazycombo::take(g, 2));
  auto second = lazycombo::collect(lazycombo::take(g, 2));
  EXPECT_EQ(first, (std::vector<int>{0, 1}));
  EXPECT_EQ(second, (std::vector<int>{2, 3}));
}

TEST(Generate, EmptyProducer) {
  auto g = lazycombo::generate([]() -> std::optional<double> {
    return std::nullopt;
  });
  EXPECT_TRUE(g.begin() == g.end());
}

TEST(Count, DefaultsToNaturalNumbers) {
  auto v = lazycombo::collect(lazycombo::take(lazycombo::count(), 4));
  EXPECT_EQ(v, (std::vector<long>{0, 1, 2, 3}));
}

TEST(Count, StartAndStep) {
  auto v = lazycombo::collect(lazycombo::take(lazycombo::count(3, -2), 4));
  EXPECT_EQ(v, (std::vector<int>{3, 1, -1, -3}));
}

TEST(Count, FloatingPoint) {
  auto v = lazycombo::collect(lazycombo::take(lazycombo::count(0.5, 0.25), 3));
  EXPECT_EQ(v, (std::vector<double>{0.5, 0.75, 1.0}));
}
