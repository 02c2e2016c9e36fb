#include <cursor.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <vector>

#include "include/pull_counter.hpp"
#include "main.hpp"

template <typename Item>
class AnyStrategy : public ::testing::Test {
public:
  std::vector<Item> items;

  virtual void SetUp()
  {
    std::vector<Item> copy {{ 1, 2, 3, 4, 5, 6, 7 }};
    items = copy;
  }
};

using ItemTypes = ::testing::Types<
  std::uint8_t,
  int,
  char,
  std::uint64_t
>;

TYPED_TEST_CASE(AnyStrategy, ItemTypes);

TYPED_TEST(AnyStrategy, NextItems)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  auto got = c.template any<3>().extract();
  ASSERT_TRUE(got.ok());
  std::array<TypeParam, 3> exp {{ 1, 2, 3 }};
  ASSERT_EQ(exp, got.value());
  ASSERT_EQ(3U, c.count());
}

TYPED_TEST(AnyStrategy, WholeSource)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  auto got = c.template any<7>().extract();
  ASSERT_TRUE(got.ok());
  ASSERT_TRUE(std::equal(this->items.begin(), this->items.end(), got.value().begin()));
  ASSERT_EQ(7U, c.count());

  auto past = c.template any<1>().extract();
  ASSERT_FALSE(past.ok());
  ASSERT_EQ(pullmatch::pattern_errc::not_found, past.error().kind());
  ASSERT_EQ(7U, c.count());
}

TYPED_TEST(AnyStrategy, ShortSource)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  auto head = c.template any<2>().extract();
  ASSERT_TRUE(head.ok());

  auto got = c.template any<10>().extract();
  ASSERT_FALSE(got.ok());
  ASSERT_EQ(pullmatch::pattern_errc::not_found, got.error().kind());
  ASSERT_EQ(7U, got.error().position());
  // Whatever remained was consumed
  ASSERT_EQ(7U, c.count());
}

TYPED_TEST(AnyStrategy, SequentialWindows)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  auto first  = c.template any<2>().extract();
  auto second = c.template any<3>().extract();
  auto third  = c.template any<2>().extract();
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  ASSERT_TRUE(third.ok());

  std::array<TypeParam, 2> exp_first  {{ 1, 2 }};
  std::array<TypeParam, 3> exp_second {{ 3, 4, 5 }};
  std::array<TypeParam, 2> exp_third  {{ 6, 7 }};
  ASSERT_EQ(exp_first,  first.value());
  ASSERT_EQ(exp_second, second.value());
  ASSERT_EQ(exp_third,  third.value());
  ASSERT_EQ(7U, c.count());
}

TYPED_TEST(AnyStrategy, Nothing)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  auto got = c.template any<0>().extract();
  ASSERT_TRUE(got.ok());
  ASSERT_EQ(0U, c.count());
}

TYPED_TEST(AnyStrategy, ObserverOnSuccess)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  std::vector<TypeParam> seen;
  std::size_t calls = 0U;
  auto got = c.template any<4>().extract_and([&](const pullmatch::slice<TypeParam> &s) {
    ++calls;
    seen.assign(s.begin(), s.end());
  });
  ASSERT_TRUE(got.ok());
  ASSERT_EQ(1U, calls);
  ASSERT_EQ(4U, seen.size());
  ASSERT_TRUE(std::equal(seen.begin(), seen.end(), got.value().begin()));
}

TYPED_TEST(AnyStrategy, NoObserverOnFailure)
{
  auto c = pullmatch::make_cursor(this->items.begin(), this->items.end());
  std::size_t calls = 0U;
  auto got = c.template any<8>().extract_and([&](const pullmatch::slice<TypeParam> &) {
    ++calls;
  });
  ASSERT_FALSE(got.ok());
  ASSERT_EQ(0U, calls);
}

TEST(AnyStrategyPulls, ExactlyN)
{
  const std::uint8_t data[] = { 9, 8, 7, 6, 5 };
  std::size_t pulls = 0U;
  auto c = pullmatch::make_cursor(pull_count(data, &pulls), pull_count(data + 5, nullptr));
  auto got = c.any<3>().extract();
  ASSERT_TRUE(got.ok());
  ASSERT_EQ(3U, pulls);
  ASSERT_EQ(pulls, c.count());
}
