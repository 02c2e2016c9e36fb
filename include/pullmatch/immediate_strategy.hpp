#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <utility>

#include <boost/optional.hpp>

#include "deferred_strategy.hpp"
#include "error.hpp"
#include "slice.hpp"
#include "type_utils.hpp"
#include "impl/borrow.hpp"
#include "impl/slots.hpp"

namespace pullmatch {

/**
 * Requires the next N items to match expected[0..N) in order, starting at
 * the current position of the cursor.
 *
 * Matching stops at the first mismatch: that item and every item before it
 * stay consumed. The matched items are returned as pulled from the source,
 * which is relevant when equal is not identity (e.g. masked comparisons).
 */
template <typename Cursor, std::size_t N, typename Equal = std::equal_to<typename Cursor::item_type>>
class immediate_strategy {
  CHECK_MATCHABLE_ITEM(typename Cursor::item_type, "immediate_strategy: items must be copyable");

public:
  using item_type  = typename Cursor::item_type;
  using value_type = std::array<item_type, N>;

private:
  impl::borrow<Cursor> hold;
  value_type expected_;
  Equal equal;

  friend Cursor;

  immediate_strategy(impl::borrow<Cursor> &&hold, const value_type &expected, Equal equal)
    : hold(std::move(hold)), expected_(expected), equal(equal)
  { }

public:
  immediate_strategy(immediate_strategy &&) = default;

  const value_type &expected() const { return expected_; }

  template <typename Observer>
  result<value_type> extract_and(Observer observer)
  {
    impl::borrow<Cursor> held(std::move(hold));
    impl::slots<item_type, N> output;
    auto failure = held.get().collect(N, [&](std::size_t i, item_type &&candidate) -> boost::optional<pattern_errc> {
      if (!equal(candidate, expected_[i])) {
        return pattern_errc::incorrect_value;
      }
      output.put(i, std::move(candidate));
      return boost::none;
    });
    if (failure) {
      return *failure;
    }
    value_type extracted = output.release();
    observer(make_slice(extracted));
    return extracted;
  }

  result<value_type> extract()
  {
    return extract_and(impl::ignore{});
  }

  // Same expected values and comparator, scanning semantics. Keeps the borrow.
  deferred_strategy<Cursor, N, Equal> deferred() &&
  {
    return deferred_strategy<Cursor, N, Equal>(std::move(hold), expected_, equal);
  }
};

}
