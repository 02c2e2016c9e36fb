#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <utility>

#include <boost/optional.hpp>

#include "error.hpp"
#include "slice.hpp"
#include "type_utils.hpp"
#include "impl/borrow.hpp"
#include "impl/slots.hpp"

namespace pullmatch {

template <typename Cursor, std::size_t N, typename Equal>
class immediate_strategy;

/**
 * Skips items until expected[0] (the anchor) shows up, then requires the
 * following N-1 items to match expected[1..N) in order.
 *
 * Skipped items are consumed and counted by the cursor but are not part of
 * the result. Once the anchor is found scanning never resumes: a later
 * mismatch fails the whole extraction.
 */
template <typename Cursor, std::size_t N, typename Equal = std::equal_to<typename Cursor::item_type>>
class deferred_strategy {
  static_assert(N > 0U, "deferred_strategy needs at least an anchor value");
  CHECK_MATCHABLE_ITEM(typename Cursor::item_type, "deferred_strategy: items must be copyable");

public:
  using item_type  = typename Cursor::item_type;
  using value_type = std::array<item_type, N>;

private:
  impl::borrow<Cursor> hold;
  value_type expected_;
  Equal equal;

  friend Cursor;
  template <typename, std::size_t, typename> friend class immediate_strategy;

  deferred_strategy(impl::borrow<Cursor> &&hold, const value_type &expected, Equal equal)
    : hold(std::move(hold)), expected_(expected), equal(equal)
  { }

public:
  deferred_strategy(deferred_strategy &&) = default;

  const value_type &expected() const { return expected_; }

  template <typename Observer>
  result<value_type> extract_and(Observer observer)
  {
    impl::borrow<Cursor> held(std::move(hold));
    Cursor &cursor = held.get();
    impl::slots<item_type, N> output;

    // Scan for the anchor, one item per pull
    bool anchored = false;
    while (!anchored) {
      auto failure = cursor.collect(1U, [&](std::size_t, item_type &&candidate) -> boost::optional<pattern_errc> {
        if (equal(candidate, expected_[0])) {
          output.put(0U, std::move(candidate));
          anchored = true;
        }
        return boost::none;
      });
      if (failure) {
        return *failure;
      }
    }

    auto failure = cursor.collect(N - 1U, [&](std::size_t i, item_type &&candidate) -> boost::optional<pattern_errc> {
      if (!equal(candidate, expected_[i + 1U])) {
        return pattern_errc::incorrect_value;
      }
      output.put(i + 1U, std::move(candidate));
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
};

}
