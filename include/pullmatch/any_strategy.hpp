#pragma once

#include <array>
#include <cstddef>
#include <utility>

#include <boost/optional.hpp>

#include "error.hpp"
#include "slice.hpp"
#include "impl/borrow.hpp"
#include "impl/slots.hpp"

namespace pullmatch {

template <typename Cursor, std::size_t N>
class get_strategy;

/**
 * Takes the next N items, whatever they are.
 */
template <typename Cursor, std::size_t N>
class any_strategy {
public:
  using item_type  = typename Cursor::item_type;
  using value_type = std::array<item_type, N>;

private:
  impl::borrow<Cursor> hold;

  friend Cursor;
  template <typename, std::size_t> friend class get_strategy;

  explicit any_strategy(impl::borrow<Cursor> &&hold) : hold(std::move(hold)) { }

  template <typename Observer>
  static result<value_type> extract_from(Cursor &cursor, Observer &observer)
  {
    impl::slots<item_type, N> output;
    auto failure = cursor.collect(N, [&output](std::size_t i, item_type &&candidate) -> boost::optional<pattern_errc> {
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

public:
  any_strategy(any_strategy &&) = default;

  /**
   * Extracts the next N items and hands them to observer before returning.
   * The observer is not invoked on failure.
   */
  template <typename Observer>
  result<value_type> extract_and(Observer observer)
  {
    impl::borrow<Cursor> held(std::move(hold));
    return extract_from(held.get(), observer);
  }

  result<value_type> extract()
  {
    return extract_and(impl::ignore{});
  }
};

}
