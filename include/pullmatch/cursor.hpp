#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <istream>
#include <stdexcept>
#include <utility>

#include <boost/optional.hpp>

#include "any_strategy.hpp"
#include "deferred_strategy.hpp"
#include "error.hpp"
#include "get_strategy.hpp"
#include "immediate_strategy.hpp"
#include "source.hpp"
#include "impl/borrow.hpp"

namespace pullmatch {

/**
 * Owns a pull-based source and hands it out to one strategy at a time.
 *
 * count() is the number of items the source has yielded so far, including
 * items skipped while scanning and items consumed by a failed extraction.
 * It never decreases.
 *
 * Typical usage:
 *   auto c = make_cursor(bytes.begin(), bytes.end());
 *   auto sync   = c.deferred(marker).extract();
 *   auto header = c.any<4>().extract();
 *   auto values = c.get<2>().extract<std::uint16_t>();
 *
 * A dispatched strategy borrows the cursor until its extraction returns (or
 * until the handle is destroyed unused); dispatching a second strategy in the
 * meantime throws std::logic_error.
 */
template <typename Source>
class cursor {
public:
  using source_type = Source;
  using item_type   = typename Source::item_type;

private:
  Source source;
  std::size_t consumed;
  bool borrowed;

  friend class impl::borrow<cursor>;
  template <typename, std::size_t> friend class any_strategy;
  template <typename, std::size_t, typename> friend class immediate_strategy;
  template <typename, std::size_t, typename> friend class deferred_strategy;
  template <typename, std::size_t> friend class get_strategy;

  void lock()
  {
    if (borrowed) {
      throw std::logic_error("cursor: a strategy is already dispatched on this cursor");
    }
    borrowed = true;
  }

  void unlock() { borrowed = false; }

  /**
   * Pulls up to count items, calling callback(i, item) on each.
   * Stops with not_found if the source ends, or with the callback's error
   * if it rejects an item. Whatever was pulled stays consumed and counted.
   */
  template <typename Callback>
  boost::optional<pattern_error> collect(std::size_t count, Callback &&callback)
  {
    for (std::size_t i = 0U; i < count; ++i) {
      auto candidate = source.next();
      if (!candidate) {
        return pattern_error{pattern_errc::not_found, consumed};
      }
      ++consumed;
      boost::optional<pattern_errc> rejected = callback(i, std::move(*candidate));
      if (rejected) {
        return pattern_error{*rejected, consumed};
      }
    }
    return boost::none;
  }

public:
  explicit cursor(Source source)
    : source(std::move(source)), consumed(0U), borrowed(false)
  { }

  // Snapshot: only independent if copies of Source are (e.g. forward iterators)
  cursor(const cursor &other)
    : source((other.check_idle(), other.source)), consumed(other.consumed), borrowed(false)
  { }

  cursor(cursor &&other)
    : source((other.check_idle(), std::move(other.source))), consumed(other.consumed), borrowed(false)
  { }

  cursor &operator=(const cursor &) = delete;
  cursor &operator=(cursor &&) = delete;

  std::size_t count() const { return consumed; }

  bool dispatched() const { return borrowed; }

  cursor snapshot() const { return cursor(*this); }

  template <std::size_t N>
  any_strategy<cursor, N> any()
  {
    return any_strategy<cursor, N>(impl::borrow<cursor>(*this));
  }

  template <std::size_t N>
  immediate_strategy<cursor, N> immediate(const std::array<item_type, N> &expected)
  {
    return immediate<N>(expected, std::equal_to<item_type>{});
  }

  template <std::size_t N, typename Equal>
  immediate_strategy<cursor, N, Equal> immediate(const std::array<item_type, N> &expected, Equal equal)
  {
    return immediate_strategy<cursor, N, Equal>(impl::borrow<cursor>(*this), expected, equal);
  }

  template <std::size_t N>
  deferred_strategy<cursor, N> deferred(const std::array<item_type, N> &expected)
  {
    return deferred<N>(expected, std::equal_to<item_type>{});
  }

  template <std::size_t N, typename Equal>
  deferred_strategy<cursor, N, Equal> deferred(const std::array<item_type, N> &expected, Equal equal)
  {
    return deferred_strategy<cursor, N, Equal>(impl::borrow<cursor>(*this), expected, equal);
  }

  template <std::size_t N>
  get_strategy<cursor, N> get()
  {
    return get_strategy<cursor, N>(impl::borrow<cursor>(*this));
  }

private:
  void check_idle() const
  {
    if (borrowed) {
      throw std::logic_error("cursor: cannot copy or move while a strategy is dispatched");
    }
  }
};

template <typename Iter>
cursor<iterator_source<Iter>> make_cursor(Iter begin, Iter end)
{
  return cursor<iterator_source<Iter>>(iterator_source<Iter>(begin, end));
}

template <typename T>
cursor<stream_source<T>> make_stream_cursor(std::istream &s)
{
  return cursor<stream_source<T>>(stream_source<T>(s));
}

template <typename Generator>
cursor<generator_source<Generator>> make_generator_cursor(Generator gen)
{
  return cursor<generator_source<Generator>>(generator_source<Generator>(std::move(gen)));
}

}
