#pragma once

#include <istream>
#include <iterator>
#include <type_traits>
#include <utility>

#include <boost/optional.hpp>

#include "type_utils.hpp"

namespace pullmatch {

/*
 * A source is anything exposing
 *
 *   using item_type = ...;
 *   boost::optional<item_type> next();
 *
 * where boost::none signals end of data. Sources are pulled strictly once
 * per item and never rewound.
 */

// [begin, end) of any input iterator
template <typename Iter>
class iterator_source {
  Iter current;
  Iter last;
public:
  using item_type = type_utils::RemoveQualifiers<typename std::iterator_traits<Iter>::value_type>;

  iterator_source(Iter begin, Iter end) : current(begin), last(end) { }

  boost::optional<item_type> next()
  {
    if (current == last) {
      return boost::none;
    }
    item_type item = *current;
    ++current;
    return item;
  }
};

// Items of type T read as raw bytes from a stream; a trailing partial item is end of data.
template <typename T>
class stream_source {
  static_assert(std::is_trivial<T>::value, "stream_source reads raw bytes into T");
  std::istream *s;
public:
  using item_type = T;

  explicit stream_source(std::istream &s) : s(&s) { }

  boost::optional<T> next()
  {
    T item;
    s->read(reinterpret_cast<char*>(&item), sizeof(T));
    if (s->gcount() != static_cast<std::streamsize>(sizeof(T))) {
      return boost::none;
    }
    return item;
  }
};

// Callable returning boost::optional<T>, e.g. a register poll
template <typename Generator>
class generator_source {
  Generator gen;
  using Returned = type_utils::RemoveQualifiers<decltype(std::declval<Generator&>()())>;
public:
  using item_type = typename Returned::value_type;

  explicit generator_source(Generator gen) : gen(std::move(gen)) { }

  boost::optional<item_type> next()
  {
    return gen();
  }
};

}
