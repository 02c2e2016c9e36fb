#pragma once

#include <array>
#include <cstddef>
#include <stdexcept>
#include <utility>

#include <boost/optional.hpp>

#include "../type_utils.hpp"

namespace pullmatch { namespace impl {

/**
 * Fixed-size result buffer. Slots are filled positionally and the finished
 * std::array is only handed out once every slot holds a value, so T needs no
 * default constructor and a partial result is never observable.
 */
template <typename T, std::size_t N>
class slots {
  std::array<boost::optional<T>, N> cells;
  std::size_t filled;

  template <std::size_t... I>
  std::array<T, N> release(type_utils::index_list<I...>)
  {
    return std::array<T, N> {{ std::move(*cells[I])... }};
  }

public:
  slots() : filled(0U) { }

  void put(std::size_t pos, T value)
  {
    if (!cells[pos]) {
      ++filled;
    }
    cells[pos] = std::move(value);
  }

  std::size_t size() const { return filled; }
  bool complete() const { return filled == N; }

  std::array<T, N> release()
  {
    if (!complete()) {
      throw std::logic_error("slots: releasing an incomplete result");
    }
    return release(type_utils::make_index_list<N>{});
  }
};

}}
