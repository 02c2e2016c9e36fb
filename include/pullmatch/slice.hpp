#pragma once

#include <array>
#include <cstddef>

#include <boost/range/iterator_range_core.hpp>

namespace pullmatch {

// Read-only view handed to observers
template <typename T>
using slice = boost::iterator_range<const T*>;

template <typename T, std::size_t N>
slice<T> make_slice(const std::array<T, N> &items)
{
  return slice<T>(items.data(), items.data() + N);
}

namespace impl {

// Observer used by the plain extract() calls
struct ignore {
  template <typename Slice>
  void operator()(const Slice &) const { }
};

}
}
