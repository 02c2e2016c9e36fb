#pragma once

#include <array>
#include <cstddef>
#include <utility>

#include "any_strategy.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "slice.hpp"
#include "type_utils.hpp"
#include "impl/borrow.hpp"
#include "impl/slots.hpp"

namespace pullmatch {

/**
 * Produces N typed values, each decoded from the next K bytes.
 *
 * Raw runs are pulled through any_strategy, so the observer sees every run
 * (up to N calls), not the decoded result. A rejected run fails with
 * failed_deserialize positioned at the cursor count right after that run.
 */
template <typename Cursor, std::size_t N>
class get_strategy {
  CHECK_BYTE_ITEM(typename Cursor::item_type, "get_strategy requires a source of std::uint8_t items");

  impl::borrow<Cursor> hold;

  friend Cursor;

  explicit get_strategy(impl::borrow<Cursor> &&hold) : hold(std::move(hold)) { }

public:
  get_strategy(get_strategy &&) = default;

  template <typename T, std::size_t K = sizeof(T), typename Observer>
  result<std::array<T, N>> extract_and(Observer observer)
  {
    impl::borrow<Cursor> held(std::move(hold));
    Cursor &cursor = held.get();
    impl::slots<T, N> output;
    for (std::size_t i = 0U; i < N; ++i) {
      auto raw = any_strategy<Cursor, K>::extract_from(cursor, observer);
      if (!raw) {
        return raw.error();
      }
      auto value = decoder<T, K>::decode(raw.value());
      if (!value) {
        return pattern_error{pattern_errc::failed_deserialize, cursor.count()};
      }
      output.put(i, std::move(*value));
    }
    return output.release();
  }

  template <typename T, std::size_t K = sizeof(T)>
  result<std::array<T, N>> extract()
  {
    return extract_and<T, K>(impl::ignore{});
  }
};

}
