#pragma once

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace pullmatch {
namespace type_utils {

// Remove ALL qualifiers
template <typename T>
using RemoveQualifiers = typename std::remove_cv<typename std::remove_reference<T>::type>::type;

// Compile-time sequence of indices, 0 ... N-1
template <std::size_t... I>
struct index_list { };

template <std::size_t N, std::size_t... I>
struct IIndex : IIndex<N - 1U, N - 1U, I...> { };

template <std::size_t... I>
struct IIndex<0U, I...> {
  using type = index_list<I...>;
};

template <std::size_t N>
using make_index_list = typename IIndex<N>::type;

// Items a typed decoder accepts
template <typename T>
struct is_byte {
  static constexpr bool value = std::is_same<RemoveQualifiers<T>, std::uint8_t>::value;

  constexpr operator bool() const { return value; }
};

// Items the value strategies can compare and duplicate
template <typename T>
struct is_matchable {
  static constexpr bool value = std::is_copy_constructible<T>::value;

  constexpr operator bool() const { return value; }
};

}
}

#define CHECK_BYTE_ITEM(T, MSG) static_assert(pullmatch::type_utils::is_byte<T>::value, MSG)
#define CHECK_MATCHABLE_ITEM(T, MSG) static_assert(pullmatch::type_utils::is_matchable<T>::value, MSG)
