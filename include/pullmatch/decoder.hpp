#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include <boost/optional.hpp>

namespace pullmatch {

/**
 * Decodes a T from K raw bytes. Specialise it for the types a get_strategy
 * should produce:
 *
 *   template <>
 *   struct decoder<my_type, 4> {
 *     static boost::optional<my_type> decode(const std::array<std::uint8_t, 4> &raw);
 *   };
 *
 * boost::none rejects the run and fails the extraction with
 * pattern_errc::failed_deserialize.
 */
template <typename T, std::size_t K>
struct decoder;

template <>
struct decoder<std::uint8_t, 1> {
  static boost::optional<std::uint8_t> decode(const std::array<std::uint8_t, 1> &raw)
  {
    return raw[0];
  }
};

template <>
struct decoder<std::int8_t, 1> {
  static boost::optional<std::int8_t> decode(const std::array<std::uint8_t, 1> &raw)
  {
    return static_cast<std::int8_t>(raw[0]);
  }
};

template <>
struct decoder<char, 1> {
  static boost::optional<char> decode(const std::array<std::uint8_t, 1> &raw)
  {
    return static_cast<char>(raw[0]);
  }
};

// Only 0 and 1 are valid booleans
template <>
struct decoder<bool, 1> {
  static boost::optional<bool> decode(const std::array<std::uint8_t, 1> &raw)
  {
    if (raw[0] > 1U) {
      return boost::none;
    }
    return raw[0] == 1U;
  }
};

template <std::size_t K>
struct decoder<std::array<std::uint8_t, K>, K> {
  static boost::optional<std::array<std::uint8_t, K>> decode(const std::array<std::uint8_t, K> &raw)
  {
    return raw;
  }
};

}
