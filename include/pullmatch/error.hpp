#pragma once

#include <cstddef>
#include <ostream>
#include <stdexcept>
#include <utility>

#include <boost/variant.hpp>

namespace pullmatch {

enum class pattern_errc {
  not_found,          // source ended before the requested items (or the anchor) were pulled
  incorrect_value,    // an examined item differs from the expected one
  failed_deserialize  // a raw run was pulled but the decoder rejected it
};

inline const char *describe(pattern_errc e)
{
  switch (e) {
    case pattern_errc::not_found:          return "not found";
    case pattern_errc::incorrect_value:    return "incorrect value";
    case pattern_errc::failed_deserialize: return "failed deserialize";
  }
  return "unknown pattern error";
}

inline std::ostream &operator<<(std::ostream &os, pattern_errc e)
{
  return os << describe(e);
}

/**
 * Failure of a single extraction.
 * position is the cursor's consumed-count when the failure was raised, so
 * it locates the offending item across several sequential extractions.
 */
class pattern_error {
  pattern_errc kind_;
  std::size_t position_;
public:
  pattern_error(pattern_errc kind, std::size_t position)
    : kind_(kind), position_(position)
  { }

  pattern_errc kind() const { return kind_; }
  std::size_t position() const { return position_; }

  bool operator==(const pattern_error &other) const
  {
    return kind_ == other.kind_ and position_ == other.position_;
  }

  bool operator!=(const pattern_error &other) const { return !(*this == other); }
};

inline std::ostream &operator<<(std::ostream &os, const pattern_error &e)
{
  return os << e.kind() << " (after " << e.position() << " items)";
}

class bad_result_access : public std::logic_error {
public:
  explicit bad_result_access(const char *what) : std::logic_error(what) { }
};

/**
 * Either the extracted value or the reason the extraction failed.
 */
template <typename T>
class result {
  boost::variant<T, pattern_error> content;
public:
  using value_type = T;

  result(T value) : content(std::move(value)) { }
  result(pattern_error error) : content(error) { }

  bool ok() const { return content.which() == 0; }
  explicit operator bool() const { return ok(); }

  const T &value() const
  {
    if (!ok()) {
      throw bad_result_access("result: value requested from a failed extraction");
    }
    return boost::get<T>(content);
  }

  T &value()
  {
    if (!ok()) {
      throw bad_result_access("result: value requested from a failed extraction");
    }
    return boost::get<T>(content);
  }

  pattern_error error() const
  {
    if (ok()) {
      throw bad_result_access("result: error requested from a successful extraction");
    }
    return boost::get<pattern_error>(content);
  }

  T value_or(T fallback) const
  {
    return ok() ? boost::get<T>(content) : fallback;
  }
};

}
