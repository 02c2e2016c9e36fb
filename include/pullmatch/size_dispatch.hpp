#pragma once

#include <cstddef>
#include <ostream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace pullmatch {
namespace utils {

// Widths a tool instantiates its templates for
template <std::size_t... Sizes>
struct size_list { };

template <typename List>
struct widths;

template <>
struct widths<size_list<>> {
  static bool contains(std::size_t) { return false; }

  static void print(std::ostream &) { }

  template <typename Fn>
  static void dispatch(std::size_t n, Fn &)
  {
    throw std::logic_error("no instantiation for width " + std::to_string(n));
  }
};

template <std::size_t Head, std::size_t... Tail>
struct widths<size_list<Head, Tail...>> {
  using rest = widths<size_list<Tail...>>;

  static bool contains(std::size_t n) { return n == Head or rest::contains(n); }

  static void print(std::ostream &out)
  {
    out << Head << " ";
    rest::print(out);
  }

  // Runs fn.call<n>() with n as a compile-time constant
  template <typename Fn>
  static void dispatch(std::size_t n, Fn &fn)
  {
    if (n == Head) {
      fn.template call<Head>();
    } else {
      rest::dispatch(n, fn);
    }
  }
};

template <typename List>
bool allow(std::size_t n)
{
  return widths<List>::contains(n);
}

template <typename List>
std::string choices()
{
  std::ostringstream out;
  widths<List>::print(out);
  return out.str();
}

namespace impl {

template <std::size_t First, typename Fn>
struct bound_first {
  Fn &fn;

  template <std::size_t Second>
  void call() { fn.template call<First, Second>(); }
};

template <typename SecondList, typename Fn>
struct pending_second {
  std::size_t second;
  Fn &fn;

  template <std::size_t First>
  void call()
  {
    bound_first<First, Fn> next { fn };
    widths<SecondList>::dispatch(second, next);
  }
};

}

/**
 * Runs fn.call<first, second>() for a runtime pair of widths, each drawn
 * from its own list. Throws std::logic_error when either is not listed.
 */
template <typename FirstList, typename SecondList, typename Fn>
void dispatch(std::size_t first, std::size_t second, Fn &fn)
{
  impl::pending_second<SecondList, Fn> pending { second, fn };
  widths<FirstList>::dispatch(first, pending);
}

}
}
