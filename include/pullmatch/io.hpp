#pragma once

#include <cstdint>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pullmatch {
namespace io {
class ioexception : public std::runtime_error {
public:
  explicit ioexception(const char *what) : std::runtime_error(what) { }
  explicit ioexception(const std::string &what) : std::runtime_error(what) { }
};

void open_file(std::ifstream &file, const char *name) throw (ioexception);

// "55aa", "55 AA" and "0x55aa" all give { 0x55, 0xAA }
std::vector<std::uint8_t> parse_hex(const std::string &text);

template <typename Range>
std::string to_hex(const Range &bytes)
{
  static const char digits[] = "0123456789abcdef";
  std::string out;
  for (auto b : bytes) {
    auto v = static_cast<std::uint8_t>(b);
    out.push_back(digits[v >> 4]);
    out.push_back(digits[v & 0x0FU]);
  }
  return out;
}

}
}
