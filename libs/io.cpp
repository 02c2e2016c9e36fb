#include "io.hpp"

#include <cctype>

namespace pullmatch {
namespace io {

void open_file(std::ifstream &file, const char *name) throw (ioexception)
{
    file.open(name, std::ios::binary | std::ios::in);
    if (!file.is_open())
        throw ioexception(std::string("Failed to open file ") + name);
}

namespace {
int nibble(char c)
{
    if (c >= '0' and c <= '9') return c - '0';
    if (c >= 'a' and c <= 'f') return c - 'a' + 10;
    if (c >= 'A' and c <= 'F') return c - 'A' + 10;
    return -1;
}
}

std::vector<std::uint8_t> parse_hex(const std::string &text)
{
    std::string digits;
    std::string::size_type start = 0U;
    if (text.size() >= 2U and text[0] == '0' and (text[1] == 'x' or text[1] == 'X'))
        start = 2U;
    for (auto i = start; i < text.size(); ++i) {
        char c = text[i];
        if (std::isspace(static_cast<unsigned char>(c)))
            continue;
        if (nibble(c) < 0)
            throw std::logic_error("Invalid hex digit '" + std::string(1, c) + "' in " + text);
        digits.push_back(c);
    }
    if (digits.size() % 2U != 0U)
        throw std::logic_error("Odd number of hex digits in " + text);

    std::vector<std::uint8_t> bytes;
    for (std::string::size_type i = 0U; i < digits.size(); i += 2U)
        bytes.push_back(static_cast<std::uint8_t>(nibble(digits[i]) * 16 + nibble(digits[i + 1])));
    return bytes;
}

}
}
