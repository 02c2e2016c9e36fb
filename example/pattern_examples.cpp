#include <pullmatch/api.hpp>     // Main API
#include <pullmatch/io.hpp>      // For printing raw runs

#include <array>
#include <cstdint>
#include <iostream>
#include <sstream>
#include <string>

// A temperature reading, little-endian tenths of a degree. 0x8000 marks a dead sensor.
struct reading {
  std::int16_t tenths;
};

namespace pullmatch {
template <>
struct decoder<reading, 2> {
  static boost::optional<reading> decode(const std::array<std::uint8_t, 2> &raw)
  {
    std::uint16_t bits = static_cast<std::uint16_t>(raw[0] | (raw[1] << 8));
    if (bits == 0x8000U) {
      return boost::none;
    }
    return reading { static_cast<std::int16_t>(bits) };
  }
};
}

// Noise, sync (A5 5A), version 01, three readings, a "heater on" flag.
const std::array<std::uint8_t, 15> packet {{
  0x00, 0x13, 0x37,
  0xA5, 0x5A,
  0x01,
  0xDC, 0x00,  0xE6, 0x00,  0x2C, 0xFF,
  0x01,
  0xEE, 0xEE
}};

struct Printer {
  template <typename Slice>
  void operator()(const Slice &raw)
  {
    std::cout << "raw run: " << pullmatch::io::to_hex(raw) << std::endl;
  }
};

int main()
{
  // Construct a cursor over an in-memory buffer
  auto c = pullmatch::make_cursor(packet.begin(), packet.end());

  // Skip the noise up to the sync marker
  std::array<std::uint8_t, 2> sync {{ 0xA5, 0x5A }};
  auto marker = c.deferred(sync).extract();
  if (!marker) {
    std::cerr << "sync: " << marker.error() << std::endl;
    return 1;
  }
  std::cout << "sync found, cursor at " << c.count() << std::endl;

  // The version byte must follow immediately
  std::array<std::uint8_t, 1> version {{ 0x01 }};
  auto v = c.immediate(version).extract();
  if (!v) {
    std::cerr << "version: " << v.error() << std::endl;
    return 1;
  }

  // Three typed readings, every raw run passed to the printer
  auto readings = c.get<3>().extract_and<reading>(Printer{});
  if (!readings) {
    std::cerr << "readings: " << readings.error() << std::endl;
    return 1;
  }
  for (auto &r : readings.value()) {
    std::cout << "reading: " << r.tenths / 10.0 << std::endl;
  }

  auto heater = c.get<1>().extract<bool>();
  if (!heater) {
    std::cerr << "heater: " << heater.error() << std::endl;
    return 1;
  }
  std::cout << "heater: " << (heater.value()[0] ? "on" : "off") << std::endl;

  // Bytes after the frame must not be a second sync marker
  auto trailer = c.immediate(sync).extract();
  std::cout << "trailer: " << (trailer ? std::string("sync") : "not a sync marker") << ", "
            << "consumed " << c.count() << " of " << packet.size() << " bytes" << std::endl;

  // Same layout, read from a stream
  std::stringstream ss(std::string(packet.begin(), packet.end()));
  auto s = pullmatch::make_stream_cursor<std::uint8_t>(ss);
  auto found = s.deferred(sync).extract();
  std::cout << "stream: sync " << (found ? "found" : "missing")
            << " at byte " << s.count() - sync.size() << std::endl;
}
