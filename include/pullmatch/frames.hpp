#pragma once

#include <array>
#include <cstddef>
#include <cstdint>

#include "error.hpp"
#include "slice.hpp"

namespace pullmatch {

struct frame_stats {
  std::size_t frames;
  std::size_t resyncs;    // marker anchor found but the rest of the marker did not follow
  std::size_t truncated;  // marker found, source ended inside the payload

  frame_stats() : frames(0U), resyncs(0U), truncated(0U) { }
};

// Observer folding every observed item into an XOR checksum
class xor_checksum {
  std::uint8_t *acc;
public:
  explicit xor_checksum(std::uint8_t &acc) : acc(&acc) { }

  template <typename Slice>
  void operator()(const Slice &items) const
  {
    for (auto i : items) {
      *acc ^= static_cast<std::uint8_t>(i);
    }
  }
};

/**
 * Splits a stream into [sync marker][PayloadLen bytes] frames.
 *
 * on_frame(offset, payload, checksum) is called for every complete frame;
 * offset is the stream position of the first marker byte and checksum is
 * the XOR of the payload. Bytes between frames are skipped. Stops at end of
 * data, on a truncated payload, or after max_frames frames (0: no limit).
 *
 * Items are never pushed back: when the byte after an anchor mismatches, it
 * is consumed with the failed marker. A marker whose first byte is repeated
 * (55 55 AA with sync 55 AA) is therefore lost and counted as a resync.
 */
template <std::size_t PayloadLen, typename Cursor, std::size_t SyncLen, typename Callback>
frame_stats scan_frames(
    Cursor &c,
    const std::array<typename Cursor::item_type, SyncLen> &sync,
    Callback &&on_frame,
    std::size_t max_frames = 0U)
{
  frame_stats stats;
  while (max_frames == 0U or stats.frames < max_frames) {
    auto marker = c.deferred(sync).extract();
    if (!marker) {
      if (marker.error().kind() == pattern_errc::incorrect_value) {
        ++stats.resyncs;
        continue;
      }
      break;
    }
    std::size_t offset = c.count() - SyncLen;

    std::uint8_t checksum = 0U;
    auto payload = c.template any<PayloadLen>().extract_and(xor_checksum(checksum));
    if (!payload) {
      ++stats.truncated;
      break;
    }
    on_frame(offset, payload.value(), checksum);
    ++stats.frames;
  }
  return stats;
}

}
