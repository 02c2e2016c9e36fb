#include <cursor.hpp>
#include <frames.hpp>

#include <array>
#include <cstdint>
#include <sstream>
#include <string>
#include <vector>

#include "main.hpp"

using bytes = std::vector<std::uint8_t>;

struct seen_frame {
  std::size_t offset;
  std::array<std::uint8_t, 3> payload;
  std::uint8_t checksum;
};

class Frames : public ::testing::Test {
public:
  std::array<std::uint8_t, 2> sync {{ 0x55, 0xAA }};
  std::vector<seen_frame> seen;

  template <typename Cursor>
  pullmatch::frame_stats scan(Cursor &c, std::size_t max_frames = 0U)
  {
    auto &out = seen;
    return pullmatch::scan_frames<3>(c, sync,
      [&out](std::size_t offset, const std::array<std::uint8_t, 3> &payload, std::uint8_t checksum) {
        seen_frame f;
        f.offset   = offset;
        f.payload  = payload;
        f.checksum = checksum;
        out.push_back(f);
      }, max_frames);
  }
};

TEST_F(Frames, Noise)
{
  bytes data {{ 0x00, 0x55, 0xAA, 0x01, 0x02, 0x04, 0xFF, 0xFF, 0x55, 0xAA, 0x10, 0x20, 0x30 }};
  auto c = pullmatch::make_cursor(data.begin(), data.end());
  auto stats = scan(c);
  ASSERT_EQ(2U, stats.frames);
  ASSERT_EQ(0U, stats.resyncs);
  ASSERT_EQ(0U, stats.truncated);
  ASSERT_EQ(2U, seen.size());

  ASSERT_EQ(1U, seen[0].offset);
  std::array<std::uint8_t, 3> first {{ 0x01, 0x02, 0x04 }};
  ASSERT_EQ(first, seen[0].payload);
  ASSERT_EQ(0x07, seen[0].checksum);

  ASSERT_EQ(8U, seen[1].offset);
  ASSERT_EQ(0x00, seen[1].checksum);
  ASSERT_EQ(data.size(), c.count());
}

TEST_F(Frames, FalseAnchor)
{
  bytes data {{ 0x55, 0x00, 0x55, 0xAA, 0x01, 0x01, 0x01 }};
  auto c = pullmatch::make_cursor(data.begin(), data.end());
  auto stats = scan(c);
  ASSERT_EQ(1U, stats.frames);
  ASSERT_EQ(1U, stats.resyncs);
  ASSERT_EQ(2U, seen[0].offset);
  ASSERT_EQ(0x01, seen[0].checksum);
}

TEST_F(Frames, RepeatedAnchorByte)
{
  // Second 0x55 is the mismatch of the first attempt; the 0xAA after it
  // no longer has an anchor in front
  bytes data {{ 0x55, 0x55, 0xAA, 0x01, 0x02, 0x03 }};
  auto c = pullmatch::make_cursor(data.begin(), data.end());
  auto stats = scan(c);
  ASSERT_EQ(0U, stats.frames);
  ASSERT_EQ(1U, stats.resyncs);
  ASSERT_EQ(0U, stats.truncated);
  ASSERT_TRUE(seen.empty());
  ASSERT_EQ(data.size(), c.count());
}

TEST_F(Frames, Truncated)
{
  bytes data {{ 0x55, 0xAA, 0x01, 0x02, 0x03, 0x55, 0xAA, 0x09 }};
  auto c = pullmatch::make_cursor(data.begin(), data.end());
  auto stats = scan(c);
  ASSERT_EQ(1U, stats.frames);
  ASSERT_EQ(1U, stats.truncated);
  ASSERT_EQ(data.size(), c.count());
}

TEST_F(Frames, MaxFrames)
{
  bytes data {{ 0x55, 0xAA, 1, 2, 3, 0x55, 0xAA, 4, 5, 6, 0x55, 0xAA, 7, 8, 9 }};
  auto c = pullmatch::make_cursor(data.begin(), data.end());
  auto stats = scan(c, 2U);
  ASSERT_EQ(2U, stats.frames);
  ASSERT_EQ(10U, c.count());
}

TEST_F(Frames, Stream)
{
  std::stringstream ss(std::string("\x13\x55\xAA\x0F\xF0\x01", 6));
  auto c = pullmatch::make_stream_cursor<std::uint8_t>(ss);
  auto stats = scan(c);
  ASSERT_EQ(1U, stats.frames);
  ASSERT_EQ(1U, seen[0].offset);
  ASSERT_EQ(0xFE, seen[0].checksum);
}

TEST(XorChecksum, Accumulates)
{
  std::uint8_t acc = 0U;
  pullmatch::xor_checksum sum(acc);
  std::array<std::uint8_t, 2> a {{ 0xF0, 0x0F }};
  std::array<std::uint8_t, 1> b {{ 0x01 }};
  sum(pullmatch::make_slice(a));
  ASSERT_EQ(0xFF, acc);
  sum(pullmatch::make_slice(b));
  ASSERT_EQ(0xFE, acc);
}
