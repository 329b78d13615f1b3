// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <string>
#include <vector>

#include "base/options.h"
#include "base/result_testing.h"
#include "io/options.h"
#include "io/reader.h"
#include "tzif/data.h"
#include "tzif/header.h"
#include "tzif/testing.h"

using tzif::testing::BlockBuilder;

// Splits a built block into its header and its body.
static tzif::Header split(std::string* body, const BlockBuilder& b) {
  std::string bytes = b.build();
  *body = bytes.substr(tzif::kHeaderSize);
  return b.header();
}

TEST(ReadData, Empty) {
  tzif::Header h;
  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::nullreader(), h));
  EXPECT_TRUE(d.transition_times.empty());
  EXPECT_TRUE(d.transition_types.empty());
  EXPECT_TRUE(d.local_time_types.empty());
  EXPECT_TRUE(d.leap_seconds.empty());
  EXPECT_TRUE(d.designations.empty());
  EXPECT_TRUE(d.std_wall_indicators.empty());
  EXPECT_TRUE(d.ut_indicators.empty());
}

TEST(ReadData, Minimal) {
  std::string body;
  auto h = split(&body, tzif::testing::minimal_block());
  EXPECT_EQ(7U, body.size());

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  ASSERT_EQ(1U, d.local_time_types.size());
  EXPECT_EQ(tzif::LocalTimeTypeRecord(3600, false, 0), d.local_time_types[0]);
  EXPECT_EQ(std::string(1, '\0'), d.designations);
  EXPECT_TRUE(d.transition_times.empty());
  EXPECT_TRUE(d.leap_seconds.empty());
}

TEST(ReadData, Version1Times) {
  std::string body;
  auto h = split(&body, BlockBuilder().transition(1700000000, 0));
  EXPECT_EQ(5U, body.size());

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_EQ(std::vector<int64_t>({1700000000}), d.transition_times);
  EXPECT_EQ(std::vector<uint8_t>({0}), d.transition_types);
}

TEST(ReadData, NegativeTimesSignExtend) {
  std::string body;
  auto h = split(&body, BlockBuilder()
                            .transition(-2147483648LL, 1)
                            .transition(-1, 0)
                            .leap(-5, -1));

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_EQ(std::vector<int64_t>({-2147483648LL, -1}), d.transition_times);
  ASSERT_EQ(1U, d.leap_seconds.size());
  EXPECT_EQ(tzif::LeapSecondRecord(-5, -1), d.leap_seconds[0]);
}

TEST(ReadData, Version2Times) {
  std::string body;
  auto h = split(&body, BlockBuilder()
                            .version('2')
                            .transition(-(int64_t(1) << 59), 0)
                            .transition(1700000000, 1)
                            .leap(78796800, 1));
  EXPECT_EQ(2U * 8U + 2U + 12U, body.size());

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_EQ(std::vector<int64_t>({-(int64_t(1) << 59), 1700000000}),
            d.transition_times);
  EXPECT_EQ(std::vector<uint8_t>({0, 1}), d.transition_types);
  ASSERT_EQ(1U, d.leap_seconds.size());
  EXPECT_EQ(tzif::LeapSecondRecord(78796800, 1), d.leap_seconds[0]);
}

TEST(ReadData, Version2NeedsEightByteTimes) {
  std::string body;
  auto h = split(
      &body,
      BlockBuilder().version('2').time_size(4).transition(1700000000, 0));
  EXPECT_EQ(5U, body.size());

  tzif::Data d;
  EXPECT_EOF(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_TRUE(d.transition_times.empty());
}

TEST(ReadData, AllRegions) {
  std::string body;
  auto h = split(&body, BlockBuilder()
                            .version('3')
                            .transition(-100, 2)
                            .transition(0, 1)
                            .transition(100, 0)
                            .type(-18000, false, 0)
                            .type(-14400, true, 4)
                            .type(0, false, 8)
                            .designations(std::string("EST\0EDT\0UTC\0", 12))
                            .leap(1000, 1)
                            .leap(2000, 2)
                            .std_wall(0)
                            .std_wall(1)
                            .std_wall(1)
                            .ut(0)
                            .ut(0)
                            .ut(1));
  EXPECT_EQ(h.data_size(), body.size());

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_EQ(std::vector<int64_t>({-100, 0, 100}), d.transition_times);
  EXPECT_EQ(std::vector<uint8_t>({2, 1, 0}), d.transition_types);
  ASSERT_EQ(3U, d.local_time_types.size());
  EXPECT_EQ(tzif::LocalTimeTypeRecord(-18000, false, 0),
            d.local_time_types[0]);
  EXPECT_EQ(tzif::LocalTimeTypeRecord(-14400, true, 4), d.local_time_types[1]);
  EXPECT_EQ(tzif::LocalTimeTypeRecord(0, false, 8), d.local_time_types[2]);
  ASSERT_EQ(2U, d.leap_seconds.size());
  EXPECT_EQ(tzif::LeapSecondRecord(1000, 1), d.leap_seconds[0]);
  EXPECT_EQ(tzif::LeapSecondRecord(2000, 2), d.leap_seconds[1]);
  EXPECT_EQ(std::vector<uint8_t>({0, 1, 1}), d.std_wall_indicators);
  EXPECT_EQ(std::vector<uint8_t>({0, 0, 1}), d.ut_indicators);

  EXPECT_EQ("EST", d.designation(0));
  EXPECT_EQ("EDT", d.designation(4));
  EXPECT_EQ("UTC", d.designation(8));
  EXPECT_EQ("DT", d.designation(5));
  EXPECT_EQ("", d.designation(3));
  EXPECT_EQ("", d.designation(12));
  EXPECT_EQ("", d.designation(1000));
}

TEST(ReadData, IsDstOnlyWhenExactlyOne) {
  tzif::Header h;
  h.typecnt = 3;
  std::string body("\0\0\0\0\x01\0" "\0\0\0\0\x02\0" "\0\0\0\0\xff\0", 18);

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  ASSERT_EQ(3U, d.local_time_types.size());
  EXPECT_TRUE(d.local_time_types[0].is_dst);
  EXPECT_FALSE(d.local_time_types[1].is_dst);
  EXPECT_FALSE(d.local_time_types[2].is_dst);
}

TEST(ReadData, UnterminatedDesignation) {
  tzif::Header h;
  h.charcnt = 3;

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader("ABC"), h));
  EXPECT_EQ("ABC", d.designation(0));
  EXPECT_EQ("C", d.designation(2));
}

TEST(ReadData, LenientCounts) {
  // Non-ascending times and out-of-range type indices are passed through.
  std::string body;
  auto h = split(&body, BlockBuilder()
                            .transition(500, 7)
                            .transition(100, 9)
                            .designations("X"));
  EXPECT_EQ(0U, h.typecnt);

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, io::stringreader(body), h));
  EXPECT_EQ(std::vector<int64_t>({500, 100}), d.transition_times);
  EXPECT_EQ(std::vector<uint8_t>({7, 9}), d.transition_types);
}

TEST(ReadData, TruncatedRegion) {
  std::string body;
  auto h = split(&body, BlockBuilder()
                            .version('2')
                            .transition(1, 0)
                            .type(0, false, 0)
                            .designations("A")
                            .leap(2, 1)
                            .std_wall(0)
                            .ut(0));
  ASSERT_EQ(h.data_size(), body.size());

  // Every prefix shorter than the body ends inside some region.
  for (std::size_t len = 0; len < body.size(); ++len) {
    SCOPED_TRACE(len);
    tzif::Data d;
    EXPECT_EOF(tzif::read_data(&d, io::stringreader(body.substr(0, len)), h));
    EXPECT_TRUE(d.transition_times.empty());
    EXPECT_TRUE(d.local_time_types.empty());
  }
}

TEST(ReadData, HugeCountsFailWithoutHugeAllocation) {
  tzif::Header h;
  h.version = '2';
  h.timecnt = 0xffffffffU;
  h.charcnt = 0xffffffffU;

  base::Options o;
  o.get<io::Options>().block_size = 64;

  tzif::Data d;
  EXPECT_EOF(tzif::read_data(&d, io::stringreader(std::string(100, 'x')), h, o));
  EXPECT_TRUE(d.transition_times.empty());
}

TEST(ReadData, ConsumesOnlyTheBody) {
  std::string body;
  auto h = split(&body, tzif::testing::minimal_block());
  auto r = io::stringreader(body + "TZif");

  tzif::Data d;
  ASSERT_OK(tzif::read_data(&d, r, h));

  std::string tail;
  EXPECT_OK(r.read(&tail, 0, 16));
  EXPECT_EQ("TZif", tail);
}
