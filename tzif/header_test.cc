// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <string>

#include "base/result_testing.h"
#include "io/reader.h"
#include "tzif/error.h"
#include "tzif/header.h"
#include "tzif/testing.h"

using tzif::testing::BlockBuilder;

TEST(Header, Defaults) {
  tzif::Header h;
  EXPECT_EQ(0U, h.version);
  EXPECT_EQ(4U, h.time_size());
  EXPECT_EQ(0U, h.data_size());

  h.version = '2';
  EXPECT_EQ(8U, h.time_size());
}

TEST(Header, DataSize) {
  tzif::Header h;
  h.isutcnt = 1;
  h.isstdcnt = 2;
  h.leapcnt = 3;
  h.timecnt = 4;
  h.typecnt = 5;
  h.charcnt = 6;
  // 4*4 + 4 + 6*5 + 6 + 8*3 + 2 + 1
  EXPECT_EQ(83U, h.data_size());

  h.version = '3';
  // 8*4 + 4 + 6*5 + 6 + 12*3 + 2 + 1
  EXPECT_EQ(111U, h.data_size());

  h.timecnt = 0xffffffffU;
  h.leapcnt = 0xffffffffU;
  EXPECT_EQ(uint64_t(0xffffffffU) * 21U + 30U + 6U + 3U, h.data_size());
}

TEST(Header, AsString) {
  tzif::Header h;
  h.typecnt = 1;
  h.charcnt = 4;
  EXPECT_EQ(
      "Header{version:0 isutcnt:0 isstdcnt:0 leapcnt:0 timecnt:0 typecnt:1 "
      "charcnt:4}",
      h.as_string());
  h.version = '2';
  EXPECT_EQ(
      "Header{version:'2' isutcnt:0 isstdcnt:0 leapcnt:0 timecnt:0 typecnt:1 "
      "charcnt:4}",
      h.as_string());
}

TEST(ReadHeader, Counts) {
  tzif::Header want;
  want.isutcnt = 0x01020304U;
  want.isstdcnt = 5;
  want.leapcnt = 6;
  want.timecnt = 0x80000000U;
  want.typecnt = 7;
  want.charcnt = 0xffffffffU;
  std::string bytes = BlockBuilder().version('3').counts(want).build();
  ASSERT_EQ(tzif::kHeaderSize, bytes.size());

  tzif::Header h;
  auto r = io::stringreader(bytes);
  ASSERT_OK(tzif::read_header(&h, r));
  EXPECT_EQ('3', h.version);
  EXPECT_EQ(0x01020304U, h.isutcnt);
  EXPECT_EQ(5U, h.isstdcnt);
  EXPECT_EQ(6U, h.leapcnt);
  EXPECT_EQ(0x80000000U, h.timecnt);
  EXPECT_EQ(7U, h.typecnt);
  EXPECT_EQ(0xffffffffU, h.charcnt);
}

TEST(ReadHeader, ReservedBytesIgnored) {
  std::string bytes = BlockBuilder().version('2').build();
  for (std::size_t i = 5; i < 20; ++i) bytes[i] = 'x';

  tzif::Header h;
  ASSERT_OK(tzif::read_header(&h, io::stringreader(bytes)));
  EXPECT_EQ('2', h.version);
  EXPECT_EQ(0U, h.data_size());
}

TEST(ReadHeader, ConsumesExactly44Bytes) {
  std::string bytes = BlockBuilder().build() + "rest";
  auto r = io::stringreader(bytes);

  tzif::Header h;
  ASSERT_OK(tzif::read_header(&h, r));

  std::string tail;
  EXPECT_OK(r.read(&tail, 0, 16));
  EXPECT_EQ("rest", tail);
}

TEST(ReadHeader, UnknownVersionKept) {
  std::string bytes = BlockBuilder().version('9').build();
  tzif::Header h;
  ASSERT_OK(tzif::read_header(&h, io::stringreader(bytes)));
  EXPECT_EQ('9', h.version);
  EXPECT_EQ(8U, h.time_size());
}

TEST(ReadHeader, BadMagic) {
  std::string bytes = BlockBuilder().magic("TZiF").build();

  tzif::Header h;
  h.typecnt = 99;
  auto result = tzif::read_header(&h, io::stringreader(bytes));
  EXPECT_WRONG_TYPE(result);
  EXPECT_EQ("invalid TZif signature", result.message());
  EXPECT_EQ(tzif::ErrorKind::invalid_signature, tzif::classify(result));
  EXPECT_EQ(tzif::Header(), h);
}

TEST(ReadHeader, Short) {
  std::string bytes = BlockBuilder().build();
  for (std::size_t len : {0, 1, 4, 20, 43}) {
    SCOPED_TRACE(len);
    tzif::Header h;
    auto result = tzif::read_header(&h, io::stringreader(bytes.substr(0, len)));
    EXPECT_EOF(result);
    EXPECT_EQ(tzif::ErrorKind::io, tzif::classify(result));
  }
}
