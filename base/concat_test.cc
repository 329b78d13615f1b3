// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <cstdint>
#include <limits>
#include <string>

#include "base/concat.h"

TEST(StrCat, Basic) {
  EXPECT_EQ("", base::concat());
  EXPECT_EQ("abc", base::concat('a', 'b', 'c'));
  EXPECT_EQ("abcdef", base::concat("abc", "def"));
  EXPECT_EQ("abc123", base::concat("abc", 123));
  EXPECT_EQ("123abc", base::concat(123, "abc"));
  EXPECT_EQ("123456", base::concat(123, 456));
  EXPECT_EQ("truefalse", base::concat(true, false));

  const char chararray[] = "hello";
  EXPECT_EQ("hello", base::concat(chararray));

  const char* charptr = "goodbye";
  EXPECT_EQ("goodbye", base::concat(charptr));

  std::string str = "whattup?";
  EXPECT_EQ("whattup?", base::concat(str));
}

TEST(StrCat, Integers) {
  EXPECT_EQ("0", base::concat(0));
  EXPECT_EQ("-1", base::concat(-1));
  EXPECT_EQ("255", base::concat(uint8_t(255)));
  EXPECT_EQ("4294967295", base::concat(uint32_t(0xffffffffU)));
  EXPECT_EQ("-2147483648",
            base::concat(std::numeric_limits<int32_t>::min()));
  EXPECT_EQ("-9223372036854775808",
            base::concat(std::numeric_limits<int64_t>::min()));
  EXPECT_EQ("18446744073709551615",
            base::concat(std::numeric_limits<uint64_t>::max()));
}

struct Foo {
  void append_to(std::string* out) const { out->append("foo"); }
};

TEST(StrCat, Methods) {
  auto str = base::concat(Foo());
  EXPECT_EQ("foo", str);
  str = "<";
  base::concat_to(&str, Foo(), '>', Foo());
  EXPECT_EQ("<foo>foo", str);
}
