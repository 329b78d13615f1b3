// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <cerrno>

#include "base/result.h"
#include "base/result_testing.h"

using base::Result;
using RC = base::ResultCode;

TEST(Result, Basics) {
  Result result;
  EXPECT_EQ(RC::OK, result.code());
  EXPECT_EQ(0, result.errno_value());
  EXPECT_EQ("", result.message());
  EXPECT_EQ("OK(0)", result.as_string());
  EXPECT_TRUE(result);

  result = Result::eof("foo", 123);
  EXPECT_EQ(RC::END_OF_FILE, result.code());
  EXPECT_EQ(-1, result.errno_value());
  EXPECT_EQ("foo123", result.message());
  EXPECT_EQ("END_OF_FILE(18): foo123", result.as_string());
  EXPECT_FALSE(result);

  result = Result::wrong_type("invalid TZif signature");
  EXPECT_EQ(RC::WRONG_TYPE, result.code());
  EXPECT_EQ("WRONG_TYPE(7): invalid TZif signature", result.as_string());

  result = Result::from_errno(EIO, "read(2)");
  EXPECT_EQ(RC::DATA_LOSS, result.code());
  EXPECT_EQ(EIO, result.errno_value());
  EXPECT_EQ("read(2)", result.message());
  EXPECT_EQ("DATA_LOSS(17): read(2) errno:[EIO Input/output error]",
            result.as_string());
}

TEST(Result, Copies) {
  Result a = Result::out_of_range("x");
  Result b = a;
  EXPECT_EQ(RC::OUT_OF_RANGE, b.code());
  EXPECT_EQ("x", b.message());

  b.clear();
  EXPECT_OK(b);
  EXPECT_RESULT_CODE(OUT_OF_RANGE, a);

  swap(a, b);
  EXPECT_OK(a);
  EXPECT_RESULT_CODE(OUT_OF_RANGE, b);
}

TEST(Result, IsCopyOf) {
  Result a = Result::wrong_type("bad magic");
  Result b = a;
  Result c = Result::wrong_type("bad magic");
  EXPECT_TRUE(b.is_copy_of(a));
  EXPECT_TRUE(a.is_copy_of(b));
  EXPECT_FALSE(c.is_copy_of(a));
  EXPECT_EQ(a.as_string(), c.as_string());
}

TEST(Result, Macros) {
  EXPECT_OK(Result());
  EXPECT_FAILED_PRECONDITION(Result::failed_precondition());
  EXPECT_WRONG_TYPE(Result::wrong_type());
  EXPECT_DATA_LOSS(Result::from_errno(EIO, "read(2)"));
  EXPECT_EOF(Result::eof());
  EXPECT_RESULT_CODE(OUT_OF_RANGE, Result::out_of_range("too big"));
}
