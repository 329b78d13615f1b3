// base/result_testing.h - Macros for checking base::Result values in tests
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_TESTING_H
#define BASE_RESULT_TESTING_H

#include "base/result.h"
#include "gtest/gtest.h"

namespace base {
namespace testing {

inline ::testing::AssertionResult ResultCodeEQ(const char* code_text,
                                               const char* expr_text,
                                               Result::Code code,
                                               const Result& expr) {
  auto cast = [](Result::Code code) {
    return static_cast<uint16_t>(static_cast<uint8_t>(code));
  };
  if (code == expr.code()) return ::testing::AssertionSuccess();
  return ::testing::AssertionFailure() << "expression: " << expr_text << "\n"
                                       << "  expected: " << code << "("
                                       << cast(code) << ")\n"
                                       << "       got: " << expr.as_string();
}

}  // namespace testing
}  // namespace base

#define ASSERT_RESULT_CODE(code, x)                  \
  ASSERT_PRED_FORMAT2(::base::testing::ResultCodeEQ, \
                      ::base::Result::Code::code, x)

#define EXPECT_RESULT_CODE(code, x)                  \
  EXPECT_PRED_FORMAT2(::base::testing::ResultCodeEQ, \
                      ::base::Result::Code::code, x)

#define ASSERT_OK(x) ASSERT_RESULT_CODE(OK, x)
#define ASSERT_WRONG_TYPE(x) ASSERT_RESULT_CODE(WRONG_TYPE, x)
#define ASSERT_EOF(x) ASSERT_RESULT_CODE(END_OF_FILE, x)

#define EXPECT_OK(x) EXPECT_RESULT_CODE(OK, x)
#define EXPECT_FAILED_PRECONDITION(x) EXPECT_RESULT_CODE(FAILED_PRECONDITION, x)
#define EXPECT_WRONG_TYPE(x) EXPECT_RESULT_CODE(WRONG_TYPE, x)
#define EXPECT_DATA_LOSS(x) EXPECT_RESULT_CODE(DATA_LOSS, x)
#define EXPECT_EOF(x) EXPECT_RESULT_CODE(END_OF_FILE, x)

#endif  // BASE_RESULT_TESTING_H
