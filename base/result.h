// base/result.h - Value type representing operation success or failure
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_RESULT_H
#define BASE_RESULT_H

#include <cstdint>
#include <memory>
#include <ostream>
#include <string>

#include "base/concat.h"

namespace base {

// ResultCode denotes the type of success/failure that a Result represents.
enum class ResultCode : uint8_t {
  // Success.
  OK = 0x00,

  // Failure of an unknown type, or whose type does not fit into these codes.
  UNKNOWN = 0x01,

  // Internal-only failure that should never be seen by the user.
  INTERNAL = 0x02,

  // The world was in a state that was not compatible with the operation.
  // For example: attempting to read from a stream that is already closed.
  FAILED_PRECONDITION = 0x04,

  // The operation was unable to find the specified resource.
  // Subtype of: FAILED_PRECONDITION
  NOT_FOUND = 0x05,

  // The operation found a resource of the wrong type.
  // For example: expected a TZif file, found something else.
  // Subtype of: FAILED_PRECONDITION
  WRONG_TYPE = 0x07,

  // The operation failed because the authenticated user is not authorized.
  // Subtype of: FAILED_PRECONDITION
  PERMISSION_DENIED = 0x08,

  // The operation failed because of an argument that doesn't make sense.
  INVALID_ARGUMENT = 0x0a,

  // The operation failed because an argument was outside the valid range.
  // Subtype of: INVALID_ARGUMENT
  OUT_OF_RANGE = 0x0b,

  // The operation failed because the resource does not support it.
  NOT_IMPLEMENTED = 0x0c,

  // The operation failed because the resource was not available.
  UNAVAILABLE = 0x0d,

  // The operation failed because the system interrupted it.
  ABORTED = 0x0e,

  // The operation failed because a finite resource was already in use.
  RESOURCE_EXHAUSTED = 0x0f,

  // The operation failed because data was lost or corrupted.
  DATA_LOSS = 0x11,

  // The operation failed because the end was reached prematurely.
  END_OF_FILE = 0x12,
};

// Returns the string representation of a Code.
const std::string& resultcode_name(ResultCode code) noexcept;

// ResultCode is stringable.
inline void append_to(std::string* out, ResultCode code) {
  out->append(resultcode_name(code));
}

inline std::ostream& operator<<(std::ostream& os, ResultCode arg) {
  return (os << resultcode_name(arg));
}

namespace internal {
struct ResultRep {
  ResultCode code;
  int err_no;
  std::string message;

  ResultRep(ResultCode code, int err_no, std::string message) noexcept
      : code(code),
        err_no(err_no),
        message(std::move(message)) {}
};

const std::string& empty_string() noexcept;
}  // namespace internal

// Result represents the success or failure of an operation.
// Failures are further categorized by the type of failure.
class Result {
 public:
  using Code = ResultCode;

 private:
  using Rep = internal::ResultRep;
  using RepPtr = std::shared_ptr<const Rep>;

  static RepPtr make(Code code, int err_no, std::string message);

 public:
  // Constructors for fixed Code values {{{

  template <typename... Args>
  static Result failed_precondition(const Args&... args) {
    return Result(Code::FAILED_PRECONDITION, concat(args...));
  }

  template <typename... Args>
  static Result wrong_type(const Args&... args) {
    return Result(Code::WRONG_TYPE, concat(args...));
  }

  template <typename... Args>
  static Result out_of_range(const Args&... args) {
    return Result(Code::OUT_OF_RANGE, concat(args...));
  }

  template <typename... Args>
  static Result eof(const Args&... args) {
    return Result(Code::END_OF_FILE, concat(args...));
  }

  // }}}
  // Constructors for errno-to-Result conversions {{{

  static Result from_errno(int err_no, std::string what);

  template <typename... Args>
  static Result from_errno(int err_no, const Args&... args) {
    return from_errno(err_no, concat(args...));
  }

  // }}}

  // Result is default constructible, copyable, and moveable.
  // The default-constructed value has code OK, message "", errno 0.
  Result() noexcept = default;
  Result(const Result&) noexcept = default;
  Result(Result&&) noexcept = default;
  Result& operator=(const Result&) noexcept = default;
  Result& operator=(Result&&) noexcept = default;

  Result(Code code, std::string message = std::string(), int err_no = -1)
      : rep_(make(code, err_no, std::move(message))) {}

  void clear() noexcept { rep_.reset(); }
  void swap(Result& other) noexcept { rep_.swap(other.rep_); }

  // Checks if the Result was successful.
  explicit operator bool() const noexcept { return !rep_; }

  // Returns the Code for this Result.
  Code code() const noexcept {
    if (rep_) return rep_->code;
    return Code::OK;
  }

  // Returns the value of errno(3) associated with this Result.
  int errno_value() const noexcept {
    if (rep_) return rep_->err_no;
    return 0;
  }

  // Returns the message associated with this Result.
  const std::string& message() const noexcept {
    if (rep_) return rep_->message;
    return internal::empty_string();
  }

  // Returns true iff this Result is a copy of |other|, or |other| is a copy
  // of this one.  Two failures built separately are never copies, even if
  // their code and message are equal.
  bool is_copy_of(const Result& other) const noexcept {
    return rep_ == other.rep_;
  }

  // Stringifies this Result into a human-friendly form.
  std::string as_string() const;
  void append_to(std::string* out) const;

 private:
  RepPtr rep_;
};

inline void swap(Result& a, Result& b) noexcept { a.swap(b); }

inline std::ostream& operator<<(std::ostream& os, const Result& arg) {
  return (os << arg.as_string());
}

}  // namespace base

#endif  // BASE_RESULT_H
