// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/error.h"

namespace tzif {

// Every signature failure is a copy of this one Result, so that a byte
// source reporting the same code and message is still classified as I/O.
static const base::Result& signature_failure() {
  static const auto& ref =
      *new base::Result(base::Result::wrong_type("invalid TZif signature"));
  return ref;
}

base::Result invalid_signature() { return signature_failure(); }

ErrorKind classify(const base::Result& result) {
  if (result) return ErrorKind::none;
  if (result.is_copy_of(signature_failure()))
    return ErrorKind::invalid_signature;
  return ErrorKind::io;
}

const char* error_kind_name(ErrorKind kind) noexcept {
  switch (kind) {
    case ErrorKind::none:
      return "none";
    case ErrorKind::io:
      return "io";
    case ErrorKind::invalid_signature:
      return "invalid_signature";
  }
  return "unknown";
}

}  // namespace tzif
