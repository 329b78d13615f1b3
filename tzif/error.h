// tzif/error.h - Classification of TZif decoding failures
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_ERROR_H
#define TZIF_ERROR_H

#include <cstdint>
#include <ostream>

#include "base/result.h"

namespace tzif {

// The decoder reports two kinds of failure.
// - |io|: the byte source could not supply the requested bytes; the
//   io::Reader's Result is passed through unchanged
// - |invalid_signature|: a header did not begin with "TZif"
enum class ErrorKind : uint8_t {
  none = 0,
  io = 1,
  invalid_signature = 2,
};

// Returns the Result reported for a header with bad magic bytes.
base::Result invalid_signature();

// Maps a Result returned by this library onto an ErrorKind.
// - Only Results produced by |invalid_signature()| map to
//   |ErrorKind::invalid_signature|; every other failure is |ErrorKind::io|
ErrorKind classify(const base::Result& result);

const char* error_kind_name(ErrorKind kind) noexcept;

inline std::ostream& operator<<(std::ostream& o, ErrorKind kind) {
  return (o << error_kind_name(kind));
}

}  // namespace tzif

#endif  // TZIF_ERROR_H
