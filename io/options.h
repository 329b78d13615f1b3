// io/options.h - Configurable I/O behaviors
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef IO_OPTIONS_H
#define IO_OPTIONS_H

#include <cstddef>

#include "base/options.h"

namespace io {

struct Options : public base::OptionsType {
  // Overrides the preferred I/O block size, or 0 to use the default.
  // - Reads into a std::string grow the string by at most this many bytes
  //   at a time
  // - If non-zero, this value should almost certainly be a power of two
  std::size_t block_size;

  Options() noexcept : block_size(0) {}

  // Resets this io::Options to the default values.
  void reset() { *this = Options(); }
};

}  // namespace io

#endif  // IO_OPTIONS_H
