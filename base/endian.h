// base/endian.h - Fixed-width integer encoding and decoding
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_ENDIAN_H
#define BASE_ENDIAN_H

#include <cstdint>

namespace base {

struct Endian {
  virtual ~Endian() noexcept = default;

  virtual uint32_t get_u32(const char* buf) const noexcept = 0;
  virtual uint64_t get_u64(const char* buf) const noexcept = 0;

  virtual void put_u32(char* buf, uint32_t in) const noexcept = 0;
  virtual void put_u64(char* buf, uint64_t in) const noexcept = 0;

  // Two's complement views of get_u32 and get_u64.
  int32_t get_s32(const char* buf) const noexcept;
  int64_t get_s64(const char* buf) const noexcept;
};

extern const Endian* const kBigEndian;

}  // namespace base

#endif  // BASE_ENDIAN_H
