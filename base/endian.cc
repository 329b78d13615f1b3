// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/endian.h"

#include "base/logging.h"

namespace base {

namespace {

static int32_t utos32(uint32_t x) noexcept {
  if (x >= 0x80000000UL)
    return -static_cast<int32_t>(~x) - 1L;
  else
    return static_cast<int32_t>(x);
}

static int64_t utos64(uint64_t x) noexcept {
  if (x >= 0x8000000000000000ULL)
    return -static_cast<int64_t>(~x) - 1LL;
  else
    return static_cast<int64_t>(x);
}

struct BigEndian : public Endian {
  BigEndian() noexcept = default;

  uint32_t get_u32(const char* buf) const noexcept override {
    CHECK_NOTNULL(buf);
    const auto* p = reinterpret_cast<const unsigned char*>(buf);
    using W = uint32_t;
    return (W(p[0]) << 24) | (W(p[1]) << 16) | (W(p[2]) << 8) | W(p[3]);
  }

  uint64_t get_u64(const char* buf) const noexcept override {
    CHECK_NOTNULL(buf);
    const auto* p = reinterpret_cast<const unsigned char*>(buf);
    using W = uint64_t;
    return (W(p[0]) << 56) | (W(p[1]) << 48) | (W(p[2]) << 40) |
           (W(p[3]) << 32) | (W(p[4]) << 24) | (W(p[5]) << 16) |
           (W(p[6]) << 8) | W(p[7]);
  }

  void put_u32(char* buf, uint32_t in) const noexcept override {
    CHECK_NOTNULL(buf);
    auto* p = reinterpret_cast<unsigned char*>(buf);
    p[0] = (in >> 24) & 0xff;
    p[1] = (in >> 16) & 0xff;
    p[2] = (in >> 8) & 0xff;
    p[3] = in & 0xff;
  }

  void put_u64(char* buf, uint64_t in) const noexcept override {
    CHECK_NOTNULL(buf);
    auto* p = reinterpret_cast<unsigned char*>(buf);
    for (int i = 7; i >= 0; --i) {
      p[i] = in & 0xff;
      in >>= 8;
    }
  }
};

static const BigEndian kBigEndianImpl{};

}  // anonymous namespace

int32_t Endian::get_s32(const char* buf) const noexcept {
  return utos32(get_u32(buf));
}

int64_t Endian::get_s64(const char* buf) const noexcept {
  return utos64(get_u64(buf));
}

const Endian* const kBigEndian = &kBigEndianImpl;

}  // namespace base
