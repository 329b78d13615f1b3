// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/testing.h"

#include "base/endian.h"
#include "base/logging.h"

namespace tzif {
namespace testing {

static void put_u32(std::string* out, uint32_t x) {
  char buf[4];
  base::kBigEndian->put_u32(buf, x);
  out->append(buf, 4);
}

static void put_time(std::string* out, int64_t x, std::size_t w) {
  char buf[8];
  if (w == 8) {
    base::kBigEndian->put_u64(buf, static_cast<uint64_t>(x));
  } else {
    base::kBigEndian->put_u32(buf, static_cast<uint32_t>(x));
  }
  out->append(buf, w);
}

std::size_t BlockBuilder::effective_time_size() const noexcept {
  if (time_size_ != 0) return time_size_;
  return (version_ == 0) ? 4 : 8;
}

Header BlockBuilder::header() const {
  Header h;
  if (override_) h = counts_;
  else {
    h.isutcnt = isut_.size();
    h.isstdcnt = isstd_.size();
    h.leapcnt = leaps_.size();
    h.timecnt = times_.size();
    h.typecnt = ttinfos_.size();
    h.charcnt = chars_.size();
  }
  h.version = version_;
  return h;
}

std::string BlockBuilder::build() const {
  CHECK_EQ(magic_.size(), 4U);
  const std::size_t w = effective_time_size();
  const Header h = header();

  std::string out;
  out.append(magic_);
  out.push_back(static_cast<char>(h.version));
  out.append(15, '\0');
  put_u32(&out, h.isutcnt);
  put_u32(&out, h.isstdcnt);
  put_u32(&out, h.leapcnt);
  put_u32(&out, h.timecnt);
  put_u32(&out, h.typecnt);
  put_u32(&out, h.charcnt);

  for (int64_t t : times_) put_time(&out, t, w);
  for (uint8_t t : types_) out.push_back(static_cast<char>(t));
  for (const auto& rec : ttinfos_) {
    put_u32(&out, static_cast<uint32_t>(rec.utoff));
    out.push_back(rec.is_dst ? 1 : 0);
    out.push_back(static_cast<char>(rec.idx));
  }
  out.append(chars_);
  for (const auto& rec : leaps_) {
    put_time(&out, rec.occurrence, w);
    put_u32(&out, static_cast<uint32_t>(rec.correction));
  }
  for (uint8_t b : isstd_) out.push_back(static_cast<char>(b));
  for (uint8_t b : isut_) out.push_back(static_cast<char>(b));
  return out;
}

BlockBuilder minimal_block() {
  return BlockBuilder().type(3600, false, 0).designations(std::string(1, '\0'));
}

}  // namespace testing
}  // namespace tzif
