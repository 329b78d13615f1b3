// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/data.h"

#include <limits>

#include "base/endian.h"
#include "base/logging.h"

namespace tzif {

static int64_t get_time(const char* ptr, std::size_t width) {
  if (width == 8) return base::kBigEndian->get_s64(ptr);
  return base::kBigEndian->get_s32(ptr);
}

// Reads |count * width| bytes into |*out|.
static base::Result read_region(std::string* out, const io::Reader& r,
                                uint32_t count, std::size_t width,
                                const base::Options& opts) {
  uint64_t len = uint64_t(count) * width;
  if (len > std::numeric_limits<std::size_t>::max())
    return base::Result::out_of_range("TZif region of ", len,
                                      " bytes is too large");
  return r.read_exactly(out, len, opts);
}

static std::vector<uint8_t> to_bytes(const std::string& str) {
  const auto* p = reinterpret_cast<const unsigned char*>(str.data());
  return std::vector<uint8_t>(p, p + str.size());
}

std::string Data::designation(std::size_t idx) const {
  if (idx >= designations.size()) return std::string();
  auto end = designations.find('\0', idx);
  if (end == std::string::npos) end = designations.size();
  return designations.substr(idx, end - idx);
}

base::Result read_data(Data* out, const io::Reader& r, const Header& h,
                       const base::Options& opts) {
  CHECK_NOTNULL(out);
  *out = Data();

  const std::size_t w = h.time_size();
  std::string times, types, ttinfos, chars, leaps, isstd, isut;
  base::Result result;

  result = read_region(&times, r, h.timecnt, w, opts);
  if (!result) return result;
  result = read_region(&types, r, h.timecnt, 1, opts);
  if (!result) return result;
  result = read_region(&ttinfos, r, h.typecnt, 6, opts);
  if (!result) return result;
  result = read_region(&chars, r, h.charcnt, 1, opts);
  if (!result) return result;
  result = read_region(&leaps, r, h.leapcnt, w + 4, opts);
  if (!result) return result;
  result = read_region(&isstd, r, h.isstdcnt, 1, opts);
  if (!result) return result;
  result = read_region(&isut, r, h.isutcnt, 1, opts);
  if (!result) return result;

  Data data;

  data.transition_times.reserve(h.timecnt);
  for (std::size_t i = 0; i < h.timecnt; ++i) {
    data.transition_times.push_back(get_time(times.data() + i * w, w));
  }

  data.transition_types = to_bytes(types);

  data.local_time_types.reserve(h.typecnt);
  for (std::size_t i = 0; i < h.typecnt; ++i) {
    const char* p = ttinfos.data() + i * 6;
    data.local_time_types.emplace_back(base::kBigEndian->get_s32(p),
                                       p[4] == 1, static_cast<uint8_t>(p[5]));
  }

  data.designations = std::move(chars);

  data.leap_seconds.reserve(h.leapcnt);
  for (std::size_t i = 0; i < h.leapcnt; ++i) {
    const char* p = leaps.data() + i * (w + 4);
    data.leap_seconds.emplace_back(get_time(p, w),
                                   base::kBigEndian->get_s32(p + w));
  }

  data.std_wall_indicators = to_bytes(isstd);
  data.ut_indicators = to_bytes(isut);

  *out = std::move(data);
  return base::Result();
}

}  // namespace tzif
