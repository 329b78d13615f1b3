// tzif/data.h - The variable-length body of a TZif data block
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_DATA_H
#define TZIF_DATA_H

#include <cstdint>
#include <string>
#include <vector>

#include "base/options.h"
#include "base/result.h"
#include "io/reader.h"
#include "tzif/header.h"

namespace tzif {

// A "ttinfo" entry: one local time type.
struct LocalTimeTypeRecord {
  int32_t utoff;  // seconds east of UT
  bool is_dst;
  uint8_t idx;  // byte offset into Data::designations

  LocalTimeTypeRecord() noexcept : utoff(0), is_dst(false), idx(0) {}
  LocalTimeTypeRecord(int32_t utoff, bool is_dst, uint8_t idx) noexcept
      : utoff(utoff),
        is_dst(is_dst),
        idx(idx) {}
};

inline bool operator==(const LocalTimeTypeRecord& a,
                       const LocalTimeTypeRecord& b) noexcept {
  return a.utoff == b.utoff && a.is_dst == b.is_dst && a.idx == b.idx;
}
inline bool operator!=(const LocalTimeTypeRecord& a,
                       const LocalTimeTypeRecord& b) noexcept {
  return !(a == b);
}

struct LeapSecondRecord {
  int64_t occurrence;
  int32_t correction;

  LeapSecondRecord() noexcept : occurrence(0), correction(0) {}
  LeapSecondRecord(int64_t occurrence, int32_t correction) noexcept
      : occurrence(occurrence),
        correction(correction) {}
};

inline bool operator==(const LeapSecondRecord& a,
                       const LeapSecondRecord& b) noexcept {
  return a.occurrence == b.occurrence && a.correction == b.correction;
}
inline bool operator!=(const LeapSecondRecord& a,
                       const LeapSecondRecord& b) noexcept {
  return !(a == b);
}

// Data holds the decoded regions of one data block.  Each vector's length
// equals the matching count in the Header it was read with.
struct Data {
  std::vector<int64_t> transition_times;
  std::vector<uint8_t> transition_types;
  std::vector<LocalTimeTypeRecord> local_time_types;
  std::vector<LeapSecondRecord> leap_seconds;

  // Raw regions, kept byte-for-byte.
  std::string designations;
  std::vector<uint8_t> std_wall_indicators;
  std::vector<uint8_t> ut_indicators;

  // Returns the NUL-terminated designation starting at byte |idx|.
  // An unterminated designation runs to the end of the region; an |idx|
  // past the end yields "".
  std::string designation(std::size_t idx) const;
};

// Reads the data body described by |h| from |r| into |*out|.
// - Regions are read in file order, each one in full or not at all
// - Times are |h.time_size()| bytes wide
// - On failure, |*out| is left empty
base::Result read_data(Data* out, const io::Reader& r, const Header& h,
                       const base::Options& opts = base::default_options());

}  // namespace tzif

#endif  // TZIF_DATA_H
