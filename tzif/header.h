// tzif/header.h - The fixed-size header of a TZif data block
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_HEADER_H
#define TZIF_HEADER_H

#include <cstdint>
#include <ostream>
#include <string>

#include "base/options.h"
#include "base/result.h"
#include "io/reader.h"

namespace tzif {

constexpr std::size_t kHeaderSize = 44;

// Header describes the layout of the data body that follows it.
//
// All counts are taken from the file as-is.  Nothing here checks that they
// are mutually consistent (e.g. |isutcnt <= typecnt|).
//
struct Header {
  // The raw version byte: 0x00 for version 1, '2', '3', '4' for later
  // versions, or whatever else the file contains.
  uint8_t version;

  uint32_t isutcnt;   // count of UT/local indicators
  uint32_t isstdcnt;  // count of standard/wall indicators
  uint32_t leapcnt;   // count of leap second records
  uint32_t timecnt;   // count of transition times
  uint32_t typecnt;   // count of local time type records
  uint32_t charcnt;   // count of designation bytes

  Header() noexcept : version(0),
                      isutcnt(0),
                      isstdcnt(0),
                      leapcnt(0),
                      timecnt(0),
                      typecnt(0),
                      charcnt(0) {}

  // Width in bytes of a transition time or leap second occurrence.
  std::size_t time_size() const noexcept { return (version == 0) ? 4 : 8; }

  // Total size in bytes of the data body described by this header.
  uint64_t data_size() const noexcept;

  void append_to(std::string* out) const;
  std::string as_string() const;
};

inline bool operator==(const Header& a, const Header& b) noexcept {
  return a.version == b.version && a.isutcnt == b.isutcnt &&
         a.isstdcnt == b.isstdcnt && a.leapcnt == b.leapcnt &&
         a.timecnt == b.timecnt && a.typecnt == b.typecnt &&
         a.charcnt == b.charcnt;
}
inline bool operator!=(const Header& a, const Header& b) noexcept {
  return !(a == b);
}

inline std::ostream& operator<<(std::ostream& o, const Header& h) {
  return (o << h.as_string());
}

// Reads one 44-byte header from |r| into |*out|.
// - A stream holding fewer than 44 bytes is an I/O error
// - Bad magic bytes are reported by |tzif::invalid_signature()|
base::Result read_header(Header* out, const io::Reader& r,
                         const base::Options& opts = base::default_options());

}  // namespace tzif

#endif  // TZIF_HEADER_H
