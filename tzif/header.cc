// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/header.h"

#include <cstring>

#include "base/concat.h"
#include "base/endian.h"
#include "base/logging.h"
#include "tzif/error.h"

namespace tzif {

static const char kMagic[] = {'T', 'Z', 'i', 'f'};

uint64_t Header::data_size() const noexcept {
  uint64_t w = time_size();
  return (w * timecnt) + uint64_t(timecnt) + (6U * uint64_t(typecnt)) +
         uint64_t(charcnt) + ((w + 4U) * leapcnt) + uint64_t(isstdcnt) +
         uint64_t(isutcnt);
}

void Header::append_to(std::string* out) const {
  CHECK_NOTNULL(out);
  base::concat_to(out, "Header{version:");
  if (version >= 0x20 && version < 0x7f)
    base::concat_to(out, '\'', char(version), '\'');
  else
    base::concat_to(out, unsigned(version));
  base::concat_to(out, " isutcnt:", isutcnt, " isstdcnt:", isstdcnt,
                  " leapcnt:", leapcnt, " timecnt:", timecnt, " typecnt:",
                  typecnt, " charcnt:", charcnt, "}");
}

std::string Header::as_string() const {
  std::string out;
  append_to(&out);
  return out;
}

base::Result read_header(Header* out, const io::Reader& r,
                         const base::Options& opts) {
  CHECK_NOTNULL(out);
  *out = Header();

  char buf[kHeaderSize];
  std::size_t n = 0;
  auto result = r.read_exactly(buf, &n, kHeaderSize, opts);
  if (!result) return result;
  CHECK_EQ(n, kHeaderSize);

  if (::memcmp(buf, kMagic, sizeof(kMagic)) != 0) return invalid_signature();

  // Bytes 5..19 are reserved for future use.
  Header h;
  h.version = static_cast<uint8_t>(buf[4]);
  h.isutcnt = base::kBigEndian->get_u32(buf + 20);
  h.isstdcnt = base::kBigEndian->get_u32(buf + 24);
  h.leapcnt = base::kBigEndian->get_u32(buf + 28);
  h.timecnt = base::kBigEndian->get_u32(buf + 32);
  h.typecnt = base::kBigEndian->get_u32(buf + 36);
  h.charcnt = base::kBigEndian->get_u32(buf + 40);
  *out = h;
  return base::Result();
}

}  // namespace tzif
