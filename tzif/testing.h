// tzif/testing.h - Helpers for building TZif byte streams in tests
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_TESTING_H
#define TZIF_TESTING_H

#include <cstdint>
#include <string>
#include <vector>

#include "tzif/data.h"

namespace tzif {
namespace testing {

// BlockBuilder assembles the bytes of one TZif block: a header, then the
// data body.  Counts are derived from the regions added, unless overridden
// with |counts|.
//
// Typical usage:
//
//    auto bytes = BlockBuilder()
//                     .transition(1700000000, 0)
//                     .type(3600, false, 0)
//                     .designations(std::string("CET\0", 4))
//                     .build();
//
class BlockBuilder {
 public:
  BlockBuilder() noexcept : version_(0), time_size_(0), override_(false) {}

  // Sets the version byte.  Unless |time_size| says otherwise, version 0
  // writes 4-byte times and everything else 8-byte times.
  BlockBuilder& version(uint8_t v) {
    version_ = v;
    return *this;
  }

  // Forces the width of times in the data body, regardless of version.
  BlockBuilder& time_size(std::size_t w) {
    time_size_ = w;
    return *this;
  }

  // Replaces the magic bytes.
  BlockBuilder& magic(std::string m) {
    magic_ = std::move(m);
    return *this;
  }

  BlockBuilder& transition(int64_t at, uint8_t type) {
    times_.push_back(at);
    types_.push_back(type);
    return *this;
  }

  BlockBuilder& type(int32_t utoff, bool is_dst, uint8_t idx) {
    ttinfos_.emplace_back(utoff, is_dst, idx);
    return *this;
  }

  BlockBuilder& designations(std::string chars) {
    chars_ = std::move(chars);
    return *this;
  }

  BlockBuilder& leap(int64_t occurrence, int32_t correction) {
    leaps_.emplace_back(occurrence, correction);
    return *this;
  }

  BlockBuilder& std_wall(uint8_t b) {
    isstd_.push_back(b);
    return *this;
  }

  BlockBuilder& ut(uint8_t b) {
    isut_.push_back(b);
    return *this;
  }

  // Writes these counts into the header instead of the derived ones.
  BlockBuilder& counts(const Header& h) {
    counts_ = h;
    override_ = true;
    return *this;
  }

  // Returns the header that |build| will write.
  Header header() const;

  // Returns the 44-byte header followed by the data body.
  std::string build() const;

 private:
  std::size_t effective_time_size() const noexcept;

  uint8_t version_;
  std::size_t time_size_;
  std::string magic_ = "TZif";
  std::vector<int64_t> times_;
  std::vector<uint8_t> types_;
  std::vector<LocalTimeTypeRecord> ttinfos_;
  std::string chars_;
  std::vector<LeapSecondRecord> leaps_;
  std::vector<uint8_t> isstd_;
  std::vector<uint8_t> isut_;
  Header counts_;
  bool override_;
};

// Returns the smallest useful block: one local time type {3600, false, 0}
// and one designation byte.
BlockBuilder minimal_block();

}  // namespace testing
}  // namespace tzif

#endif  // TZIF_TESTING_H
