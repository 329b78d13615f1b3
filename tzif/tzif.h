// tzif/tzif.h - Decoder for TZif time zone information files (RFC 8536)
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_TZIF_H
#define TZIF_TZIF_H

#include <memory>
#include <string>

#include "base/options.h"
#include "base/result.h"
#include "io/reader.h"
#include "tzif/block.h"
#include "tzif/data.h"
#include "tzif/error.h"
#include "tzif/header.h"

namespace tzif {

struct Options : public base::OptionsType {
  // If false, decoding stops after the version 1 block and the stream is
  // never read past it.
  bool want_extended_block;

  Options() noexcept : want_extended_block(true) {}

  // Resets this tzif::Options to the default values.
  void reset() { *this = Options(); }
};

// TZif is a decoded TZif file.
struct TZif {
  // The mandatory version 1 block, always decoded with 32-bit times.  Its
  // header reads as version 0 whatever the file says.
  Block block_v1;

  // The version 2+ block with 64-bit times, or null if the file has none.
  std::unique_ptr<Block> block_v2plus;

  bool has_extended_block() const noexcept { return !!block_v2plus; }

  // Returns the most precise block available.
  const Block& best_block() const noexcept {
    if (block_v2plus) return *block_v2plus;
    return block_v1;
  }
};

// Decodes a TZif file from |r|.
//
// The first block is mandatory: any failure reading it is returned as-is.
// A second block is optional: if it is missing, truncated, or malformed,
// decoding still succeeds and |out->block_v2plus| is null.  Trailing data
// after the second block (e.g. the POSIX TZ footer) is not read.
//
base::Result decode(TZif* out, const io::Reader& r,
                    const base::Options& opts = base::default_options());

// Like |decode| above, but reads from an in-memory copy of the file.
base::Result decode(TZif* out, std::string data,
                    const base::Options& opts = base::default_options());

}  // namespace tzif

#endif  // TZIF_TZIF_H
