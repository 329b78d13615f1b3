// tzif/block.h - One header plus the data body it describes
// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef TZIF_BLOCK_H
#define TZIF_BLOCK_H

#include <cstdint>

#include "base/options.h"
#include "base/result.h"
#include "io/reader.h"
#include "tzif/data.h"
#include "tzif/header.h"

namespace tzif {

struct Block {
  Header header;
  Data data;
};

// How wide the times in a data body are.
enum class TimeWidth : uint8_t {
  // As implied by the header's version byte.
  declared = 0,

  // Always 32 bits.  The version 1 block of a file is written this way no
  // matter what version the file claims to be, so the header is recorded
  // as version 0.
  legacy = 1,
};

// Reads one Header and the Data it describes.
// - With |TimeWidth::legacy|, |out->header.version| is normalized to 0
// - On failure, |*out| is left empty
base::Result read_block(Block* out, const io::Reader& r,
                        TimeWidth width = TimeWidth::declared,
                        const base::Options& opts = base::default_options());

}  // namespace tzif

#endif  // TZIF_BLOCK_H
