// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/block.h"

#include "base/logging.h"

namespace tzif {

base::Result read_block(Block* out, const io::Reader& r, TimeWidth width,
                        const base::Options& opts) {
  CHECK_NOTNULL(out);
  *out = Block();

  Block block;
  auto result = read_header(&block.header, r, opts);
  if (!result) return result;
  VLOG(2) << "tzif: read " << block.header;

  if (width == TimeWidth::legacy) block.header.version = 0;

  result = read_data(&block.data, r, block.header, opts);
  if (!result) return result;

  *out = std::move(block);
  return base::Result();
}

}  // namespace tzif
