// Copyright © 2026 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "tzif/tzif.h"

#include "base/backport.h"
#include "base/logging.h"

namespace tzif {

base::Result decode(TZif* out, const io::Reader& r,
                    const base::Options& opts) {
  CHECK_NOTNULL(out);
  *out = TZif();

  TZif file;
  auto result = read_block(&file.block_v1, r, TimeWidth::legacy, opts);
  if (!result) return result;

  if (opts.get<Options>().want_extended_block) {
    auto block = base::backport::make_unique<Block>();
    result = read_block(block.get(), r, TimeWidth::declared, opts);
    if (result) {
      file.block_v2plus = std::move(block);
    } else {
      VLOG(1) << "tzif: no extended block: " << result;
    }
  }

  *out = std::move(file);
  return base::Result();
}

base::Result decode(TZif* out, std::string data, const base::Options& opts) {
  return decode(out, io::stringreader(std::move(data)), opts);
}

}  // namespace tzif
