// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/options.h"

#include <mutex>

namespace base {

static std::mutex g_mu;
static Options* g_opts = nullptr;  // protected by g_mu

Options::Options(const Options& other) {
  for (const auto& pair : other.map_) {
    map_[pair.first] = pair.second->copy();
  }
}

Options& Options::operator=(const Options& other) {
  if (this != &other) {
    map_.clear();
    for (const auto& pair : other.map_) {
      map_[pair.first] = pair.second->copy();
    }
  }
  return *this;
}

Options default_options() {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_opts) return *g_opts;
  return Options();
}

void set_default_options(Options opts) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_opts)
    *g_opts = std::move(opts);
  else
    g_opts = new Options(std::move(opts));
}

}  // namespace base
