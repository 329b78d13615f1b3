// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "io/reader.h"

#include <algorithm>
#include <mutex>

#include "base/logging.h"

namespace io {

using Lock = std::unique_lock<std::mutex>;

static base::Result reader_closed() {
  return base::Result::failed_precondition("io::Reader is closed");
}

void ReaderImpl::prologue(char* out, std::size_t* n, std::size_t min,
                          std::size_t max) {
  CHECK_NOTNULL(n);
  *n = 0;
  CHECK_LE(min, max);
  if (max > 0) CHECK_NOTNULL(out);
}

void Reader::assert_valid() const { CHECK(ptr_) << ": io::Reader is empty!"; }

base::Result Reader::read(std::string* out, std::size_t min, std::size_t max,
                          const base::Options& opts) const {
  assert_valid();
  CHECK_NOTNULL(out);
  CHECK_LE(min, max);
  out->clear();

  std::size_t block = opts.get<io::Options>().block_size;
  if (block == 0) block = ptr_->ideal_block_size();
  if (block == 0) block = kDefaultIdealBlockSize;

  std::size_t have = 0;
  do {
    std::size_t want = std::min(block, max - have);
    std::size_t want_min = (min > have) ? std::min(want, min - have) : 0;
    out->resize(have + want);
    std::size_t n = 0;
    auto result = ptr_->read(&(*out)[0] + have, &n, want_min, want, opts);
    have += n;
    out->resize(have);
    if (!result) return result;
    if (n == 0) break;
  } while (have < min);
  return base::Result();
}

inline namespace implementation {
class SyncFunctionReader : public ReaderImpl {
 public:
  SyncFunctionReader(SyncReadFn rfn, SyncCloseFn cfn)
      : rfn_(std::move(rfn)), cfn_(std::move(cfn)) {}

  std::size_t ideal_block_size() const noexcept override {
    return kDefaultIdealBlockSize;
  }

  base::Result read(char* out, std::size_t* n, std::size_t min,
                    std::size_t max, const base::Options& opts) override {
    prologue(out, n, min, max);
    return rfn_(out, n, min, max, opts);
  }

  base::Result close(const base::Options& opts) override { return cfn_(opts); }

 private:
  SyncReadFn rfn_;
  SyncCloseFn cfn_;
};

class StringReader : public ReaderImpl {
 public:
  explicit StringReader(std::string str) noexcept : str_(std::move(str)),
                                                    pos_(0),
                                                    closed_(false) {}

  std::size_t ideal_block_size() const noexcept override {
    return kDefaultIdealBlockSize;
  }

  base::Result read(char* out, std::size_t* n, std::size_t min,
                    std::size_t max, const base::Options& opts) override {
    prologue(out, n, min, max);

    Lock lock(mu_);
    if (closed_) return reader_closed();

    std::size_t len = str_.size() - pos_;
    if (len > max) len = max;
    if (len > 0) ::memcpy(out, str_.data() + pos_, len);
    pos_ += len;

    *n = len;
    if (min > len) return base::Result::eof();
    return base::Result();
  }

  base::Result close(const base::Options& opts) override {
    Lock lock(mu_);
    bool was = closed_;
    closed_ = true;
    if (was) return reader_closed();
    return base::Result();
  }

 private:
  const std::string str_;
  std::mutex mu_;
  std::size_t pos_;  // protected by mu_
  bool closed_;      // protected by mu_
};

class NullReader : public ReaderImpl {
 public:
  NullReader() noexcept = default;

  std::size_t ideal_block_size() const noexcept override { return 64; }

  base::Result read(char* out, std::size_t* n, std::size_t min,
                    std::size_t max, const base::Options& opts) override {
    prologue(out, n, min, max);
    if (min > 0) return base::Result::eof();
    return base::Result();
  }

  base::Result close(const base::Options& opts) override {
    return base::Result();
  }
};

}  // inline namespace implementation

Reader reader(SyncReadFn rfn, SyncCloseFn cfn) {
  return Reader(std::make_shared<SyncFunctionReader>(std::move(rfn),
                                                     std::move(cfn)));
}

Reader stringreader(std::string str) {
  return Reader(std::make_shared<StringReader>(std::move(str)));
}

Reader nullreader() { return Reader(std::make_shared<NullReader>()); }

}  // namespace io
