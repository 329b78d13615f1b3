// io/reader.h - API for reading data from a source
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef IO_READER_H
#define IO_READER_H

#include <cstdint>
#include <cstring>
#include <functional>
#include <memory>
#include <string>

#include "base/options.h"
#include "base/result.h"
#include "io/options.h"

namespace io {

constexpr std::size_t kDefaultIdealBlockSize = 4096;

// ReaderImpl is the base class for implementations of the Reader API.
//
// The API is synchronous: |read| blocks until its contract is satisfied or
// an error occurs.  A byte source that is naturally asynchronous implements
// |read| by waiting for enough data to arrive.
class ReaderImpl {
 protected:
  ReaderImpl() noexcept = default;

 public:
  // Sanity-check helper for implementations of |read|.
  //
  // Typical usage:
  //
  //    base::Result read(char* out, std::size_t* n, std::size_t min,
  //                      std::size_t max,
  //                      const base::Options& opts) override {
  //      prologue(out, n, min, max);
  //      ...;  // actual implementation
  //    }
  //
  static void prologue(char* out, std::size_t* n, std::size_t min,
                       std::size_t max);

  // ReaderImpls are neither copyable nor moveable.
  ReaderImpl(const ReaderImpl&) = delete;
  ReaderImpl(ReaderImpl&&) = delete;
  ReaderImpl& operator=(const ReaderImpl&) = delete;
  ReaderImpl& operator=(ReaderImpl&&) = delete;

  // Closes the Reader, if not already closed, and frees resources.
  virtual ~ReaderImpl() noexcept = default;

  // Returns the block size which results in efficient reads.  For best
  // performance, read buffer sizes should be in multiples of this size.
  virtual std::size_t ideal_block_size() const noexcept = 0;

  // Reads up to |max| bytes into the buffer at |out|.
  // - NEVER reads more than |max| bytes
  // - ALWAYS sets |*n| to the number of bytes successfully read
  //   ~ In the case of an error, |*n| is the number of bytes *known* to have
  //     been read
  // - |*n >= min|, unless there was an error
  //   ~ If |*n < min| because the end of the stream was reached,
  //     it's an END_OF_FILE error
  //
  // Specifics for |min == 0 && max > 0|:
  // - MUST attempt to read some data
  // - MUST return with |*n == 0| if the end of the stream was reached
  // - NEVER returns an END_OF_FILE error
  //
  // THREAD SAFETY: Implementations of this function MUST be thread-safe.
  //
  virtual base::Result read(char* out, std::size_t* n, std::size_t min,
                            std::size_t max, const base::Options& opts) = 0;

  // Closes this Reader, potentially freeing resources.
  //
  // THREAD SAFETY: Implementations of this function MUST be thread-safe.
  //
  virtual base::Result close(const base::Options& opts) = 0;
};

// Reader is a handle to a readable I/O stream.
//
// A Reader typically points at an I/O stream, and therefore exists in the
// "non-empty" state.  In contrast, a Reader without a stream exists in the
// "empty" state.  A default-constructed Reader is empty, as is a Reader on
// which the |reset()| method is called.
//
// I/O streams are reference counted.  When the last Reader referencing a
// stream is destroyed or becomes empty, then the stream is closed.
//
// Most methods are illegal to call on an empty Reader.
//
class Reader {
 private:
  static constexpr std::size_t computed_min(std::size_t len) noexcept {
    return (len > 0) ? 1 : 0;
  }

 public:
  using Pointer = std::shared_ptr<ReaderImpl>;

  // Reader is constructible from an implementation.
  Reader(Pointer ptr) noexcept : ptr_(std::move(ptr)) {}

  // Reader is default constructible, starting in the empty state.
  Reader() noexcept : ptr_() {}

  // Reader is copyable and moveable.
  // - These copy or move the handle, not the stream itself.
  Reader(const Reader&) = default;
  Reader(Reader&&) noexcept = default;
  Reader& operator=(const Reader&) = default;
  Reader& operator=(Reader&&) noexcept = default;

  // Resets this Reader to the empty state.
  void reset() noexcept { ptr_.reset(); }

  // Swaps this Reader with another.
  void swap(Reader& other) noexcept { ptr_.swap(other.ptr_); }

  // Returns true iff this Reader is non-empty.
  explicit operator bool() const noexcept { return !!ptr_; }

  // Asserts that this Reader is non-empty.
  void assert_valid() const;

  // Returns this Reader's I/O stream implementation.
  const Pointer& implementation() const { return ptr_; }
  Pointer& implementation() { return ptr_; }

  // Returns the preferred block size for the I/O stream.
  std::size_t ideal_block_size() const {
    assert_valid();
    return ptr_->ideal_block_size();
  }

  // Fully qualified read {{{

  // Reads |min| to |max| bytes into the buffer at |out|, updating |*n|.
  // - See |ReaderImpl::read| for details of the API contract.
  base::Result read(char* out, std::size_t* n, std::size_t min,
                    std::size_t max,
                    const base::Options& opts = base::default_options()) const {
    assert_valid();
    return ptr_->read(out, n, min, max, opts);
  }

  // Like |read| above, but replaces the contents of a std::string.
  // - The string grows at most one block at a time, so a |max| much larger
  //   than the data actually available does not allocate |max| bytes
  base::Result read(std::string* out, std::size_t min, std::size_t max,
                    const base::Options& opts = base::default_options()) const;

  // }}}
  // Read up to N bytes {{{

  base::Result read(char* out, std::size_t* n, std::size_t len,
                    const base::Options& opts = base::default_options()) const {
    return read(out, n, computed_min(len), len, opts);
  }
  base::Result read(std::string* out, std::size_t len,
                    const base::Options& opts = base::default_options()) const {
    return read(out, computed_min(len), len, opts);
  }

  // }}}
  // Read exactly N bytes {{{

  // Fills |len| bytes at |out|, or fails.  A stream that ends early is an
  // END_OF_FILE error; |*n| then says how many bytes did arrive.
  base::Result read_exactly(
      char* out, std::size_t* n, std::size_t len,
      const base::Options& opts = base::default_options()) const {
    return read(out, n, len, len, opts);
  }
  base::Result read_exactly(
      std::string* out, std::size_t len,
      const base::Options& opts = base::default_options()) const {
    return read(out, len, len, opts);
  }

  // }}}
  // Close {{{

  // Closes this Reader, potentially freeing resources.
  base::Result close(const base::Options& opts = base::default_options()) const {
    assert_valid();
    return ptr_->close(opts);
  }

  // }}}

 private:
  Pointer ptr_;
};

inline void swap(Reader& a, Reader& b) noexcept { a.swap(b); }
inline bool operator==(const Reader& a, const Reader& b) noexcept {
  return a.implementation() == b.implementation();
}
inline bool operator!=(const Reader& a, const Reader& b) noexcept {
  return !(a == b);
}

using SyncReadFn = std::function<base::Result(
    char*, std::size_t*, std::size_t, std::size_t, const base::Options&)>;
using SyncCloseFn = std::function<base::Result(const base::Options&)>;

struct NoOpClose {
  base::Result operator()(const base::Options& opts) const {
    return base::Result();
  }
};

// Returns a Reader that wraps the given functor(s).
Reader reader(SyncReadFn rfn, SyncCloseFn cfn);
inline Reader reader(SyncReadFn rfn) {
  return reader(std::move(rfn), NoOpClose());
}

// Returns a Reader that produces bytes from a std::string.
Reader stringreader(std::string str);

// Returns a Reader that's always at EOF.
Reader nullreader();

}  // namespace io

#endif  // IO_READER_H
