// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "base/concat.h"

#include <type_traits>

namespace {

template <typename T>
void convert_unsigned(std::string* out, T arg) {
  if (arg == 0) {
    out->push_back('0');
    return;
  }

  char tmp[24];
  std::size_t i = sizeof(tmp);
  while (arg != 0) {
    tmp[--i] = static_cast<char>('0' + (arg % 10));
    arg /= 10;
  }
  out->append(tmp + i, sizeof(tmp) - i);
}

template <typename T>
void convert_signed(std::string* out, T arg) {
  using U = typename std::make_unsigned<T>::type;
  if (arg < 0) {
    out->push_back('-');
    // Negate in unsigned arithmetic so that the minimum value survives.
    convert_unsigned(out, static_cast<U>(U(0) - static_cast<U>(arg)));
    return;
  }
  convert_unsigned(out, static_cast<U>(arg));
}

}  // anonymous namespace

namespace base {

void append_to(std::string* out, bool arg) {
  out->append(arg ? "true" : "false");
}

void append_to(std::string* out, signed char arg) { convert_signed(out, arg); }
void append_to(std::string* out, signed short arg) {
  convert_signed(out, arg);
}
void append_to(std::string* out, signed int arg) { convert_signed(out, arg); }
void append_to(std::string* out, signed long arg) { convert_signed(out, arg); }
void append_to(std::string* out, signed long long arg) {
  convert_signed(out, arg);
}

void append_to(std::string* out, unsigned char arg) {
  convert_unsigned(out, arg);
}
void append_to(std::string* out, unsigned short arg) {
  convert_unsigned(out, arg);
}
void append_to(std::string* out, unsigned int arg) {
  convert_unsigned(out, arg);
}
void append_to(std::string* out, unsigned long arg) {
  convert_unsigned(out, arg);
}
void append_to(std::string* out, unsigned long long arg) {
  convert_unsigned(out, arg);
}

}  // namespace base
