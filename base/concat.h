// base/concat.h - Concatenate strings and stringable objects
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_CONCAT_H
#define BASE_CONCAT_H

#include <cstring>
#include <string>
#include <type_traits>
#include <utility>

namespace base {

// append_to stringifies its argument and appends it to |out|.
//
// Overloads exist for strings, characters, booleans, and the built-in
// integer types.  Any class with a member |void append_to(std::string*) const|
// is also stringable.
//
// Typical usage:
//    std::string out;
//    using base::append_to;
//    append_to(&out, obj);
//
inline void append_to(std::string* out, const std::string& arg) {
  out->append(arg);
}
inline void append_to(std::string* out, const char* arg) {
  if (arg) out->append(arg);
}
inline void append_to(std::string* out, char arg) { out->push_back(arg); }

void append_to(std::string* out, bool arg);
void append_to(std::string* out, signed char arg);
void append_to(std::string* out, unsigned char arg);
void append_to(std::string* out, signed short arg);
void append_to(std::string* out, unsigned short arg);
void append_to(std::string* out, signed int arg);
void append_to(std::string* out, unsigned int arg);
void append_to(std::string* out, signed long arg);
void append_to(std::string* out, unsigned long arg);
void append_to(std::string* out, signed long long arg);
void append_to(std::string* out, unsigned long long arg);

namespace internal {

template <typename T>
struct has_append_to {
 private:
  template <typename U>
  static auto check(U*) -> typename std::is_void<decltype(
      std::declval<const U&>().append_to(std::declval<std::string*>()))>::type;
  template <typename>
  static std::false_type check(...);

 public:
  static constexpr bool value = decltype(check<T>(nullptr))::value;
};

}  // namespace internal

template <typename T>
auto append_to(std::string* out, const T& arg) ->
    typename std::enable_if<internal::has_append_to<T>::value>::type {
  arg.append_to(out);
}

// concat_to appends the stringified form of each argument to |out|.
inline void concat_to(std::string* out) {}

template <typename First, typename... Rest>
void concat_to(std::string* out, const First& first, const Rest&... rest) {
  append_to(out, first);
  concat_to(out, rest...);
}

// concat returns the concatenation of the stringified arguments.
//
// Typical usage:
//    std::string msg = base::concat("read ", n, " of ", len, " bytes");
//
template <typename... Args>
std::string concat(const Args&... args) {
  std::string out;
  concat_to(&out, args...);
  return out;
}

}  // namespace base

#endif  // BASE_CONCAT_H
