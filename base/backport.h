// base/backport.h - Backports of C++14 features
// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_BACKPORT_H
#define BASE_BACKPORT_H

#include <memory>
#include <utility>

namespace base {
namespace backport {

template <typename T, typename... Args>
std::unique_ptr<T> make_unique(Args&&... args) {
  return std::unique_ptr<T>(new T(std::forward<Args>(args)...));
}

}  // namespace backport
}  // namespace base

#endif  // BASE_BACKPORT_H
