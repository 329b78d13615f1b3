// base/options.h - Container for passing around options
// Copyright © 2017 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#ifndef BASE_OPTIONS_H
#define BASE_OPTIONS_H

#include <memory>
#include <type_traits>
#include <typeindex>
#include <typeinfo>
#include <unordered_map>

namespace base {

// OptionsType is an empty base class to mark option types.
struct OptionsType {};

// Options is a type-safe container, holding one instance each of various
// option classes (each option class marked by subclassing OptionsType).
//
// Typical usage:
//
//    base::Options opts;
//    opts.get<tzif::Options>().want_extended_block = false;
//    tzif::decode(&out, r, opts);
//
// Thread-safety: methods marked |const| may be called concurrently with each
//                other, but not concurrently with any non-|const| methods.
//
class Options {
 private:
  template <typename T>
  using is_option = typename std::is_base_of<OptionsType, T>::type;

 public:
  // Options is default constructible.
  Options() = default;

  // Options is copyable.
  Options(const Options& other);
  Options& operator=(const Options& other);

  // Options is moveable.
  Options(Options&& other) noexcept = default;
  Options& operator=(Options&& other) noexcept = default;

  // Accesses the value for the given option class, creating it if needed.
  template <typename T, typename SFINAE =
                            typename std::enable_if<is_option<T>::value>::type>
  T& get() {
    using U = typename std::decay<T>::type;
    auto& holder = map_[std::type_index(typeid(U))];
    if (!holder) holder.reset(new Holder<U>);
    return *static_cast<U*>(holder->pointer());
  }

  // Accesses the value for the given option class. [const]
  // Option classes that were never set read as default-constructed.
  template <typename T, typename SFINAE =
                            typename std::enable_if<is_option<T>::value>::type>
  const T& get() const {
    using U = typename std::decay<T>::type;
    auto it = map_.find(std::type_index(typeid(U)));
    if (it == map_.end()) {
      static const U& ref = *new U;
      return ref;
    }
    return *static_cast<const U*>(it->second->pointer());
  }

 private:
  struct HolderBase {
    virtual ~HolderBase() noexcept = default;
    virtual void* pointer() noexcept = 0;
    virtual std::unique_ptr<HolderBase> copy() const = 0;
  };

  template <typename T>
  struct Holder : public HolderBase {
    T value;

    void* pointer() noexcept override { return &value; }

    std::unique_ptr<HolderBase> copy() const override {
      return std::unique_ptr<HolderBase>(new Holder(*this));
    }
  };

  std::unordered_map<std::type_index, std::unique_ptr<HolderBase>> map_;
};

// Returns the default Options. Thread-safe.
Options default_options();

// Changes the default Options. Thread-safe.
void set_default_options(Options opts);

}  // namespace base

#endif  // BASE_OPTIONS_H
