// Copyright © 2016 by Donald King <chronos@chronos-tachyon.net>
// Available under the MIT License. See LICENSE for details.

#include "gtest/gtest.h"

#include <string>

#include "base/options.h"

struct A : public base::OptionsType {
  int foo;
  bool bar;

  A() noexcept : foo(42), bar(true) {}
};

struct B : public base::OptionsType {
  std::string baz;

  B() noexcept : baz("23") {}
};

static int get_foo(const base::Options& o) { return o.get<A>().foo; }

static bool get_bar(const base::Options& o) { return o.get<A>().bar; }

static std::string get_baz(const base::Options& o) { return o.get<B>().baz; }

TEST(Options, Basics) {
  base::Options o;
  EXPECT_EQ(42, get_foo(o));
  EXPECT_TRUE(get_bar(o));
  EXPECT_EQ("23", get_baz(o));

  o.get<A>().foo++;
  o.get<A>().bar = false;
  o.get<B>().baz = "5";

  EXPECT_EQ(43, get_foo(o));
  EXPECT_FALSE(get_bar(o));
  EXPECT_EQ("5", get_baz(o));
}

TEST(Options, Copy) {
  base::Options o;
  o.get<A>().foo = 7;

  base::Options p = o;
  p.get<A>().foo = 8;
  EXPECT_EQ(7, get_foo(o));
  EXPECT_EQ(8, get_foo(p));

  o = p;
  EXPECT_EQ(8, get_foo(o));
}

TEST(Options, Defaults) {
  EXPECT_EQ(42, get_foo(base::default_options()));

  base::Options o;
  o.get<A>().foo = 99;
  base::set_default_options(o);
  EXPECT_EQ(99, get_foo(base::default_options()));

  base::set_default_options(base::Options());
  EXPECT_EQ(42, get_foo(base::default_options()));
}
