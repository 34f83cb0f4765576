// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/path_matcher.h"
#include <gtest/gtest.h>

namespace protomod {

TEST(PathMatcherTest, Empty) {
  PathMatcher matcher;
  ASSERT_TRUE(matcher.empty());
  ASSERT_FALSE(matcher.Matches(".foo.Bar"));
}

TEST(PathMatcherTest, All) {
  PathMatcher matcher({"."});
  ASSERT_TRUE(matcher.Matches(".foo.Bar"));
  ASSERT_TRUE(matcher.Matches(".x"));
}

TEST(PathMatcherTest, Prefix) {
  PathMatcher matcher({".foo.bar"});
  ASSERT_TRUE(matcher.Matches(".foo.bar"));
  ASSERT_TRUE(matcher.Matches(".foo.bar.TestMessage.field"));
  ASSERT_FALSE(matcher.Matches(".foo.barbaz.TestMessage"));
  ASSERT_FALSE(matcher.Matches(".foo"));
  ASSERT_FALSE(matcher.Matches(".x.foo.bar"));
}

TEST(PathMatcherTest, Suffix) {
  PathMatcher matcher({"TestMessage.field"});
  ASSERT_TRUE(matcher.Matches(".foo.TestMessage.field"));
  ASSERT_TRUE(matcher.Matches(".a.b.TestMessage.field"));
  ASSERT_FALSE(matcher.Matches(".foo.TestMessage.field.x"));
  ASSERT_FALSE(matcher.Matches(".foo.OtherTestMessage.field"));
}

TEST(PathMatcherTest, AnyPattern) {
  PathMatcher matcher({".a", "Thing"});
  ASSERT_TRUE(matcher.Matches(".a.X"));
  ASSERT_TRUE(matcher.Matches(".b.Thing"));
  ASSERT_FALSE(matcher.Matches(".b.Other"));
}

} // namespace protomod
