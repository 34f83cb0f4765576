// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/attributes.h"
#include <gtest/gtest.h>

namespace protomod {

TEST(TypeAttributesTest, Empty) {
  TypeAttributes attrs;
  ASSERT_TRUE(attrs.empty());
  ASSERT_TRUE(attrs.Lookup(".foo.Bar").empty());
}

TEST(TypeAttributesTest, LookupInOrder) {
  TypeAttributes attrs;
  attrs.Add(".foo", "#[derive(Eq)]");
  attrs.Add("Bar", "#[derive(Hash)]");
  attrs.Add(".other", "#[derive(Default)]");
  ASSERT_EQ(std::vector<std::string>({"#[derive(Eq)]", "#[derive(Hash)]"}),
            attrs.Lookup(".foo.Bar"));
  ASSERT_EQ(std::vector<std::string>({"#[derive(Eq)]"}),
            attrs.Lookup(".foo.Baz"));
  ASSERT_TRUE(attrs.Lookup(".foobar.Baz").empty());
}

TEST(TypeAttributesTest, AddPair) {
  TypeAttributes attrs;
  ASSERT_TRUE(
      attrs.AddPair(".foo.Bar=#[serde(rename_all = \"camelCase\")]").ok());
  ASSERT_EQ(std::vector<std::string>({"#[serde(rename_all = \"camelCase\")]"}),
            attrs.Lookup(".foo.Bar"));
}

TEST(TypeAttributesTest, BadPairs) {
  TypeAttributes attrs;
  absl::Status status = attrs.AddPair("#[derive(Eq)]");
  ASSERT_EQ(absl::StatusCode::kInvalidArgument, status.code());
  ASSERT_FALSE(attrs.AddPair("=#[derive(Eq)]").ok());
  ASSERT_FALSE(attrs.AddPair(".foo=").ok());
  ASSERT_TRUE(attrs.empty());
}

TEST(TypeAttributesTest, AddList) {
  TypeAttributes attrs;
  ASSERT_TRUE(
      attrs.AddList(".=#[derive(Eq)];; Color = #[derive(serde::Serialize)] ;")
          .ok());
  ASSERT_EQ(std::vector<std::string>(
                {"#[derive(Eq)]", "#[derive(serde::Serialize)]"}),
            attrs.Lookup(".foo.Color"));
  ASSERT_EQ(std::vector<std::string>({"#[derive(Eq)]"}),
            attrs.Lookup(".foo.Bar"));
  ASSERT_FALSE(attrs.AddList(".a=#[x];broken").ok());
}

} // namespace protomod
