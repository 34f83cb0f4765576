// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "protomod/compiler/path_matcher.h"
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace protomod {

// Extra Rust attributes for generated types, chosen by the fully qualified
// protobuf path of the type (".pkg.Message", ".pkg.Message.oneof_name").
// Patterns follow PathMatcher.
class TypeAttributes {
public:
  void Add(std::string pattern, std::string attribute);

  // Adds a "pattern=attribute" pair.  The pair is split at the first '=',
  // so the attribute itself may contain '='.
  absl::Status AddPair(std::string_view pair);

  // Adds a list of pairs separated by ';'.  Empty entries are skipped.
  absl::Status AddList(std::string_view list);

  // The attributes whose pattern matches path, in the order they were added.
  std::vector<std::string> Lookup(std::string_view path) const;

  bool empty() const { return entries_.empty(); }

private:
  std::vector<std::pair<PathMatcher, std::string>> entries_;
};

struct GeneratorOptions {
  // Written above structs, enums and oneof enums.
  TypeAttributes type_attributes;
  // Written above enums and oneof enums.
  TypeAttributes enum_attributes;
};

} // namespace protomod
