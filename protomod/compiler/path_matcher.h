// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace protomod {

// Matches fully qualified declaration paths such as ".pkg.Message.field"
// against a list of patterns:
//   "."           matches every path
//   ".pkg.Msg"    matches the path and anything declared inside it
//   "Msg.field"   matches any path ending in those segments
// Segments are compared whole, so ".pkg.Msg" does not match ".pkg.Msg2".
class PathMatcher {
public:
  PathMatcher() = default;
  explicit PathMatcher(std::vector<std::string> patterns);

  bool Matches(std::string_view path) const;

  bool empty() const { return patterns_.empty(); }

private:
  std::vector<std::string> patterns_;
};

} // namespace protomod
