// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/path_matcher.h"
#include "absl/strings/match.h"
#include "absl/strings/str_split.h"
#include <algorithm>

namespace protomod {

PathMatcher::PathMatcher(std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {}

static std::vector<std::string_view> Segments(std::string_view path) {
  return absl::StrSplit(path, '.', absl::SkipEmpty());
}

bool PathMatcher::Matches(std::string_view path) const {
  std::vector<std::string_view> segments = Segments(path);
  for (const auto &pattern : patterns_) {
    if (pattern == ".") {
      return true;
    }
    std::vector<std::string_view> wanted = Segments(pattern);
    if (wanted.empty() || wanted.size() > segments.size()) {
      continue;
    }
    if (absl::StartsWith(pattern, ".")) {
      if (std::equal(wanted.begin(), wanted.end(), segments.begin())) {
        return true;
      }
    } else if (std::equal(wanted.rbegin(), wanted.rend(),
                          segments.rbegin())) {
      return true;
    }
  }
  return false;
}

} // namespace protomod
