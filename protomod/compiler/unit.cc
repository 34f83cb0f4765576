// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/unit.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"

namespace protomod {

std::string PackageName(const std::vector<std::string> &package_path) {
  return absl::StrJoin(package_path, ".");
}

std::vector<std::string> PackagePath(const std::string &package) {
  if (package.empty()) {
    return {};
  }
  return absl::StrSplit(package, '.');
}

} // namespace protomod
