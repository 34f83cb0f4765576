// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/attributes.h"
#include "absl/strings/ascii.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"

namespace protomod {

void TypeAttributes::Add(std::string pattern, std::string attribute) {
  entries_.emplace_back(PathMatcher({std::move(pattern)}),
                        std::move(attribute));
}

absl::Status TypeAttributes::AddPair(std::string_view pair) {
  size_t eq = pair.find('=');
  if (eq == std::string_view::npos) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Attribute \"%s\" must have the form path=attribute", pair));
  }
  std::string_view pattern = absl::StripAsciiWhitespace(pair.substr(0, eq));
  std::string_view attribute = absl::StripAsciiWhitespace(pair.substr(eq + 1));
  if (pattern.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Attribute \"%s\" has no path", pair));
  }
  if (attribute.empty()) {
    return absl::InvalidArgumentError(
        absl::StrFormat("Attribute \"%s\" has no attribute", pair));
  }
  Add(std::string(pattern), std::string(attribute));
  return absl::OkStatus();
}

absl::Status TypeAttributes::AddList(std::string_view list) {
  for (std::string_view pair : absl::StrSplit(list, ';')) {
    if (absl::StripAsciiWhitespace(pair).empty()) {
      continue;
    }
    if (absl::Status status = AddPair(pair); !status.ok()) {
      return status;
    }
  }
  return absl::OkStatus();
}

std::vector<std::string> TypeAttributes::Lookup(std::string_view path) const {
  std::vector<std::string> result;
  for (auto &[matcher, attribute] : entries_) {
    if (matcher.Matches(path)) {
      result.push_back(attribute);
    }
  }
  return result;
}

} // namespace protomod
