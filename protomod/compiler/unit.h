// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>
#include <vector>

namespace protomod {

// A free-text comment attached to a declaration in a definition file.  The
// declaration is the fully qualified protobuf name with a leading dot, for
// example ".foo.bar.TestMessage.field_one".
struct DocComment {
  std::string declaration;
  std::string text;
};

// The output of the generator for one definition file.  The source text
// holds one anchor line (see DocAnchor) per entry in comments, at the place
// where the documentation belongs.
struct GeneratedUnit {
  std::string file_name;
  std::vector<std::string> package_path;
  std::string source_text;
  std::vector<DocComment> comments;
  // Modules the source declares inline at its top level ("pub mod x {").
  // A child package module with the same identifier would clash.
  std::vector<std::string> module_names;
};

// A unit whose anchors have been replaced by sanitized documentation.
struct SanitizedUnit {
  std::string file_name;
  std::vector<std::string> package_path;
  std::string text;
  std::vector<std::string> module_names;
};

// "foo.bar" for {"foo", "bar"}.
std::string PackageName(const std::vector<std::string> &package_path);

// Splits a dotted package name.  An empty package gives an empty path.
std::vector<std::string> PackagePath(const std::string &package);

} // namespace protomod
