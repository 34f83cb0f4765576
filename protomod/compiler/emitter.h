// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include "protomod/compiler/module_tree.h"
#include <optional>
#include <string>
#include <vector>

namespace protomod {

struct EmitOptions {
  // Name of the module holding the whole tree.  The root file is written as
  // <root_module>.rs and everything else under <root_module>/.
  std::string root_module = "proto_types";
  // Start every file with a comment naming the tool and its version.
  bool prepend_header = false;
  // Written once, at the top of the root file, after the lint attribute.
  std::optional<std::string> toplevel_attribute;
};

// A file to be written.  The path is relative to the directory that holds
// the root file and always uses '/' as a separator.
struct EmittedFile {
  std::string path;
  std::string content;

  bool operator==(const EmittedFile &other) const {
    return path == other.path && content == other.content;
  }
};

// The comment line written by EmitOptions::prepend_header, newline included.
std::string GeneratedHeader();

// Produces one file per node of a resolved tree, sorted by path.  A node
// at package path a.b becomes <root_module>/a/b.rs and declares its children
// with "pub mod" before its own content.
absl::StatusOr<std::vector<EmittedFile>> EmitTree(const ModuleTree &tree,
                                                  const EmitOptions &options);

} // namespace protomod
