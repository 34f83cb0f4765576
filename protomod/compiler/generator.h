// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include "protomod/compiler/unit.h"
#include <string>
#include <vector>

namespace protomod {

// Compiles definition files into generated source.  Implementations return
// exactly one unit per definition file, in the order the files were given,
// or a generation error naming the offending file.
class Generator {
public:
  virtual ~Generator() = default;

  virtual absl::StatusOr<std::vector<GeneratedUnit>>
  Generate(const std::vector<std::string> &definition_files,
           const std::vector<std::string> &include_paths) = 0;
};

} // namespace protomod
