// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "protomod/compiler/emitter.h"
#include "protomod/compiler/generator.h"
#include "protomod/compiler/path_matcher.h"
#include "protomod/compiler/unit.h"
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace protomod {

struct AssembleOptions {
  EmitOptions emit;
  // Declarations whose comments are dropped instead of sanitized.  See
  // PathMatcher for the pattern syntax.
  std::vector<std::string> disable_comments;
};

enum class Mode {
  // Write the tree if it differs from what is on disk.
  kGenerate,
  // Fail if the tree differs from what is on disk.
  kValidate,
};

struct Config {
  Mode mode = Mode::kGenerate;
  std::vector<std::string> definition_files;
  std::vector<std::string> include_paths;
  // The module tree goes in here and the root module file next to it.
  std::filesystem::path output_directory;
  bool prepend_header = false;
  std::optional<std::string> toplevel_attribute;
  std::vector<std::string> disable_comments;
  // If set, every file is run through rustfmt with this edition.
  std::optional<std::string> format_edition;
};

// Sanitizes the unit's comments, or drops them if disabled matches their
// declaration, and splices them into its source.
absl::StatusOr<SanitizedUnit> SanitizeUnit(const GeneratedUnit &unit,
                                           const PathMatcher &disabled);

// Turns the generator's output into the files of the module tree.  Nothing
// here touches the disk.
absl::StatusOr<std::vector<EmittedFile>>
Assemble(const std::vector<GeneratedUnit> &units,
         const AssembleOptions &options);

// Runs the whole pipeline: generate, assemble, optionally format, then
// compare against the output directory and write or validate.
absl::Status Run(Generator &generator, const Config &config);

} // namespace protomod
