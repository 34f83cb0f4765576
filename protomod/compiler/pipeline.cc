// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/pipeline.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/comment_sanitizer.h"
#include "protomod/compiler/doc_comments.h"
#include "protomod/compiler/errors.h"
#include "protomod/compiler/formatter.h"
#include "protomod/compiler/module_tree.h"
#include "protomod/compiler/output.h"
#include <iostream>
#include <system_error>

namespace protomod {

namespace fs = std::filesystem;

absl::StatusOr<SanitizedUnit> SanitizeUnit(const GeneratedUnit &unit,
                                           const PathMatcher &disabled) {
  std::vector<std::string> docs;
  docs.reserve(unit.comments.size());
  for (const auto &comment : unit.comments) {
    if (disabled.Matches(comment.declaration)) {
      docs.emplace_back();
    } else {
      docs.push_back(SanitizeComment(comment.text));
    }
  }
  absl::StatusOr<std::string> text = InjectDocComments(unit.source_text, docs);
  if (!text.ok()) {
    return GenerationError(absl::StrFormat("%s: %s", unit.file_name,
                                           text.status().message()));
  }
  return SanitizedUnit{unit.file_name, unit.package_path, *std::move(text),
                       unit.module_names};
}

absl::StatusOr<std::vector<EmittedFile>>
Assemble(const std::vector<GeneratedUnit> &units,
         const AssembleOptions &options) {
  PathMatcher disabled(options.disable_comments);
  ModuleTree tree;
  for (const auto &unit : units) {
    absl::StatusOr<SanitizedUnit> sanitized = SanitizeUnit(unit, disabled);
    if (!sanitized.ok()) {
      return sanitized.status();
    }
    if (absl::Status status = tree.Insert(*std::move(sanitized));
        !status.ok()) {
      return status;
    }
  }
  if (absl::Status status = tree.Resolve(); !status.ok()) {
    return status;
  }
  return EmitTree(tree, options.emit);
}

// Absolute, and without a trailing separator so that filename() names the
// directory itself.
static fs::path NormalizeOutputDirectory(const fs::path &dir) {
  std::error_code ec;
  fs::path result = fs::absolute(dir, ec);
  if (ec) {
    result = dir;
  }
  result = result.lexically_normal();
  if (!result.has_filename() && result.has_parent_path()) {
    result = result.parent_path();
  }
  return result;
}

absl::Status Run(Generator &generator, const Config &config) {
  if (config.definition_files.empty()) {
    return absl::InvalidArgumentError(
        "--proto_files needs at least one file to generate");
  }
  if (config.output_directory.empty()) {
    return absl::InvalidArgumentError("An output directory is required");
  }
  fs::path output_dir = NormalizeOutputDirectory(config.output_directory);
  if (!output_dir.has_filename()) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Output directory %s has no name to use for its module file",
        config.output_directory.string()));
  }

  absl::StatusOr<std::vector<GeneratedUnit>> units =
      generator.Generate(config.definition_files, config.include_paths);
  if (!units.ok()) {
    return units.status();
  }

  AssembleOptions options;
  options.emit.root_module = output_dir.filename().string();
  options.emit.prepend_header = config.prepend_header;
  options.emit.toplevel_attribute = config.toplevel_attribute;
  options.disable_comments = config.disable_comments;
  absl::StatusOr<std::vector<EmittedFile>> files = Assemble(*units, options);
  if (!files.ok()) {
    return files.status();
  }

  if (config.format_edition.has_value()) {
    for (auto &file : *files) {
      absl::StatusOr<std::string> formatted =
          FormatRustSource(file.content, *config.format_edition);
      if (!formatted.ok()) {
        return formatted.status();
      }
      file.content = *std::move(formatted);
    }
  }

  if (absl::Status status = CheckOutputConflicts(output_dir); !status.ok()) {
    return status;
  }
  absl::StatusOr<int> diff = CountDiffs(output_dir, *files);
  if (!diff.ok()) {
    return diff.status();
  }
  if (*diff == 0) {
    std::cerr << "Found no diff at " << output_dir << "\n";
    return absl::OkStatus();
  }
  std::cerr << "Found diff in " << *diff << " files at " << output_dir << "\n";
  if (config.mode == Mode::kValidate) {
    return ValidationError(
        absl::StrFormat("Found %d diffs at %s", *diff, output_dir.string()));
  }
  std::cerr << "Writing " << files->size() << " files to " << output_dir
            << "\n";
  return WriteTree(output_dir, *files);
}

} // namespace protomod
