// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "protomod/compiler/emitter.h"
#include <filesystem>
#include <string>
#include <vector>

namespace protomod {

// The emitted paths are relative to the parent of the output directory.
// The root module file, <output_dir name>.rs, sits next to the output
// directory and everything else goes inside it.

// Fails with an output conflict if something on disk is in the way: the
// output directory is not a directory, or the root module file is not a
// regular file.
absl::Status CheckOutputConflicts(const std::filesystem::path &output_dir);

// Counts the files that differ between files and what is currently on
// disk.  New, changed and stale files count once each, as does a missing or
// changed root module file.  A missing output directory counts as empty.
absl::StatusOr<int> CountDiffs(const std::filesystem::path &output_dir,
                               const std::vector<EmittedFile> &files);

// Replaces the contents of the output directory and the root module file
// with files.
absl::Status WriteTree(const std::filesystem::path &output_dir,
                       const std::vector<EmittedFile> &files);

absl::StatusOr<std::string> ReadFile(const std::filesystem::path &path);

} // namespace protomod
