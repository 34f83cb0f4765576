// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include "absl/status/statusor.h"
#include "protomod/compiler/emitter.h"
#include "zip.h"
#include <string>
#include <vector>

namespace protomod {

absl::Status AddFileToZip(zip_t *zip, const std::string &filename,
                          const std::string &content);

// Packs the files, keeping their relative paths, into a zip archive and
// returns its bytes.
absl::StatusOr<std::string> ZipFiles(const std::vector<EmittedFile> &files);

} // namespace protomod
