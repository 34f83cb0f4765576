// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include <string>

namespace protomod {

// Runs rustfmt, which must be on the PATH, over source and returns the
// formatted text.
absl::StatusOr<std::string> FormatRustSource(const std::string &source,
                                             const std::string &edition);

} // namespace protomod
