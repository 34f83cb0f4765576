// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/status.h"
#include <string>
#include <string_view>

namespace protomod {

// The kinds of failure the pipeline reports.  Each kind maps to its own
// status code and is also recorded as a payload on the status so that it
// survives being passed through layers that only look at the code.
enum class ErrorKind {
  kNone,
  kGeneration,
  kIdentifierCollision,
  kOutputConflict,
  kValidation,
  kOther,
};

absl::Status GenerationError(std::string_view message);
absl::Status IdentifierCollisionError(std::string_view message);
absl::Status OutputConflictError(std::string_view message);

// A validate run found the reference tree out of date.
absl::Status ValidationError(std::string_view message);

ErrorKind GetErrorKind(const absl::Status &status);

const char *ErrorKindName(ErrorKind kind);

} // namespace protomod
