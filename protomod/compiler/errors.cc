// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/errors.h"
#include "absl/strings/cord.h"

namespace protomod {

static constexpr char kErrorKindUrl[] = "type.protomod/error_kind";

static absl::Status MakeError(absl::StatusCode code, ErrorKind kind,
                              std::string_view message) {
  absl::Status status(code, message);
  status.SetPayload(kErrorKindUrl, absl::Cord(ErrorKindName(kind)));
  return status;
}

absl::Status GenerationError(std::string_view message) {
  return MakeError(absl::StatusCode::kInvalidArgument, ErrorKind::kGeneration,
                   message);
}

absl::Status IdentifierCollisionError(std::string_view message) {
  return MakeError(absl::StatusCode::kAlreadyExists,
                   ErrorKind::kIdentifierCollision, message);
}

absl::Status OutputConflictError(std::string_view message) {
  return MakeError(absl::StatusCode::kFailedPrecondition,
                   ErrorKind::kOutputConflict, message);
}

absl::Status ValidationError(std::string_view message) {
  return MakeError(absl::StatusCode::kAborted, ErrorKind::kValidation,
                   message);
}

ErrorKind GetErrorKind(const absl::Status &status) {
  if (status.ok()) {
    return ErrorKind::kNone;
  }
  auto payload = status.GetPayload(kErrorKindUrl);
  if (!payload.has_value()) {
    return ErrorKind::kOther;
  }
  for (ErrorKind kind :
       {ErrorKind::kGeneration, ErrorKind::kIdentifierCollision,
        ErrorKind::kOutputConflict, ErrorKind::kValidation}) {
    if (*payload == ErrorKindName(kind)) {
      return kind;
    }
  }
  return ErrorKind::kOther;
}

const char *ErrorKindName(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::kNone:
    return "none";
  case ErrorKind::kGeneration:
    return "generation";
  case ErrorKind::kIdentifierCollision:
    return "identifier_collision";
  case ErrorKind::kOutputConflict:
    return "output_conflict";
  case ErrorKind::kValidation:
    return "validation";
  case ErrorKind::kOther:
    return "other";
  }
  return "unknown";
}

} // namespace protomod
