// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include <string>
#include <string_view>
#include <vector>

namespace protomod {

// The text of the anchor line the generator writes in place of comment
// number index.  Anchors are never valid Rust so a stray one fails loudly.
std::string DocAnchor(size_t index);

// If the line, ignoring surrounding whitespace, is an anchor, stores its
// index and returns true.
bool ParseDocAnchor(std::string_view line, size_t *index);

// Turns comment text into "///" lines prefixed by indent.  An empty comment
// renders as nothing.
std::string RenderDocComment(std::string_view text, std::string_view indent);

// Replaces every anchor line in source with the rendered form of
// docs[index], indented like the anchor.  An empty entry removes the anchor
// line.  Fails if an anchor refers past the end of docs.
absl::StatusOr<std::string> InjectDocComments(
    std::string_view source, const std::vector<std::string> &docs);

} // namespace protomod
