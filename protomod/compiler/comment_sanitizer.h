// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace protomod {

// Rewrites a comment taken from a definition file so that rustdoc will not
// try to compile anything in it that is not a complete program.
//
// Fenced blocks (``` or ~~~) that are unlabeled or labeled as Rust are kept
// only if they look like a runnable program: they contain "fn main" and
// their brackets balance.  Any other Rust block has its opening fence
// retagged "ignore".  Blocks labeled with another language, "text" or
// "ignore" are left alone.  A fence that is never closed gets a closing fence
// appended and is made inert.  Runs of lines indented four or more columns,
// which markdown reads as code, are wrapped in an "ignore" fence.
//
// The heuristic errs on the side of ignoring: a runnable example whose
// brackets appear in char literals or raw strings is ignored, and a fragment
// that happens to contain "fn main" with balanced brackets is kept.
//
// Sanitizing is idempotent and never fails.
std::string SanitizeComment(std::string_view text);

// True if the lines look like a complete program.  Exposed for tests.
bool LooksRunnable(const std::vector<std::string> &lines);

} // namespace protomod
