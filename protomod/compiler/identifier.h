// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace protomod {

// True if s is a Rust keyword (strict, reserved or edition-dependent) and so
// cannot be used as a plain identifier.
bool IsRustReservedWord(const std::string &s);

// True for the keywords that cannot be turned into raw identifiers.
bool IsRawIdentifierForbidden(const std::string &s);

// Splits an identifier into words at underscores, lower-to-upper transitions
// and acronym boundaries ("HTTPServer" -> {"HTTP", "Server"}).
std::vector<std::string> SplitWords(std::string_view s);

// "FooBar" -> "foo_bar".  Leading underscores are preserved.
std::string ToSnakeCase(std::string_view s);

// "FOO_BAR" -> "FooBar".
std::string ToUpperCamel(std::string_view s);

// Makes s usable as a Rust identifier.  Reserved words become raw
// identifiers ("type" -> "r#type") unless they cannot be raw, in which case
// an underscore is appended ("self" -> "self_").
std::string EscapeIdentifier(std::string s);

// The identifier used for the module that holds a package segment or a
// message's nested types.
std::string ModuleIdentifier(std::string_view segment);

// The file or directory name for a module identifier.  A raw identifier is
// stored under its bare name ("r#type" -> "type").
std::string ModuleFileStem(const std::string &identifier);

} // namespace protomod
