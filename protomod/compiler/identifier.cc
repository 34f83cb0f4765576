// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/identifier.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"

namespace protomod {

bool IsRustReservedWord(const std::string &s) {
  static const absl::flat_hash_set<std::string> reserved_words = {
      // Strict keywords.
      "as",
      "async",
      "await",
      "break",
      "const",
      "continue",
      "crate",
      "dyn",
      "else",
      "enum",
      "extern",
      "false",
      "fn",
      "for",
      "if",
      "impl",
      "in",
      "let",
      "loop",
      "match",
      "mod",
      "move",
      "mut",
      "pub",
      "ref",
      "return",
      "self",
      "Self",
      "static",
      "struct",
      "super",
      "trait",
      "true",
      "type",
      "unsafe",
      "use",
      "where",
      "while",
      // Reserved for future use.
      "abstract",
      "become",
      "box",
      "do",
      "final",
      "gen",
      "macro",
      "override",
      "priv",
      "try",
      "typeof",
      "unsized",
      "virtual",
      "yield",
      // Not a keyword, but not an identifier either.
      "_",
  };
  return reserved_words.contains(s);
}

bool IsRawIdentifierForbidden(const std::string &s) {
  static const absl::flat_hash_set<std::string> forbidden = {
      "crate", "self", "Self", "super", "_",
  };
  return forbidden.contains(s);
}

std::vector<std::string> SplitWords(std::string_view s) {
  std::vector<std::string> words;
  std::string word;
  auto flush = [&words, &word]() {
    if (!word.empty()) {
      words.push_back(word);
      word.clear();
    }
  };
  for (size_t i = 0; i < s.size(); i++) {
    char c = s[i];
    if (c == '_' || !absl::ascii_isalnum(c)) {
      flush();
      continue;
    }
    if (absl::ascii_isupper(c) && !word.empty()) {
      char prev = s[i - 1];
      bool next_is_lower = i + 1 < s.size() && absl::ascii_islower(s[i + 1]);
      if (absl::ascii_islower(prev) || absl::ascii_isdigit(prev) ||
          (absl::ascii_isupper(prev) && next_is_lower)) {
        flush();
      }
    }
    word += c;
  }
  flush();
  return words;
}

std::string ToSnakeCase(std::string_view s) {
  size_t leading = 0;
  while (leading < s.size() && s[leading] == '_') {
    leading++;
  }
  std::vector<std::string> words = SplitWords(s);
  for (auto &word : words) {
    absl::AsciiStrToLower(&word);
  }
  return std::string(leading, '_') + absl::StrJoin(words, "_");
}

std::string ToUpperCamel(std::string_view s) {
  std::string result;
  for (auto &word : SplitWords(s)) {
    absl::AsciiStrToLower(&word);
    word[0] = absl::ascii_toupper(word[0]);
    result += word;
  }
  return result;
}

std::string EscapeIdentifier(std::string s) {
  if (s.empty()) {
    s = "_";
  } else if (absl::ascii_isdigit(s[0])) {
    s = "_" + s;
  }
  if (!IsRustReservedWord(s)) {
    return s;
  }
  if (IsRawIdentifierForbidden(s)) {
    return s + "_";
  }
  return "r#" + s;
}

std::string ModuleIdentifier(std::string_view segment) {
  return EscapeIdentifier(ToSnakeCase(segment));
}

std::string ModuleFileStem(const std::string &identifier) {
  if (absl::StartsWith(identifier, "r#")) {
    return identifier.substr(2);
  }
  return identifier;
}

} // namespace protomod
