// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/comment_sanitizer.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include <optional>

namespace protomod {

namespace {

// Indentation, relative to the rest of the comment, at which markdown treats
// a line as code.
constexpr size_t kCodeIndent = 4;

struct Fence {
  std::string prefix;
  char marker;
  size_t length;
  std::string info;

  std::string Bare() const { return prefix + std::string(length, marker); }
};

enum class FenceKind {
  kRust,
  kInert,
  kOther,
};

size_t IndentWidth(std::string_view line) {
  size_t width = 0;
  for (char c : line) {
    if (c == ' ') {
      width++;
    } else if (c == '\t') {
      width += kCodeIndent - width % kCodeIndent;
    } else {
      break;
    }
  }
  return width;
}

bool IsBlank(std::string_view line) {
  return absl::StripAsciiWhitespace(line).empty();
}

size_t BaseIndent(const std::vector<std::string> &lines) {
  std::optional<size_t> base;
  for (auto &line : lines) {
    if (IsBlank(line)) {
      continue;
    }
    size_t width = IndentWidth(line);
    if (!base.has_value() || width < *base) {
      base = width;
    }
  }
  return base.value_or(0);
}

std::optional<Fence> ParseFence(std::string_view line, size_t base) {
  size_t i = 0;
  while (i < line.size() && (line[i] == ' ' || line[i] == '\t')) {
    i++;
  }
  std::string_view prefix = line.substr(0, i);
  if (IndentWidth(prefix) >= base + kCodeIndent) {
    return std::nullopt;
  }
  if (i == line.size() || (line[i] != '`' && line[i] != '~')) {
    return std::nullopt;
  }
  char marker = line[i];
  size_t length = 0;
  while (i + length < line.size() && line[i + length] == marker) {
    length++;
  }
  if (length < 3) {
    return std::nullopt;
  }
  std::string_view info =
      absl::StripAsciiWhitespace(line.substr(i + length));
  // ```foo``` on one line is inline code, not a fence.
  if (marker == '`' && absl::StrContains(info, '`')) {
    return std::nullopt;
  }
  return Fence{std::string(prefix), marker, length, std::string(info)};
}

bool IsRustdocAttribute(std::string_view token) {
  return token == "rust" || token == "should_panic" || token == "no_run" ||
         token == "compile_fail" || token == "test_harness" ||
         token == "allow_fail" || absl::StartsWith(token, "edition");
}

FenceKind ClassifyInfo(std::string_view info) {
  std::vector<std::string_view> tokens =
      absl::StrSplit(info, absl::ByAnyChar(", \t"), absl::SkipEmpty());
  for (auto token : tokens) {
    if (token == "ignore" || token == "text" ||
        absl::StartsWith(token, "ignore-")) {
      return FenceKind::kInert;
    }
  }
  for (auto token : tokens) {
    if (!IsRustdocAttribute(token)) {
      return FenceKind::kOther;
    }
  }
  return FenceKind::kRust;
}

// Index of the fence closing open, searching from line from.  Returns
// lines.size() if there is none.  A fence with an info string never closes
// a block; it is part of the block's content.
size_t FindClosingFence(const std::vector<std::string> &lines, size_t from,
                        const Fence &open, size_t base) {
  for (size_t i = from; i < lines.size(); i++) {
    std::optional<Fence> fence = ParseFence(lines[i], base);
    if (fence.has_value() && fence->marker == open.marker &&
        fence->length >= open.length && fence->info.empty()) {
      return i;
    }
  }
  return lines.size();
}

} // namespace

bool LooksRunnable(const std::vector<std::string> &lines) {
  bool has_main = false;
  bool in_string = false;
  std::string expected_closers;
  for (auto &line : lines) {
    if (!in_string && absl::StrContains(line, "fn main")) {
      has_main = true;
    }
    for (size_t i = 0; i < line.size(); i++) {
      char c = line[i];
      if (in_string) {
        if (c == '\\') {
          i++;
        } else if (c == '"') {
          in_string = false;
        }
        continue;
      }
      switch (c) {
      case '"':
        in_string = true;
        break;
      case '/':
        if (i + 1 < line.size() && line[i + 1] == '/') {
          i = line.size();
        }
        break;
      case '(':
        expected_closers += ')';
        break;
      case '[':
        expected_closers += ']';
        break;
      case '{':
        expected_closers += '}';
        break;
      case ')':
      case ']':
      case '}':
        if (expected_closers.empty() || expected_closers.back() != c) {
          return false;
        }
        expected_closers.pop_back();
        break;
      default:
        break;
      }
    }
  }
  return has_main && !in_string && expected_closers.empty();
}

std::string SanitizeComment(std::string_view text) {
  bool trailing_newline = absl::ConsumeSuffix(&text, "\n");
  std::vector<std::string> lines = absl::StrSplit(text, '\n');
  size_t base = BaseIndent(lines);
  std::string base_prefix(base, ' ');

  std::vector<std::string> out;
  out.reserve(lines.size() + 2);
  // Markdown only starts an indented code block after a blank line, at the
  // start of the text or after another block.
  bool may_start_code = true;
  size_t i = 0;
  while (i < lines.size()) {
    const std::string &line = lines[i];

    if (std::optional<Fence> open = ParseFence(line, base); open.has_value()) {
      size_t close = FindClosingFence(lines, i + 1, *open, base);
      bool terminated = close < lines.size();
      std::vector<std::string> body(lines.begin() + i + 1,
                                    lines.begin() + close);
      if (ClassifyInfo(open->info) == FenceKind::kRust &&
          (!terminated || !LooksRunnable(body))) {
        out.push_back(open->Bare() + "ignore");
      } else {
        out.push_back(line);
      }
      out.insert(out.end(), body.begin(), body.end());
      if (terminated) {
        // Normalise the closer, dropping trailing whitespace.
        out.push_back(ParseFence(lines[close], base)->Bare());
      } else {
        out.push_back(open->Bare());
      }
      i = close + 1;
      may_start_code = true;
      continue;
    }

    if (may_start_code && !IsBlank(line) &&
        IndentWidth(line) >= base + kCodeIndent) {
      size_t last = i;
      for (size_t j = i + 1; j < lines.size(); j++) {
        if (IsBlank(lines[j])) {
          continue;
        }
        if (IndentWidth(lines[j]) < base + kCodeIndent) {
          break;
        }
        last = j;
      }
      out.push_back(base_prefix + "```ignore");
      out.insert(out.end(), lines.begin() + i, lines.begin() + last + 1);
      out.push_back(base_prefix + "```");
      i = last + 1;
      may_start_code = true;
      continue;
    }

    out.push_back(line);
    may_start_code = IsBlank(line);
    i++;
  }

  std::string result = absl::StrJoin(out, "\n");
  if (trailing_newline) {
    result += '\n';
  }
  return result;
}

} // namespace protomod
