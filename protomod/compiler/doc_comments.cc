// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/doc_comments.h"
#include "absl/strings/ascii.h"
#include "absl/strings/match.h"
#include "absl/strings/numbers.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_split.h"
#include "protomod/compiler/errors.h"

namespace protomod {

static constexpr std::string_view kAnchorPrefix = "@@protomod-doc:";
static constexpr std::string_view kAnchorSuffix = "@@";

std::string DocAnchor(size_t index) {
  return absl::StrCat(kAnchorPrefix, index, kAnchorSuffix);
}

bool ParseDocAnchor(std::string_view line, size_t *index) {
  line = absl::StripAsciiWhitespace(line);
  if (!absl::ConsumePrefix(&line, kAnchorPrefix) ||
      !absl::ConsumeSuffix(&line, kAnchorSuffix)) {
    return false;
  }
  return absl::SimpleAtoi(line, index);
}

std::string RenderDocComment(std::string_view text, std::string_view indent) {
  absl::ConsumeSuffix(&text, "\n");
  if (text.empty()) {
    return "";
  }
  std::string result;
  for (std::string_view line : absl::StrSplit(text, '\n')) {
    absl::StrAppend(&result, indent, "///", line, "\n");
  }
  return result;
}

absl::StatusOr<std::string> InjectDocComments(
    std::string_view source, const std::vector<std::string> &docs) {
  std::string result;
  result.reserve(source.size());
  std::vector<std::string_view> lines = absl::StrSplit(source, '\n');
  for (size_t i = 0; i < lines.size(); i++) {
    std::string_view line = lines[i];
    bool last = i + 1 == lines.size();
    size_t index;
    if (!ParseDocAnchor(line, &index)) {
      result.append(line.data(), line.size());
      if (!last) {
        result += '\n';
      }
      continue;
    }
    if (index >= docs.size()) {
      return GenerationError(absl::StrFormat(
          "Documentation anchor %d has no comment (%d comments recorded)",
          index, docs.size()));
    }
    std::string_view indent =
        line.substr(0, line.size() - absl::StripLeadingAsciiWhitespace(line).size());
    result += RenderDocComment(docs[index], indent);
  }
  return result;
}

} // namespace protomod
