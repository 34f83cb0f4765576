// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/emitter.h"
#include "absl/strings/match.h"
#include "absl/strings/str_cat.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/version.h"
#include <algorithm>
#include <utility>

namespace protomod {

static constexpr char kRootLints[] =
    "#![allow(clippy::doc_markdown, clippy::use_self)]\n";

std::string GeneratedHeader() {
  return absl::StrCat("// This file is @generated by protomod ",
                      PROTOMOD_VERSION, "\n");
}

static void AppendModuleDeclarations(const ModuleTree &tree,
                                     const ModuleNode &node,
                                     std::string *out) {
  for (size_t child : tree.SortedChildren(node)) {
    absl::StrAppend(out, "pub mod ", tree.Node(child).name.identifier, ";\n");
  }
}

static void AppendUnits(const ModuleTree &tree, const ModuleNode &node,
                        std::string *out) {
  for (size_t index : node.units) {
    const std::string &text = tree.Units()[index].text;
    out->append(text);
    if (!text.empty() && text.back() != '\n') {
      *out += '\n';
    }
  }
}

absl::StatusOr<std::vector<EmittedFile>> EmitTree(const ModuleTree &tree,
                                                  const EmitOptions &options) {
  if (!tree.IsResolved()) {
    return absl::FailedPreconditionError(
        "Internal error: module tree must be resolved before it is emitted");
  }
  if (options.root_module.empty() ||
      absl::StrContains(options.root_module, '/')) {
    return absl::InvalidArgumentError(absl::StrFormat(
        "Invalid root module name '%s'", options.root_module));
  }
  std::string header = options.prepend_header ? GeneratedHeader() : "";

  std::vector<EmittedFile> files;
  const ModuleNode &root = tree.Root();
  std::string root_content = header + kRootLints;
  if (options.toplevel_attribute.has_value()) {
    absl::StrAppend(&root_content, *options.toplevel_attribute, "\n");
  }
  AppendModuleDeclarations(tree, root, &root_content);
  if (!root.units.empty()) {
    root_content += "\n";
    AppendUnits(tree, root, &root_content);
  }
  files.push_back({options.root_module + ".rs", std::move(root_content)});

  // Pairs of node and the directory its file goes in.
  std::vector<std::pair<size_t, std::string>> stack;
  for (size_t child : tree.SortedChildren(root)) {
    stack.emplace_back(child, options.root_module);
  }
  while (!stack.empty()) {
    auto [index, dir] = stack.back();
    stack.pop_back();
    const ModuleNode &node = tree.Node(index);
    std::string content = header;
    AppendModuleDeclarations(tree, node, &content);
    if (!node.children.empty() && !node.units.empty()) {
      content += "\n";
    }
    AppendUnits(tree, node, &content);

    std::string path = absl::StrCat(dir, "/", node.name.file_stem);
    files.push_back({path + ".rs", std::move(content)});
    for (size_t child : tree.SortedChildren(node)) {
      stack.emplace_back(child, path);
    }
  }

  std::sort(files.begin(), files.end(),
            [](const EmittedFile &a, const EmittedFile &b) {
              return a.path < b.path;
            });
  return files;
}

} // namespace protomod
