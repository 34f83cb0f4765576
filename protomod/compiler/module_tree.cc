// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/module_tree.h"
#include "absl/container/flat_hash_map.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/errors.h"
#include "protomod/compiler/identifier.h"
#include <algorithm>
#include <optional>

namespace protomod {

ModuleTree::ModuleTree() { nodes_.emplace_back(); }

size_t ModuleTree::Descend(size_t parent, const std::string &segment) {
  auto it = nodes_[parent].children.find(segment);
  if (it != nodes_[parent].children.end()) {
    return it->second;
  }
  ModuleNode child;
  child.segment = segment;
  child.package_path = nodes_[parent].package_path;
  child.package_path.push_back(segment);
  size_t index = nodes_.size();
  // Careful: this may reallocate nodes_, so no references are held across
  // it.
  nodes_.push_back(std::move(child));
  nodes_[parent].children.emplace(segment, index);
  return index;
}

absl::Status ModuleTree::Insert(SanitizedUnit unit) {
  if (resolved_) {
    return absl::FailedPreconditionError(absl::StrFormat(
        "Cannot add %s to a module tree that has already been resolved",
        unit.file_name));
  }
  size_t node = 0;
  for (const auto &segment : unit.package_path) {
    if (segment.empty()) {
      return GenerationError(
          absl::StrFormat("Package '%s' of %s has an empty segment",
                          PackageName(unit.package_path), unit.file_name));
    }
    node = Descend(node, segment);
  }
  nodes_[node].units.push_back(units_.size());
  nodes_[node].is_synthetic = false;
  units_.push_back(std::move(unit));
  return absl::OkStatus();
}

absl::Status ModuleTree::Resolve() {
  if (resolved_) {
    return absl::OkStatus();
  }
  // Depth first from the root, siblings in segment order, so that the same
  // input always reports the same collision.
  std::vector<size_t> stack = {0};
  while (!stack.empty()) {
    size_t parent = stack.back();
    stack.pop_back();

    // Modules declared inline by the parent's own units, mapped to the unit
    // that declares them.
    absl::flat_hash_map<std::string, size_t> inline_modules;
    for (size_t unit : nodes_[parent].units) {
      for (const auto &name : units_[unit].module_names) {
        inline_modules.emplace(name, unit);
      }
    }

    // Both maps point at the sibling that claimed the name first.
    absl::flat_hash_map<std::string, size_t> by_identifier;
    absl::flat_hash_map<std::string, size_t> by_stem;
    std::vector<size_t> children;
    for (const auto &[segment, child] : nodes_[parent].children) {
      std::string identifier = ModuleIdentifier(segment);
      std::string stem = ModuleFileStem(identifier);
      std::optional<size_t> claimed;
      if (auto it = by_identifier.find(identifier); it != by_identifier.end()) {
        claimed = it->second;
      } else if (auto it = by_stem.find(stem); it != by_stem.end()) {
        claimed = it->second;
      }
      if (claimed.has_value()) {
        return IdentifierCollisionError(absl::StrFormat(
            "Packages '%s' and '%s' both map to module '%s'; rename one of "
            "them",
            PackageName(nodes_[*claimed].package_path),
            PackageName(nodes_[child].package_path), identifier));
      }
      if (auto it = inline_modules.find(identifier);
          it != inline_modules.end()) {
        return IdentifierCollisionError(absl::StrFormat(
            "Package '%s' maps to module '%s', which %s already declares for "
            "a nested type in package '%s'; rename one of them",
            PackageName(nodes_[child].package_path), identifier,
            units_[it->second].file_name,
            PackageName(nodes_[parent].package_path)));
      }
      by_identifier.emplace(identifier, child);
      by_stem.emplace(stem, child);
      nodes_[child].name = ResolvedName{identifier, stem};
      children.push_back(child);
    }
    // Reverse so that the first child is visited first.
    stack.insert(stack.end(), children.rbegin(), children.rend());
  }
  resolved_ = true;
  return absl::OkStatus();
}

const ModuleNode *
ModuleTree::Find(const std::vector<std::string> &package_path) const {
  size_t node = 0;
  for (const auto &segment : package_path) {
    auto it = nodes_[node].children.find(segment);
    if (it == nodes_[node].children.end()) {
      return nullptr;
    }
    node = it->second;
  }
  return &nodes_[node];
}

std::vector<size_t> ModuleTree::SortedChildren(const ModuleNode &node) const {
  std::vector<size_t> children;
  children.reserve(node.children.size());
  for (const auto &[segment, child] : node.children) {
    children.push_back(child);
  }
  std::sort(children.begin(), children.end(), [this](size_t a, size_t b) {
    return nodes_[a].name.file_stem < nodes_[b].name.file_stem;
  });
  return children;
}

} // namespace protomod
