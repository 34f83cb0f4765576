// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/container/btree_map.h"
#include "absl/status/status.h"
#include "protomod/compiler/unit.h"
#include <string>
#include <vector>

namespace protomod {

// The final name of a module.  The identifier is what appears in "pub mod"
// declarations and type paths; the file stem names the file and directory
// holding the module on disk.
struct ResolvedName {
  std::string identifier;
  std::string file_stem;
};

struct ModuleNode {
  // Package segment as it appears in the definition files.  Empty for the
  // root.
  std::string segment;
  std::vector<std::string> package_path;
  // Children keyed by their original segment.
  absl::btree_map<std::string, size_t> children;
  // Indices into ModuleTree::Units() in input order.
  std::vector<size_t> units;
  // True while no unit lives directly at this node.
  bool is_synthetic = true;
  // Assigned by ModuleTree::Resolve.  Left empty for the root, which is
  // named by whoever emits the tree.
  ResolvedName name;
};

// A tree of modules mirroring the package hierarchy.  Nodes live in an arena
// and refer to each other by index; node 0 is the root and stands for the
// empty package.
//
// Units are inserted first.  Resolve() then assigns final names and freezes
// the tree.
class ModuleTree {
public:
  ModuleTree();

  // Places the unit at the node for its package path, creating any missing
  // nodes on the way.  Units sharing a path keep their insertion order.
  absl::Status Insert(SanitizedUnit unit);

  // Assigns a ResolvedName to every node below the root.  Fails with an
  // identifier collision if two siblings end up with the same name, or if a
  // child's name is already taken by an inline module of its parent.
  absl::Status Resolve();

  bool IsResolved() const { return resolved_; }

  const ModuleNode &Root() const { return nodes_[0]; }
  const ModuleNode &Node(size_t index) const { return nodes_[index]; }
  size_t NodeCount() const { return nodes_.size(); }

  const std::vector<SanitizedUnit> &Units() const { return units_; }

  // The node for a package path, or nullptr if there is none.
  const ModuleNode *Find(const std::vector<std::string> &package_path) const;

  // Children of a node ordered by file stem.  Only meaningful once resolved.
  std::vector<size_t> SortedChildren(const ModuleNode &node) const;

private:
  size_t Descend(size_t parent, const std::string &segment);

  std::vector<ModuleNode> nodes_;
  std::vector<SanitizedUnit> units_;
  bool resolved_ = false;
};

} // namespace protomod
