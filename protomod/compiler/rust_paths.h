// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "google/protobuf/descriptor.h"
#include "protomod/compiler/attributes.h"
#include "protomod/compiler/doc_comments.h"
#include "protomod/compiler/unit.h"
#include <ostream>
#include <string>
#include <vector>

namespace protomod {

// A Rust module path, one identifier per element.
using Scope = std::vector<std::string>;

// The module path for a protobuf package.
Scope PackageScope(const std::string &package);

// The module path in which a type declared in file, inside containing (which
// may be null), lives.  Nested types live in a module named after each
// enclosing message.
Scope DeclarationScope(const google::protobuf::FileDescriptor *file,
                       const google::protobuf::Descriptor *containing);

// Path from module from to name declared in module to, using "super" to
// climb out of from.
std::string RelativePath(const Scope &from, const Scope &to,
                         const std::string &name);

// Type and member names as they appear in Rust.
std::string RustTypeName(const std::string &proto_name);
std::string RustFieldName(const google::protobuf::FieldDescriptor *field);

// Path to a message or enum as seen from scope from.  Well known types map
// to ::prost_types.
std::string MessagePath(const Scope &from,
                        const google::protobuf::Descriptor *message);
std::string EnumPath(const Scope &from,
                     const google::protobuf::EnumDescriptor *e);

// The leading and trailing comments of a declaration, separated by a blank
// line if both are present.
std::string CommentText(const google::protobuf::SourceLocation &location);

// If desc has comments, records them in comments and writes the anchor line
// that will be replaced by their documentation.
template <typename Descriptor>
void GenerateDocAnchor(std::ostream &os, const std::string &indent,
                       const Descriptor *desc,
                       std::vector<DocComment> *comments) {
  google::protobuf::SourceLocation location;
  if (!desc->GetSourceLocation(&location)) {
    return;
  }
  std::string text = CommentText(location);
  if (text.empty()) {
    return;
  }
  os << indent << DocAnchor(comments->size()) << "\n";
  comments->push_back({"." + desc->full_name(), std::move(text)});
}

// Writes the attributes from attrs that apply to desc, one per line.
template <typename Descriptor>
void GenerateAttributes(std::ostream &os, const std::string &indent,
                        const Descriptor *desc, const TypeAttributes &attrs) {
  for (auto &attribute : attrs.Lookup("." + desc->full_name())) {
    os << indent << attribute << "\n";
  }
}

} // namespace protomod
