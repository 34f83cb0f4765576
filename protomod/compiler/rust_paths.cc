// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/rust_paths.h"
#include "absl/strings/str_join.h"
#include "protomod/compiler/identifier.h"

namespace protomod {

static constexpr char kWellKnownPackage[] = "google.protobuf";

Scope PackageScope(const std::string &package) {
  Scope scope;
  for (const auto &segment : PackagePath(package)) {
    scope.push_back(ModuleIdentifier(segment));
  }
  return scope;
}

Scope DeclarationScope(const google::protobuf::FileDescriptor *file,
                       const google::protobuf::Descriptor *containing) {
  Scope nested;
  for (const google::protobuf::Descriptor *d = containing; d != nullptr;
       d = d->containing_type()) {
    nested.push_back(ModuleIdentifier(d->name()));
  }
  Scope scope = PackageScope(file->package());
  scope.insert(scope.end(), nested.rbegin(), nested.rend());
  return scope;
}

std::string RelativePath(const Scope &from, const Scope &to,
                         const std::string &name) {
  size_t common = 0;
  while (common < from.size() && common < to.size() &&
         from[common] == to[common]) {
    common++;
  }
  std::vector<std::string> parts(from.size() - common, "super");
  parts.insert(parts.end(), to.begin() + common, to.end());
  parts.push_back(name);
  return absl::StrJoin(parts, "::");
}

std::string RustTypeName(const std::string &proto_name) {
  return EscapeIdentifier(ToUpperCamel(proto_name));
}

std::string RustFieldName(const google::protobuf::FieldDescriptor *field) {
  return EscapeIdentifier(ToSnakeCase(field->name()));
}

// Names of a type and its enclosing messages joined the way prost_types
// flattens them.
template <typename Descriptor>
static std::string WellKnownPath(const Descriptor *desc) {
  std::string name = RustTypeName(desc->name());
  for (const google::protobuf::Descriptor *d = desc->containing_type();
       d != nullptr; d = d->containing_type()) {
    name = ModuleIdentifier(d->name()) + "::" + name;
  }
  return "::prost_types::" + name;
}

std::string MessagePath(const Scope &from,
                        const google::protobuf::Descriptor *message) {
  if (message->file()->package() == kWellKnownPackage) {
    return WellKnownPath(message);
  }
  return RelativePath(from,
                      DeclarationScope(message->file(),
                                       message->containing_type()),
                      RustTypeName(message->name()));
}

std::string EnumPath(const Scope &from,
                     const google::protobuf::EnumDescriptor *e) {
  if (e->file()->package() == kWellKnownPackage) {
    return WellKnownPath(e);
  }
  return RelativePath(from, DeclarationScope(e->file(), e->containing_type()),
                      RustTypeName(e->name()));
}

std::string CommentText(const google::protobuf::SourceLocation &location) {
  std::string leading = location.leading_comments;
  std::string trailing = location.trailing_comments;
  if (!leading.empty() && leading.back() == '\n') {
    leading.pop_back();
  }
  if (!trailing.empty() && trailing.back() == '\n') {
    trailing.pop_back();
  }
  if (leading.empty()) {
    return trailing;
  }
  if (trailing.empty()) {
    return leading;
  }
  return leading + "\n\n" + trailing;
}

} // namespace protomod
