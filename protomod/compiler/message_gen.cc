// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/message_gen.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "google/protobuf/descriptor.pb.h"
#include "protomod/compiler/identifier.h"

namespace protomod {

MessageGenerator::MessageGenerator(const google::protobuf::Descriptor *message,
                                   Scope scope,
                                   const GeneratorOptions *options)
    : message_(message), options_(options), scope_(std::move(scope)) {
  nested_scope_ = scope_;
  nested_scope_.push_back(ModuleIdentifier(message_->name()));
  for (int i = 0; i < message_->nested_type_count(); i++) {
    // Map entries become HashMap fields, not types.
    if (message_->nested_type(i)->options().map_entry()) {
      continue;
    }
    nested_message_gens_.push_back(std::make_unique<MessageGenerator>(
        message_->nested_type(i), nested_scope_, options_));
  }
  // Enums
  for (int i = 0; i < message_->enum_type_count(); i++) {
    enum_gens_.push_back(
        std::make_unique<EnumGenerator>(message_->enum_type(i), options_));
  }
}

std::string MessageGenerator::FieldProstType(
    const google::protobuf::FieldDescriptor *field, const Scope &from) {
  switch (field->type()) {
  case google::protobuf::FieldDescriptor::TYPE_INT32:
    return "int32";
  case google::protobuf::FieldDescriptor::TYPE_SINT32:
    return "sint32";
  case google::protobuf::FieldDescriptor::TYPE_SFIXED32:
    return "sfixed32";
  case google::protobuf::FieldDescriptor::TYPE_INT64:
    return "int64";
  case google::protobuf::FieldDescriptor::TYPE_SINT64:
    return "sint64";
  case google::protobuf::FieldDescriptor::TYPE_SFIXED64:
    return "sfixed64";
  case google::protobuf::FieldDescriptor::TYPE_UINT32:
    return "uint32";
  case google::protobuf::FieldDescriptor::TYPE_FIXED32:
    return "fixed32";
  case google::protobuf::FieldDescriptor::TYPE_UINT64:
    return "uint64";
  case google::protobuf::FieldDescriptor::TYPE_FIXED64:
    return "fixed64";
  case google::protobuf::FieldDescriptor::TYPE_DOUBLE:
    return "double";
  case google::protobuf::FieldDescriptor::TYPE_FLOAT:
    return "float";
  case google::protobuf::FieldDescriptor::TYPE_BOOL:
    return "bool";
  case google::protobuf::FieldDescriptor::TYPE_ENUM:
    return absl::StrFormat("enumeration = \"%s\"",
                           EnumPath(from, field->enum_type()));
  case google::protobuf::FieldDescriptor::TYPE_STRING:
    return "string";
  case google::protobuf::FieldDescriptor::TYPE_BYTES:
    return "bytes = \"vec\"";
  case google::protobuf::FieldDescriptor::TYPE_MESSAGE:
    return "message";
  case google::protobuf::FieldDescriptor::TYPE_GROUP:
    return "group";
  }
  return "unknown";
}

std::string MessageGenerator::FieldRustType(
    const google::protobuf::FieldDescriptor *field, const Scope &from) {
  switch (field->type()) {
  case google::protobuf::FieldDescriptor::TYPE_INT32:
  case google::protobuf::FieldDescriptor::TYPE_SINT32:
  case google::protobuf::FieldDescriptor::TYPE_SFIXED32:
    return "i32";
  case google::protobuf::FieldDescriptor::TYPE_INT64:
  case google::protobuf::FieldDescriptor::TYPE_SINT64:
  case google::protobuf::FieldDescriptor::TYPE_SFIXED64:
    return "i64";
  case google::protobuf::FieldDescriptor::TYPE_UINT32:
  case google::protobuf::FieldDescriptor::TYPE_FIXED32:
    return "u32";
  case google::protobuf::FieldDescriptor::TYPE_UINT64:
  case google::protobuf::FieldDescriptor::TYPE_FIXED64:
    return "u64";
  case google::protobuf::FieldDescriptor::TYPE_DOUBLE:
    return "f64";
  case google::protobuf::FieldDescriptor::TYPE_FLOAT:
    return "f32";
  case google::protobuf::FieldDescriptor::TYPE_BOOL:
    return "bool";
  case google::protobuf::FieldDescriptor::TYPE_ENUM:
    // prost keeps enum fields open so unknown values survive.
    return "i32";
  case google::protobuf::FieldDescriptor::TYPE_STRING:
    return "::prost::alloc::string::String";
  case google::protobuf::FieldDescriptor::TYPE_BYTES:
    return "::prost::alloc::vec::Vec<u8>";
  case google::protobuf::FieldDescriptor::TYPE_MESSAGE:
  case google::protobuf::FieldDescriptor::TYPE_GROUP:
    return MessagePath(from, field->message_type());
  }
  return "unknown";
}

std::string MessageGenerator::MapValueProstType(
    const google::protobuf::FieldDescriptor *field, const Scope &from) {
  switch (field->type()) {
  case google::protobuf::FieldDescriptor::TYPE_ENUM:
    return absl::StrFormat("enumeration(%s)",
                           EnumPath(from, field->enum_type()));
  case google::protobuf::FieldDescriptor::TYPE_BYTES:
    return "bytes";
  default:
    return FieldProstType(field, from);
  }
}

bool MessageGenerator::IsRecursive(
    const google::protobuf::FieldDescriptor *field) const {
  if (field->message_type() == nullptr) {
    return false;
  }
  for (const google::protobuf::Descriptor *d = message_; d != nullptr;
       d = d->containing_type()) {
    if (d == field->message_type()) {
      return true;
    }
  }
  return false;
}

std::shared_ptr<FieldInfo>
MessageGenerator::CompileField(const google::protobuf::FieldDescriptor *field) {
  std::string tag = absl::StrFormat("tag = \"%d\"", field->number());
  std::string name = RustFieldName(field);

  if (field->is_map()) {
    const google::protobuf::Descriptor *entry = field->message_type();
    const google::protobuf::FieldDescriptor *key = entry->FindFieldByNumber(1);
    const google::protobuf::FieldDescriptor *value =
        entry->FindFieldByNumber(2);
    std::string attr =
        absl::StrFormat("map = \"%s, %s\", %s", FieldProstType(key, scope_),
                        MapValueProstType(value, scope_), tag);
    std::string type = absl::StrFormat(
        "::std::collections::HashMap<%s, %s>", FieldRustType(key, scope_),
        FieldRustType(value, scope_));
    return std::make_shared<FieldInfo>(field, name, attr, type);
  }

  std::string prost_type = FieldProstType(field, scope_);
  std::string rust_type = FieldRustType(field, scope_);

  if (field->is_repeated()) {
    std::string attr = prost_type + ", repeated, ";
    if (field->is_packable() && !field->is_packed()) {
      attr += "packed = \"false\", ";
    }
    return std::make_shared<FieldInfo>(
        field, name, attr + tag,
        absl::StrFormat("::prost::alloc::vec::Vec<%s>", rust_type));
  }

  if (field->message_type() != nullptr) {
    if (IsRecursive(field)) {
      return std::make_shared<FieldInfo>(
          field, name, prost_type + ", optional, boxed, " + tag,
          absl::StrFormat(
              "::core::option::Option<::prost::alloc::boxed::Box<%s>>",
              rust_type));
    }
    return std::make_shared<FieldInfo>(
        field, name, prost_type + ", optional, " + tag,
        absl::StrFormat("::core::option::Option<%s>", rust_type));
  }

  if (field->has_presence()) {
    return std::make_shared<FieldInfo>(
        field, name, prost_type + ", optional, " + tag,
        absl::StrFormat("::core::option::Option<%s>", rust_type));
  }
  if (field->is_required()) {
    return std::make_shared<FieldInfo>(field, name,
                                       prost_type + ", required, " + tag,
                                       rust_type);
  }
  return std::make_shared<FieldInfo>(field, name, prost_type + ", " + tag,
                                     rust_type);
}

std::shared_ptr<FieldInfo> MessageGenerator::CompileUnionMember(
    const google::protobuf::FieldDescriptor *field) {
  // Oneof enums live in the nested module so paths start from there.
  std::string tag = absl::StrFormat("tag = \"%d\"", field->number());
  std::string name = EscapeIdentifier(ToUpperCamel(field->name()));
  std::string prost_type = FieldProstType(field, nested_scope_);
  std::string rust_type = FieldRustType(field, nested_scope_);
  if (IsRecursive(field)) {
    return std::make_shared<FieldInfo>(
        field, name, prost_type + ", boxed, " + tag,
        absl::StrFormat("::prost::alloc::boxed::Box<%s>", rust_type));
  }
  return std::make_shared<FieldInfo>(field, name, prost_type + ", " + tag,
                                     rust_type);
}

void MessageGenerator::CompileUnions() {
  for (int i = 0; i < message_->field_count(); i++) {
    const auto &field = message_->field(i);
    const google::protobuf::OneofDescriptor *oneof =
        field->real_containing_oneof();
    if (oneof == nullptr) {
      // Not a oneof, already handled in CompileFields.
      continue;
    }
    // We will have created a UnionInfo during the first pass in CompileFields.
    auto union_info = unions_[oneof->index()];
    union_info->members.push_back(CompileUnionMember(field));
  }

  for (auto &union_info : unions_) {
    if (union_info == nullptr) {
      continue;
    }
    std::vector<std::string> tags;
    for (auto &member : union_info->members) {
      tags.push_back(absl::StrFormat("%d", member->field->number()));
    }
    std::string path = nested_scope_.back() + "::" + union_info->enum_name;
    union_info->prost_attr = absl::StrFormat(
        "oneof = \"%s\", tags = \"%s\"", path, absl::StrJoin(tags, ", "));
    union_info->rust_type =
        absl::StrFormat("::core::option::Option<%s>", path);
  }
}

void MessageGenerator::CompileFields() {
  unions_.resize(message_->oneof_decl_count());
  for (int i = 0; i < message_->field_count(); i++) {
    const auto &field = message_->field(i);
    const google::protobuf::OneofDescriptor *oneof =
        field->real_containing_oneof();
    if (oneof != nullptr) {
      // The struct member for a oneof goes where its first field is.  It is
      // filled in during CompileUnions once all members are known.
      if (unions_[oneof->index()] == nullptr) {
        auto union_info = std::make_shared<UnionInfo>(
            oneof, EscapeIdentifier(ToSnakeCase(oneof->name())),
            RustTypeName(oneof->name()));
        unions_[oneof->index()] = union_info;
        fields_in_order_.push_back(union_info);
      }
      continue;
    }
    fields_in_order_.push_back(CompileField(field));
  }
}

void MessageGenerator::Compile() {
  CompileFields();
  CompileUnions();
  for (auto &nested : nested_message_gens_) {
    nested->Compile();
  }
}

bool MessageGenerator::HasNestedModule() const {
  if (!nested_message_gens_.empty() || !enum_gens_.empty()) {
    return true;
  }
  for (auto &union_info : unions_) {
    if (union_info != nullptr) {
      return true;
    }
  }
  return false;
}

void MessageGenerator::GenerateStruct(std::ostream &os,
                                      const std::string &indent,
                                      std::vector<DocComment> *comments) {
  std::string in1 = indent + "    ";
  GenerateDocAnchor(os, indent, message_, comments);
  os << indent << "#[allow(clippy::derive_partial_eq_without_eq)]\n";
  os << indent << "#[derive(Clone, PartialEq, ::prost::Message)]\n";
  GenerateAttributes(os, indent, message_, options_->type_attributes);
  os << indent << "pub struct " << RustTypeName(message_->name()) << " {\n";
  for (auto &field : fields_in_order_) {
    if (field->IsUnion()) {
      auto u = static_cast<UnionInfo *>(field.get());
      GenerateDocAnchor(os, in1, u->oneof, comments);
    } else {
      GenerateDocAnchor(os, in1, field->field, comments);
    }
    os << in1 << "#[prost(" << field->prost_attr << ")]\n";
    os << in1 << "pub " << field->member_name << ": " << field->rust_type
       << ",\n";
  }
  os << indent << "}\n";
}

void MessageGenerator::GenerateOneof(std::ostream &os,
                                     const std::string &indent,
                                     const UnionInfo &info,
                                     std::vector<DocComment> *comments) {
  std::string in1 = indent + "    ";
  GenerateDocAnchor(os, indent, info.oneof, comments);
  os << indent << "#[allow(clippy::derive_partial_eq_without_eq)]\n";
  os << indent << "#[derive(Clone, PartialEq, ::prost::Oneof)]\n";
  GenerateAttributes(os, indent, info.oneof, options_->type_attributes);
  GenerateAttributes(os, indent, info.oneof, options_->enum_attributes);
  os << indent << "pub enum " << info.enum_name << " {\n";
  for (auto &member : info.members) {
    GenerateDocAnchor(os, in1, member->field, comments);
    os << in1 << "#[prost(" << member->prost_attr << ")]\n";
    os << in1 << member->member_name << "(" << member->rust_type << "),\n";
  }
  os << indent << "}\n";
}

void MessageGenerator::GenerateNestedModule(
    std::ostream &os, const std::string &indent,
    std::vector<DocComment> *comments) {
  std::string in1 = indent + "    ";
  os << indent << "/// Nested message and enum types in `" << message_->name()
     << "`.\n";
  os << indent << "pub mod " << nested_scope_.back() << " {\n";
  for (auto &nested : nested_message_gens_) {
    nested->Generate(os, in1, comments);
  }
  for (auto &union_info : unions_) {
    if (union_info != nullptr) {
      GenerateOneof(os, in1, *union_info, comments);
    }
  }
  for (auto &enum_gen : enum_gens_) {
    enum_gen->Generate(os, in1, comments);
  }
  os << indent << "}\n";
}

void MessageGenerator::Generate(std::ostream &os, const std::string &indent,
                                std::vector<DocComment> *comments) {
  GenerateStruct(os, indent, comments);
  if (HasNestedModule()) {
    GenerateNestedModule(os, indent, comments);
  }
}

} // namespace protomod
