// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "google/protobuf/descriptor.h"
#include "protomod/compiler/attributes.h"
#include "protomod/compiler/enum_gen.h"
#include "protomod/compiler/rust_paths.h"
#include "protomod/compiler/unit.h"
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace protomod {

struct FieldInfo {
  // Constructor.
  FieldInfo(const google::protobuf::FieldDescriptor *f,
            const std::string &name, const std::string &attr,
            const std::string &type)
      : field(f), member_name(name), prost_attr(attr), rust_type(type) {}
  virtual ~FieldInfo() = default;
  virtual bool IsUnion() const { return false; }
  const google::protobuf::FieldDescriptor *field;

  // Name of the struct member or, for a oneof member, the enum variant.
  std::string member_name;
  // Contents of the #[prost(...)] attribute.
  std::string prost_attr;
  std::string rust_type;
};

struct UnionInfo : public FieldInfo {
  // Constructor
  UnionInfo(const google::protobuf::OneofDescriptor *o,
            const std::string &name, const std::string &enum_name)
      : FieldInfo(nullptr, name, "", ""), oneof(o), enum_name(enum_name) {}
  bool IsUnion() const override { return true; }
  const google::protobuf::OneofDescriptor *oneof;
  // Name of the enum generated for the oneof in the nested module.
  std::string enum_name;
  std::vector<std::shared_ptr<FieldInfo>> members;
};

// Writes a protobuf message as a prost Message struct, followed by a module
// holding its nested messages, oneofs and enums.
class MessageGenerator {
public:
  // scope is the module path in which the struct is declared.
  MessageGenerator(const google::protobuf::Descriptor *message, Scope scope,
                   const GeneratorOptions *options);

  void Compile();

  void Generate(std::ostream &os, const std::string &indent,
                std::vector<DocComment> *comments);

  // True if Generate writes a "pub mod" after the struct.  Only valid once
  // compiled.
  bool HasNestedModule() const;
  const std::string &ModuleName() const { return nested_scope_.back(); }

private:
  void CompileFields();
  void CompileUnions();

  void GenerateStruct(std::ostream &os, const std::string &indent,
                      std::vector<DocComment> *comments);
  void GenerateNestedModule(std::ostream &os, const std::string &indent,
                            std::vector<DocComment> *comments);
  void GenerateOneof(std::ostream &os, const std::string &indent,
                     const UnionInfo &info,
                     std::vector<DocComment> *comments);

  // True if a field of this type would make the struct contain itself.
  bool IsRecursive(const google::protobuf::FieldDescriptor *field) const;

  // The prost scalar name, as used in map attributes and as the first
  // element of a field attribute.
  std::string FieldProstType(const google::protobuf::FieldDescriptor *field,
                             const Scope &from);
  // The Rust type of a single value of the field.
  std::string FieldRustType(const google::protobuf::FieldDescriptor *field,
                            const Scope &from);
  std::string MapValueProstType(const google::protobuf::FieldDescriptor *field,
                                const Scope &from);

  std::shared_ptr<FieldInfo>
  CompileField(const google::protobuf::FieldDescriptor *field);
  std::shared_ptr<FieldInfo>
  CompileUnionMember(const google::protobuf::FieldDescriptor *field);

  const google::protobuf::Descriptor *message_;
  const GeneratorOptions *options_;
  Scope scope_;
  // Scope of the nested module: scope_ plus the message's module name.
  Scope nested_scope_;
  std::vector<std::unique_ptr<MessageGenerator>> nested_message_gens_;
  std::vector<std::unique_ptr<EnumGenerator>> enum_gens_;
  // Indexed by oneof index.  Synthetic oneofs of proto3 optional fields
  // are not here.
  std::vector<std::shared_ptr<UnionInfo>> unions_;
  std::vector<std::shared_ptr<FieldInfo>> fields_in_order_;
};

} // namespace protomod
