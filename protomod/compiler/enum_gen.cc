// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/enum_gen.h"
#include "absl/container/flat_hash_set.h"
#include "absl/strings/match.h"
#include "protomod/compiler/identifier.h"
#include "protomod/compiler/rust_paths.h"
#include <cctype>

namespace protomod {

std::string EnumGenerator::VariantName(
    const google::protobuf::EnumValueDescriptor *value) const {
  std::string name = ToUpperCamel(value->name());
  std::string prefix = ToUpperCamel(enum_->name());
  if (name.size() > prefix.size() && absl::StartsWith(name, prefix) &&
      isupper(name[prefix.size()])) {
    name = name.substr(prefix.size());
  }
  return EscapeIdentifier(name);
}

void EnumGenerator::Generate(std::ostream &os, const std::string &indent,
                             std::vector<DocComment> *comments) {
  std::string name = RustTypeName(enum_->name());
  std::string in1 = indent + "    ";
  std::string in2 = in1 + "    ";
  std::string in3 = in2 + "    ";

  // Aliases (allow_alias) share a number with an earlier value and are
  // left out since a Rust enum can't repeat a discriminant.
  std::vector<const google::protobuf::EnumValueDescriptor *> values;
  absl::flat_hash_set<int> numbers;
  for (int i = 0; i < enum_->value_count(); i++) {
    if (numbers.insert(enum_->value(i)->number()).second) {
      values.push_back(enum_->value(i));
    }
  }

  GenerateDocAnchor(os, indent, enum_, comments);
  os << indent
     << "#[derive(Clone, Copy, Debug, PartialEq, Eq, Hash, PartialOrd, Ord, "
        "::prost::Enumeration)]\n";
  os << indent << "#[repr(i32)]\n";
  GenerateAttributes(os, indent, enum_, options_->type_attributes);
  GenerateAttributes(os, indent, enum_, options_->enum_attributes);
  os << indent << "pub enum " << name << " {\n";
  for (auto value : values) {
    GenerateDocAnchor(os, in1, value, comments);
    os << in1 << VariantName(value) << " = " << value->number() << ",\n";
  }
  os << indent << "}\n";

  os << indent << "impl " << name << " {\n";
  os << in1
     << "/// String value of the enum field names used in the ProtoBuf "
        "definition.\n";
  os << in1 << "///\n";
  os << in1
     << "/// The values are not transformed in any way and thus are considered "
        "stable\n";
  os << in1
     << "/// (if the ProtoBuf definition does not change) and safe for "
        "programmatic use.\n";
  os << in1 << "pub fn as_str_name(&self) -> &'static str {\n";
  os << in2 << "match self {\n";
  for (auto value : values) {
    os << in3 << "Self::" << VariantName(value) << " => \"" << value->name()
       << "\",\n";
  }
  os << in2 << "}\n";
  os << in1 << "}\n";
  os << in1
     << "/// Creates an enum from field names used in the ProtoBuf "
        "definition.\n";
  os << in1
     << "pub fn from_str_name(value: &str) -> ::core::option::Option<Self> {\n";
  os << in2 << "match value {\n";
  for (int i = 0; i < enum_->value_count(); i++) {
    const google::protobuf::EnumValueDescriptor *value = enum_->value(i);
    // An alias maps to the variant that owns its number.
    const google::protobuf::EnumValueDescriptor *canonical =
        enum_->FindValueByNumber(value->number());
    os << in3 << "\"" << value->name() << "\" => Some(Self::"
       << VariantName(canonical) << "),\n";
  }
  os << in3 << "_ => None,\n";
  os << in2 << "}\n";
  os << in1 << "}\n";
  os << indent << "}\n";
}

} // namespace protomod
