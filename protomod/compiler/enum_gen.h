// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "google/protobuf/descriptor.h"
#include "protomod/compiler/attributes.h"
#include "protomod/compiler/unit.h"
#include <iostream>
#include <string>
#include <vector>

namespace protomod {

// Writes a protobuf enum as a prost Enumeration.
class EnumGenerator {
public:
  EnumGenerator(const google::protobuf::EnumDescriptor *e,
                const GeneratorOptions *options)
      : enum_(e), options_(options) {}

  void Generate(std::ostream &os, const std::string &indent,
                std::vector<DocComment> *comments);

  // The Rust name of a value.  The enum's own name is stripped from the
  // front of the value, so FOO_BAR in enum Foo becomes Bar.
  std::string VariantName(const google::protobuf::EnumValueDescriptor *value) const;

private:
  const google::protobuf::EnumDescriptor *enum_;
  const GeneratorOptions *options_;
};

} // namespace protomod
