// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#pragma once

#include "absl/status/statusor.h"
#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/descriptor.h"
#include "google/protobuf/io/zero_copy_stream.h"
#include "protomod/compiler/attributes.h"
#include "protomod/compiler/enum_gen.h"
#include "protomod/compiler/generator.h"
#include "protomod/compiler/message_gen.h"
#include "protomod/compiler/pipeline.h"
#include "protomod/compiler/unit.h"
#include <memory>
#include <string>
#include <vector>

namespace protomod {

absl::Status WriteToZeroCopyStream(
    const std::string &data, google::protobuf::io::ZeroCopyOutputStream *stream);

// Generates the Rust source for the top level declarations of one file.
class FileGenerator {
public:
  FileGenerator(const google::protobuf::FileDescriptor *file,
                const GeneratorOptions *options);

  void Compile();

  // file_name is recorded in the unit for error messages.
  GeneratedUnit GenerateUnit(const std::string &file_name);

private:
  const google::protobuf::FileDescriptor *file_;
  std::vector<std::unique_ptr<MessageGenerator>> message_gens_;
  std::vector<std::unique_ptr<EnumGenerator>> enum_gens_;
};

// Parses definition files with the protobuf compiler library.
class ProtocGenerator : public Generator {
public:
  ProtocGenerator() = default;
  explicit ProtocGenerator(GeneratorOptions options)
      : options_(std::move(options)) {}

  absl::StatusOr<std::vector<GeneratedUnit>>
  Generate(const std::vector<std::string> &definition_files,
           const std::vector<std::string> &include_paths) override;

private:
  GeneratorOptions options_;
};

struct PluginOptions {
  AssembleOptions assemble;
  GeneratorOptions generator;
  // Pack the tree into <root_module>.zip instead of writing its files.
  bool zip = false;
};

// Parses the plugin parameter: comma separated key=value pairs.  List values
// are separated by ':' (disable_comments) or ';' (type_attribute and
// enum_attribute, whose attributes contain "::").
absl::StatusOr<PluginOptions> ParsePluginOptions(const std::string &parameter);

// The protoc plugin.  All files of a request go into one module tree.
class CodeGenerator : public google::protobuf::compiler::CodeGenerator {
public:
  bool Generate(const google::protobuf::FileDescriptor *file,
                const std::string &parameter,
                google::protobuf::compiler::GeneratorContext *generator_context,
                std::string *error) const override;

  bool GenerateAll(
      const std::vector<const google::protobuf::FileDescriptor *> &files,
      const std::string &parameter,
      google::protobuf::compiler::GeneratorContext *generator_context,
      std::string *error) const override;

  uint64_t GetSupportedFeatures() const override {
    return FEATURE_PROTO3_OPTIONAL;
  }
};

} // namespace protomod
