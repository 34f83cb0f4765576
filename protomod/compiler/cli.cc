// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "absl/flags/flag.h"
#include "absl/flags/parse.h"
#include "absl/flags/usage.h"
#include "protomod/compiler/attributes.h"
#include "protomod/compiler/errors.h"
#include "protomod/compiler/gen.h"
#include "protomod/compiler/pipeline.h"
#include "protomod/compiler/version.h"
#include <iostream>
#include <string>
#include <utility>
#include <vector>

ABSL_FLAG(std::vector<std::string>, proto_dirs, {},
          "Comma separated directories to search for definition files and "
          "their imports.  Every file in --proto_files must be under one of "
          "them.");
ABSL_FLAG(std::vector<std::string>, proto_files, {},
          "Comma separated definition files to generate code for.");
ABSL_FLAG(std::string, output_dir, "",
          "Directory that receives the module tree.  The root module file is "
          "written next to it, named after it.");
ABSL_FLAG(bool, prepend_header, false,
          "Start every generated file with a header naming the generator.");
ABSL_FLAG(std::string, toplevel_attribute, "",
          "Attribute written once at the top of the root module file, for "
          "example #![allow(clippy::all)].");
ABSL_FLAG(std::vector<std::string>, disable_comments, {},
          "Comma separated declaration paths whose comments are dropped.  '.' "
          "matches everything, a leading '.' anchors at the root and anything "
          "else matches a suffix.");
// Attributes such as #[derive(Eq, Hash)] hold commas, so these are plain
// strings split on ';' rather than vector flags.
ABSL_FLAG(std::string, type_attribute, "",
          "Semicolon separated path=attribute pairs.  The attribute is written "
          "above every struct, enum and oneof enum whose declaration path "
          "matches, for example '.my.pkg.Msg=#[derive(Eq)]'.  Paths match as "
          "in --disable_comments.");
ABSL_FLAG(std::string, enum_attribute, "",
          "Like --type_attribute, but only for enums and oneof enums.");
ABSL_FLAG(std::string, format, "",
          "If set, run rustfmt with this edition over every generated file.");

static constexpr char kUsage[] =
    "protomod <generate|validate> --proto_files=a.proto,b.proto "
    "--output_dir=src/proto_types [--proto_dirs=proto]";

int main(int argc, char **argv) {
  absl::SetProgramUsageMessage(kUsage);
  std::vector<char *> args = absl::ParseCommandLine(argc, argv);
  if (args.size() != 2) {
    std::cerr << "usage: " << kUsage << "\n";
    return 1;
  }

  protomod::Config config;
  std::string routine = args[1];
  if (routine == "generate") {
    config.mode = protomod::Mode::kGenerate;
  } else if (routine == "validate") {
    config.mode = protomod::Mode::kValidate;
  } else {
    std::cerr << "Unknown command " << routine << "\nusage: " << kUsage
              << "\n";
    return 1;
  }

  config.definition_files = absl::GetFlag(FLAGS_proto_files);
  config.include_paths = absl::GetFlag(FLAGS_proto_dirs);
  config.output_directory = absl::GetFlag(FLAGS_output_dir);
  config.prepend_header = absl::GetFlag(FLAGS_prepend_header);
  if (std::string attr = absl::GetFlag(FLAGS_toplevel_attribute);
      !attr.empty()) {
    config.toplevel_attribute = attr;
  }
  config.disable_comments = absl::GetFlag(FLAGS_disable_comments);
  if (std::string edition = absl::GetFlag(FLAGS_format); !edition.empty()) {
    config.format_edition = edition;
  }

  protomod::GeneratorOptions options;
  if (absl::Status status = options.type_attributes.AddList(
          absl::GetFlag(FLAGS_type_attribute));
      !status.ok()) {
    std::cerr << "--type_attribute: " << status.message() << "\n";
    return 1;
  }
  if (absl::Status status = options.enum_attributes.AddList(
          absl::GetFlag(FLAGS_enum_attribute));
      !status.ok()) {
    std::cerr << "--enum_attribute: " << status.message() << "\n";
    return 1;
  }

  std::cerr << "protomod " << PROTOMOD_VERSION << " " << routine << "\n";
  protomod::ProtocGenerator generator(std::move(options));
  if (absl::Status status = protomod::Run(generator, config); !status.ok()) {
    std::cerr << "Failed to " << routine << " ("
              << protomod::ErrorKindName(protomod::GetErrorKind(status))
              << "): " << status.message() << "\n";
    return 1;
  }
  return 0;
}
