// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "google/protobuf/compiler/code_generator.h"
#include "google/protobuf/compiler/plugin.h"
#include "protomod/compiler/gen.h"

int main(int argc, char *argv[]) {
  protomod::CodeGenerator generator;
  return google::protobuf::compiler::PluginMain(argc, argv, &generator);
}
