// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/gen.h"
#include "absl/strings/str_format.h"
#include "absl/strings/str_join.h"
#include "absl/strings/str_split.h"
#include "google/protobuf/compiler/importer.h"
#include "protomod/compiler/errors.h"
#include "protomod/compiler/zip_utils.h"
#include <algorithm>
#include <cstring>
#include <filesystem>
#include <sstream>

namespace protomod {

namespace fs = std::filesystem;

absl::Status WriteToZeroCopyStream(
    const std::string &data,
    google::protobuf::io::ZeroCopyOutputStream *stream) {
  void *data_buffer;
  int size;
  size_t offset = 0;
  while (offset < data.size()) {
    if (!stream->Next(&data_buffer, &size)) {
      return absl::InternalError("Failed to write to output stream");
    }
    int to_copy = std::min(size, static_cast<int>(data.size() - offset));
    std::memcpy(data_buffer, data.data() + offset, to_copy);
    offset += to_copy;
    stream->BackUp(size - to_copy);
  }
  return absl::OkStatus();
}

FileGenerator::FileGenerator(const google::protobuf::FileDescriptor *file,
                             const GeneratorOptions *options)
    : file_(file) {
  Scope scope = PackageScope(file->package());
  for (int i = 0; i < file->message_type_count(); i++) {
    message_gens_.push_back(
        std::make_unique<MessageGenerator>(file->message_type(i), scope,
                                           options));
  }
  // Enums
  for (int i = 0; i < file->enum_type_count(); i++) {
    enum_gens_.push_back(
        std::make_unique<EnumGenerator>(file->enum_type(i), options));
  }
}

void FileGenerator::Compile() {
  for (auto &msg_gen : message_gens_) {
    msg_gen->Compile();
  }
}

GeneratedUnit FileGenerator::GenerateUnit(const std::string &file_name) {
  GeneratedUnit unit;
  unit.file_name = file_name;
  unit.package_path = PackagePath(file_->package());

  std::stringstream os;
  for (auto &msg_gen : message_gens_) {
    msg_gen->Generate(os, "", &unit.comments);
    if (msg_gen->HasNestedModule()) {
      unit.module_names.push_back(msg_gen->ModuleName());
    }
  }
  for (auto &enum_gen : enum_gens_) {
    enum_gen->Generate(os, "", &unit.comments);
  }
  unit.source_text = os.str();
  return unit;
}

namespace {

class ErrorCollector
    : public google::protobuf::compiler::MultiFileErrorCollector {
public:
  void AddError(const std::string &filename, int line, int column,
                const std::string &message) override {
    // Line and column are zero based, or -1 for errors about a whole file.
    if (line < 0) {
      errors_.push_back(absl::StrFormat("%s: %s", filename, message));
    } else {
      errors_.push_back(absl::StrFormat("%s:%d:%d: %s", filename, line + 1,
                                        column + 1, message));
    }
  }

  void AddWarning(const std::string &filename, int line, int column,
                  const std::string &message) override {
    std::cerr << filename << ":" << line + 1 << ":" << column + 1
              << ": warning: " << message << "\n";
  }

  std::string Errors() const { return absl::StrJoin(errors_, "\n"); }

private:
  std::vector<std::string> errors_;
};

// DiskSourceTree matches disk paths against its mappings textually, so
// both sides are made absolute.
std::string AbsolutePath(const std::string &path) {
  std::string abs = fs::absolute(path).lexically_normal().string();
  while (abs.size() > 1 && abs.back() == '/') {
    abs.pop_back();
  }
  return abs;
}

} // namespace

absl::StatusOr<std::vector<GeneratedUnit>>
ProtocGenerator::Generate(const std::vector<std::string> &definition_files,
                          const std::vector<std::string> &include_paths) {
  google::protobuf::compiler::DiskSourceTree source_tree;
  if (include_paths.empty()) {
    source_tree.MapPath("", AbsolutePath("."));
  }
  for (auto &include : include_paths) {
    source_tree.MapPath("", AbsolutePath(include));
  }
  ErrorCollector errors;
  google::protobuf::compiler::Importer importer(&source_tree, &errors);

  std::vector<const google::protobuf::FileDescriptor *> files;
  for (auto &def : definition_files) {
    std::string virtual_file;
    std::string shadowing_disk_file;
    switch (source_tree.DiskFileToVirtualFile(AbsolutePath(def), &virtual_file,
                                              &shadowing_disk_file)) {
    case google::protobuf::compiler::DiskSourceTree::SUCCESS:
      break;
    case google::protobuf::compiler::DiskSourceTree::SHADOWED:
      return GenerationError(absl::StrFormat(
          "%s: Input is shadowed in the include paths by \"%s\"", def,
          shadowing_disk_file));
    case google::protobuf::compiler::DiskSourceTree::CANNOT_OPEN:
      return GenerationError(absl::StrFormat(
          "%s: %s", def, source_tree.GetLastErrorMessage()));
    case google::protobuf::compiler::DiskSourceTree::NO_MAPPING: {
      std::error_code ec;
      if (fs::exists(def, ec)) {
        return GenerationError(absl::StrFormat(
            "%s: File does not reside within any path specified in the "
            "include paths",
            def));
      }
      // Not a file on disk, try it as a path relative to the include paths.
      virtual_file = def;
      break;
    }
    }

    const google::protobuf::FileDescriptor *file = importer.Import(virtual_file);
    if (file == nullptr) {
      return GenerationError(absl::StrFormat("Failed to compile %s:\n%s", def,
                                             errors.Errors()));
    }
    files.push_back(file);
  }

  std::vector<GeneratedUnit> units;
  for (size_t i = 0; i < files.size(); i++) {
    std::cerr << "Generating " << definition_files[i] << "\n";
    FileGenerator gen(files[i], &options_);
    gen.Compile();
    units.push_back(gen.GenerateUnit(definition_files[i]));
  }
  return units;
}

static absl::StatusOr<bool> ParseBool(const std::string &key,
                                      const std::string &value) {
  if (value.empty() || value == "true") {
    return true;
  }
  if (value == "false") {
    return false;
  }
  return absl::InvalidArgumentError(absl::StrFormat(
      "Option %s expects true or false, not \"%s\"", key, value));
}

absl::StatusOr<PluginOptions>
ParsePluginOptions(const std::string &parameter) {
  std::vector<std::pair<std::string, std::string>> options;
  google::protobuf::compiler::ParseGeneratorParameter(parameter, &options);

  PluginOptions result;
  for (auto &[key, value] : options) {
    if (key == "root_module") {
      result.assemble.emit.root_module = value;
    } else if (key == "prepend_header") {
      absl::StatusOr<bool> b = ParseBool(key, value);
      if (!b.ok()) {
        return b.status();
      }
      result.assemble.emit.prepend_header = *b;
    } else if (key == "toplevel_attribute") {
      result.assemble.emit.toplevel_attribute = value;
    } else if (key == "disable_comments") {
      std::vector<std::string> patterns =
          absl::StrSplit(value, ':', absl::SkipEmpty());
      result.assemble.disable_comments = std::move(patterns);
    } else if (key == "type_attribute") {
      if (absl::Status status =
              result.generator.type_attributes.AddList(value);
          !status.ok()) {
        return status;
      }
    } else if (key == "enum_attribute") {
      if (absl::Status status =
              result.generator.enum_attributes.AddList(value);
          !status.ok()) {
        return status;
      }
    } else if (key == "zip") {
      absl::StatusOr<bool> b = ParseBool(key, value);
      if (!b.ok()) {
        return b.status();
      }
      result.zip = *b;
    } else {
      return absl::InvalidArgumentError(
          absl::StrFormat("Unknown option %s", key));
    }
  }
  return result;
}

static bool WriteOutput(
    const std::string &filename, const std::string &content,
    google::protobuf::compiler::GeneratorContext *generator_context,
    std::string *error) {
  std::unique_ptr<google::protobuf::io::ZeroCopyOutputStream> output(
      generator_context->Open(filename));
  if (output == nullptr) {
    *error = absl::StrFormat("Failed to open %s for writing", filename);
    return false;
  }
  if (absl::Status status = WriteToZeroCopyStream(content, output.get());
      !status.ok()) {
    *error = absl::StrFormat("Failed to write %s: %s", filename,
                             status.message());
    return false;
  }
  return true;
}

bool CodeGenerator::Generate(
    const google::protobuf::FileDescriptor *file, const std::string &parameter,
    google::protobuf::compiler::GeneratorContext *generator_context,
    std::string *error) const {
  return GenerateAll({file}, parameter, generator_context, error);
}

bool CodeGenerator::GenerateAll(
    const std::vector<const google::protobuf::FileDescriptor *> &files,
    const std::string &parameter,
    google::protobuf::compiler::GeneratorContext *generator_context,
    std::string *error) const {
  absl::StatusOr<PluginOptions> options = ParsePluginOptions(parameter);
  if (!options.ok()) {
    *error = std::string(options.status().message());
    return false;
  }

  std::vector<GeneratedUnit> units;
  for (auto file : files) {
    std::cerr << "Generating " << file->name() << "\n";
    FileGenerator gen(file, &options->generator);
    gen.Compile();
    units.push_back(gen.GenerateUnit(file->name()));
  }

  absl::StatusOr<std::vector<EmittedFile>> emitted =
      Assemble(units, options->assemble);
  if (!emitted.ok()) {
    *error = std::string(emitted.status().message());
    return false;
  }

  // The names of the module files aren't known until the tree is built.
  // Bazel needs every output declared up front so it is given a single
  // zip instead.
  if (options->zip) {
    absl::StatusOr<std::string> zip = ZipFiles(*emitted);
    if (!zip.ok()) {
      *error = std::string(zip.status().message());
      return false;
    }
    return WriteOutput(options->assemble.emit.root_module + ".zip", *zip,
                       generator_context, error);
  }

  for (auto &file : *emitted) {
    if (!WriteOutput(file.path, file.content, generator_context, error)) {
      return false;
    }
  }
  return true;
}

} // namespace protomod
