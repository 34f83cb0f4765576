// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/gen.h"
#include "google/protobuf/compiler/importer.h"
#include "google/protobuf/io/zero_copy_stream_impl_lite.h"
#include "protomod/compiler/errors.h"
#include "protomod/compiler/rust_paths.h"
#include <gtest/gtest.h>
#include <map>

namespace protomod {

static std::string TestData(const std::string &name) {
  return std::string(PROTOMOD_TESTDATA_DIR) + "/" + name;
}

static void ExpectContains(const std::string &text, const std::string &want) {
  EXPECT_NE(std::string::npos, text.find(want))
      << "missing:\n" << want << "\nin:\n" << text;
}

static absl::StatusOr<std::vector<GeneratedUnit>>
Generate(const std::vector<std::string> &files,
         GeneratorOptions options = {}) {
  ProtocGenerator generator(std::move(options));
  std::vector<std::string> paths;
  for (auto &file : files) {
    paths.push_back(TestData(file));
  }
  return generator.Generate(paths, {PROTOMOD_TESTDATA_DIR});
}

TEST(RustPathsTest, RelativePath) {
  ASSERT_EQ("Foo", RelativePath({"a", "b"}, {"a", "b"}, "Foo"));
  ASSERT_EQ("super::Foo", RelativePath({"a", "b"}, {"a"}, "Foo"));
  ASSERT_EQ("c::Foo", RelativePath({"a", "b"}, {"a", "b", "c"}, "Foo"));
  ASSERT_EQ("super::super::x::Foo",
            RelativePath({"a", "b", "c"}, {"a", "x"}, "Foo"));
  ASSERT_EQ("a::Foo", RelativePath({}, {"a"}, "Foo"));
  ASSERT_EQ(Scope({"foo", "r#type"}), PackageScope("foo.type"));
  ASSERT_TRUE(PackageScope("").empty());
}

TEST(GenTest, Message) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo_bar.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  ASSERT_EQ(1u, units->size());
  const GeneratedUnit &unit = (*units)[0];
  ASSERT_EQ(TestData("foo_bar.proto"), unit.file_name);
  ASSERT_EQ(std::vector<std::string>({"foo", "bar"}), unit.package_path);

  const std::string &text = unit.source_text;
  ExpectContains(text, DocAnchor(0) +
                           "\n#[allow(clippy::derive_partial_eq_without_eq)]\n"
                           "#[derive(Clone, PartialEq, ::prost::Message)]\n"
                           "pub struct TestMessage {\n");
  ExpectContains(text, "    #[prost(int32, tag = \"1\")]\n    pub x: i32,\n");
  ExpectContains(text, "    #[prost(string, tag = \"2\")]\n"
                       "    pub s: ::prost::alloc::string::String,\n");
  ExpectContains(text, "    #[prost(int32, repeated, tag = \"3\")]\n"
                       "    pub vi32: ::prost::alloc::vec::Vec<i32>,\n");
  ExpectContains(text, "    #[prost(string, repeated, tag = \"4\")]\n");
  ExpectContains(text,
                 "    #[prost(message, optional, tag = \"5\")]\n"
                 "    pub m: ::core::option::Option<test_message::InnerMessage>,\n");
  ExpectContains(
      text, "    pub vm: ::prost::alloc::vec::Vec<test_message::InnerMessage>,\n");
  ExpectContains(text, "    #[prost(enumeration = \"Color\", tag = \"7\")]\n"
                       "    pub e: i32,\n");
  ExpectContains(text, "    #[prost(map = \"string, int32\", tag = \"8\")]\n"
                       "    pub counts: ::std::collections::HashMap<"
                       "::prost::alloc::string::String, i32>,\n");
  ExpectContains(text, "    #[prost(oneof = \"test_message::U1\", tags = \"9, "
                       "10, 11\")]\n"
                       "    pub u1: ::core::option::Option<test_message::U1>,\n");
  ExpectContains(text, "    #[prost(int64, optional, tag = \"12\")]\n"
                       "    pub maybe: ::core::option::Option<i64>,\n");
  ExpectContains(text, "    #[prost(bytes = \"vec\", tag = \"13\")]\n"
                       "    pub data: ::prost::alloc::vec::Vec<u8>,\n");
  ExpectContains(text, "    pub other: ::core::option::Option<super::Foo>,\n");
  ExpectContains(text,
                 "    #[prost(message, optional, boxed, tag = \"15\")]\n"
                 "    pub child: ::core::option::Option<"
                 "::prost::alloc::boxed::Box<TestMessage>>,\n");
  ExpectContains(text,
                 "    #[prost(enumeration = \"test_message::Mode\", tag = "
                 "\"16\")]\n");
  ExpectContains(text, "    pub r#type: i32,\n");
  ExpectContains(text, "    #[prost(map = \"int32, enumeration(Color)\", tag = "
                       "\"18\")]\n"
                       "    pub colors: ::std::collections::HashMap<i32, i32>,\n");

  // Map entries are not types of their own.
  EXPECT_EQ(std::string::npos, text.find("CountsEntry"));
}

TEST(GenTest, NestedModule) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo_bar.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  const std::string &text = (*units)[0].source_text;

  ExpectContains(text, "/// Nested message and enum types in `TestMessage`.\n"
                       "pub mod test_message {\n");
  ExpectContains(text, "    pub struct InnerMessage {\n"
                       "        #[prost(string, tag = \"1\")]\n"
                       "        pub str: ::prost::alloc::string::String,\n"
                       "        #[prost(fixed64, tag = \"2\")]\n"
                       "        pub f: u64,\n"
                       "    }\n");
  ExpectContains(text, "    #[derive(Clone, PartialEq, ::prost::Oneof)]\n"
                       "    pub enum U1 {\n"
                       "        #[prost(int32, tag = \"9\")]\n"
                       "        U1a(i32),\n"
                       "        #[prost(string, tag = \"10\")]\n"
                       "        U1b(::prost::alloc::string::String),\n"
                       "        #[prost(message, tag = \"11\")]\n"
                       "        U1c(InnerMessage),\n"
                       "    }\n");
  ExpectContains(text, "    pub enum Mode {\n"
                       "        Unspecified = 0,\n"
                       "        Fast = 1,\n"
                       "    }\n");
}

TEST(GenTest, Enum) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo_bar.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  const std::string &text = (*units)[0].source_text;

  ExpectContains(text, "#[derive(Clone, Copy, Debug, PartialEq, Eq, Hash, "
                       "PartialOrd, Ord, ::prost::Enumeration)]\n"
                       "#[repr(i32)]\n"
                       "pub enum Color {\n"
                       "    Unspecified = 0,\n"
                       "    Red = 1,\n"
                       "    Green = 2,\n"
                       "}\n");
  ExpectContains(text, "            Self::Red => \"COLOR_RED\",\n");
  // The alias parses to the variant that owns its number.
  ExpectContains(text, "            \"COLOR_CRIMSON\" => Some(Self::Red),\n");
  EXPECT_EQ(std::string::npos, text.find("Crimson"));
}

TEST(GenTest, Comments) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo_bar.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  const GeneratedUnit &unit = (*units)[0];

  ASSERT_EQ(3u, unit.comments.size());
  ASSERT_EQ(".foo.bar.TestMessage", unit.comments[0].declaration);
  ASSERT_EQ(" A test message.\n\n     let m = TestMessage::default();",
            unit.comments[0].text);
  // Fields come before the nested module.
  ASSERT_EQ(".foo.bar.TestMessage.x", unit.comments[1].declaration);
  ASSERT_EQ(" The x coordinate.", unit.comments[1].text);
  ASSERT_EQ(".foo.bar.TestMessage.InnerMessage", unit.comments[2].declaration);
  ASSERT_EQ(" Inner message.", unit.comments[2].text);

  absl::StatusOr<std::vector<EmittedFile>> files = Assemble(*units, {});
  ASSERT_TRUE(files.ok()) << files.status();
  const std::string &content = files->back().content;
  ExpectContains(content, "/// A test message.\n"
                          "///\n"
                          "/// ```ignore\n"
                          "///     let m = TestMessage::default();\n"
                          "/// ```\n"
                          "#[allow(clippy::derive_partial_eq_without_eq)]\n");
  ExpectContains(content, "    /// The x coordinate.\n"
                          "    #[prost(int32, tag = \"1\")]\n");
  EXPECT_EQ(std::string::npos, content.find("@@"));
}

TEST(GenTest, Keywords) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"keywords.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  const std::string &text = (*units)[0].source_text;
  ExpectContains(text, "    pub self_: i32,\n");
  ExpectContains(text, "    pub r#async: ::prost::alloc::string::String,\n");
}

TEST(GenTest, Proto2) {
  absl::StatusOr<std::vector<GeneratedUnit>> units = Generate({"legacy.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  const std::string &text = (*units)[0].source_text;
  ExpectContains(text, "    #[prost(int32, required, tag = \"1\")]\n"
                       "    pub id: i32,\n");
  ExpectContains(text, "    #[prost(string, optional, tag = \"2\")]\n"
                       "    pub name: ::core::option::Option<"
                       "::prost::alloc::string::String>,\n");
  ExpectContains(text,
                 "    #[prost(int32, repeated, packed = \"false\", tag = \"3\")]\n");
  ExpectContains(text, "    #[prost(int32, repeated, tag = \"4\")]\n");
}

TEST(GenTest, ModuleTree) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo.proto", "foo_bar.proto", "keywords.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  ASSERT_EQ(3u, units->size());

  absl::StatusOr<std::vector<EmittedFile>> files = Assemble(*units, {});
  ASSERT_TRUE(files.ok()) << files.status();
  ASSERT_EQ(4u, files->size());
  ASSERT_EQ("proto_types.rs", (*files)[0].path);
  ASSERT_EQ("#![allow(clippy::doc_markdown, clippy::use_self)]\n"
            "pub mod foo;\n",
            (*files)[0].content);
  ASSERT_EQ("proto_types/foo.rs", (*files)[1].path);
  ExpectContains((*files)[1].content,
                 "pub mod bar;\npub mod r#type;\n\n"
                 "/// A message in the parent package.\n"
                 "#[allow(clippy::derive_partial_eq_without_eq)]\n");
  ASSERT_EQ("proto_types/foo/bar.rs", (*files)[2].path);
  ASSERT_EQ("proto_types/foo/type.rs", (*files)[3].path);
}

TEST(GenTest, TypeAttributes) {
  GeneratorOptions options;
  options.type_attributes.Add(".foo.bar.TestMessage.InnerMessage",
                              "#[derive(Eq)]");
  options.type_attributes.Add("Color", "#[derive(serde::Serialize)]");
  options.enum_attributes.Add(".foo.bar",
                              "#[serde(rename_all = \"snake_case\")]");
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"foo_bar.proto"}, std::move(options));
  ASSERT_TRUE(units.ok()) << units.status();
  const std::string &text = (*units)[0].source_text;

  ExpectContains(text, "    #[derive(Clone, PartialEq, ::prost::Message)]\n"
                       "    #[derive(Eq)]\n"
                       "    pub struct InnerMessage {\n");
  ExpectContains(text, "#[derive(Clone, PartialEq, ::prost::Message)]\n"
                       "pub struct TestMessage {\n");
  ExpectContains(text, "#[repr(i32)]\n"
                       "#[derive(serde::Serialize)]\n"
                       "#[serde(rename_all = \"snake_case\")]\n"
                       "pub enum Color {\n");
  ExpectContains(text, "    #[repr(i32)]\n"
                       "    #[serde(rename_all = \"snake_case\")]\n"
                       "    pub enum Mode {\n");
  ExpectContains(text, "    #[derive(Clone, PartialEq, ::prost::Oneof)]\n"
                       "    #[serde(rename_all = \"snake_case\")]\n"
                       "    pub enum U1 {\n");
  // Enum attributes never apply to structs.
  EXPECT_EQ(std::string::npos,
            text.find("#[serde(rename_all = \"snake_case\")]\n"
                      "pub struct"));
}

TEST(GenTest, NestedModuleClashesWithPackage) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"nested_clash.proto", "foo_bar.proto"});
  ASSERT_TRUE(units.ok()) << units.status();
  ASSERT_EQ(std::vector<std::string>({"bar"}), (*units)[0].module_names);
  ASSERT_EQ(std::vector<std::string>({"test_message"}),
            (*units)[1].module_names);

  absl::StatusOr<std::vector<EmittedFile>> files = Assemble(*units, {});
  ASSERT_EQ(ErrorKind::kIdentifierCollision, GetErrorKind(files.status()));
  ExpectContains(std::string(files.status().message()), "'foo.bar'");
  ExpectContains(std::string(files.status().message()), "nested_clash.proto");
}

TEST(GenTest, SyntaxError) {
  absl::StatusOr<std::vector<GeneratedUnit>> units = Generate({"bad.proto"});
  ASSERT_EQ(ErrorKind::kGeneration, GetErrorKind(units.status()));
  ExpectContains(std::string(units.status().message()), "bad.proto");
}

TEST(GenTest, MissingFile) {
  absl::StatusOr<std::vector<GeneratedUnit>> units =
      Generate({"missing.proto"});
  ASSERT_EQ(ErrorKind::kGeneration, GetErrorKind(units.status()));
  ExpectContains(std::string(units.status().message()), "missing.proto");
}

TEST(GenTest, OutsideIncludePath) {
  ProtocGenerator generator;
  absl::StatusOr<std::vector<GeneratedUnit>> units = generator.Generate(
      {TestData("foo.proto")}, {std::string(PROTOMOD_TESTDATA_DIR) + "/none"});
  ASSERT_EQ(ErrorKind::kGeneration, GetErrorKind(units.status()));
  ExpectContains(std::string(units.status().message()), "foo.proto");
}

TEST(PluginOptionsTest, Parse) {
  absl::StatusOr<PluginOptions> options = ParsePluginOptions(
      "root_module=types,prepend_header=true,disable_comments=.foo:Bar,zip");
  ASSERT_TRUE(options.ok()) << options.status();
  ASSERT_EQ("types", options->assemble.emit.root_module);
  ASSERT_TRUE(options->assemble.emit.prepend_header);
  ASSERT_EQ(std::vector<std::string>({".foo", "Bar"}),
            options->assemble.disable_comments);
  ASSERT_TRUE(options->zip);

  options = ParsePluginOptions("");
  ASSERT_TRUE(options.ok());
  ASSERT_EQ("proto_types", options->assemble.emit.root_module);
  ASSERT_FALSE(options->zip);

  ASSERT_FALSE(ParsePluginOptions("colour=red").ok());
  ASSERT_FALSE(ParsePluginOptions("zip=maybe").ok());
}

TEST(PluginOptionsTest, Attributes) {
  absl::StatusOr<PluginOptions> options = ParsePluginOptions(
      "type_attribute=.foo=#[derive(Eq)];Bar=#[derive(serde::Serialize)],"
      "enum_attribute=.=#[repr(C)],type_attribute=.x=#[a = \"b\"]");
  ASSERT_TRUE(options.ok()) << options.status();
  ASSERT_EQ(std::vector<std::string>(
                {"#[derive(Eq)]", "#[derive(serde::Serialize)]"}),
            options->generator.type_attributes.Lookup(".foo.Bar"));
  ASSERT_EQ(std::vector<std::string>({"#[a = \"b\"]"}),
            options->generator.type_attributes.Lookup(".x.Y"));
  ASSERT_EQ(std::vector<std::string>({"#[repr(C)]"}),
            options->generator.enum_attributes.Lookup(".foo.Bar"));

  ASSERT_FALSE(ParsePluginOptions("type_attribute=#[derive(Eq)]").ok());
}

class FailOnError : public google::protobuf::compiler::MultiFileErrorCollector {
public:
  void AddError(const std::string &filename, int line, int column,
                const std::string &message) override {
    ADD_FAILURE() << filename << ":" << line << ":" << column << ": "
                  << message;
  }
};

// Keeps everything the plugin writes in memory.
class MemoryContext : public google::protobuf::compiler::GeneratorContext {
public:
  google::protobuf::io::ZeroCopyOutputStream *
  Open(const std::string &filename) override {
    return new google::protobuf::io::StringOutputStream(&files_[filename]);
  }

  const std::map<std::string, std::string> &Files() const { return files_; }

private:
  std::map<std::string, std::string> files_;
};

class PluginTest : public ::testing::Test {
protected:
  void SetUp() override {
    source_tree_.MapPath("", PROTOMOD_TESTDATA_DIR);
    importer_ = std::make_unique<google::protobuf::compiler::Importer>(
        &source_tree_, &errors_);
    for (auto name : {"foo.proto", "foo_bar.proto"}) {
      const google::protobuf::FileDescriptor *file = importer_->Import(name);
      ASSERT_NE(nullptr, file);
      files_.push_back(file);
    }
  }

  google::protobuf::compiler::DiskSourceTree source_tree_;
  FailOnError errors_;
  std::unique_ptr<google::protobuf::compiler::Importer> importer_;
  std::vector<const google::protobuf::FileDescriptor *> files_;
};

TEST_F(PluginTest, GenerateAll) {
  CodeGenerator generator;
  MemoryContext context;
  std::string error;
  ASSERT_TRUE(generator.GenerateAll(files_, "root_module=types", &context,
                                    &error))
      << error;
  std::vector<std::string> names;
  for (auto &[name, content] : context.Files()) {
    names.push_back(name);
  }
  ASSERT_EQ(std::vector<std::string>(
                {"types.rs", "types/foo.rs", "types/foo/bar.rs"}),
            names);
  ExpectContains(context.Files().at("types/foo/bar.rs"),
                 "pub struct TestMessage {\n");
}

TEST_F(PluginTest, Zip) {
  CodeGenerator generator;
  MemoryContext context;
  std::string error;
  ASSERT_TRUE(generator.GenerateAll(files_, "zip=true", &context, &error))
      << error;
  ASSERT_EQ(1u, context.Files().size());
  const std::string &zip = context.Files().at("proto_types.zip");
  ASSERT_EQ("PK", zip.substr(0, 2));
}

TEST_F(PluginTest, BadParameter) {
  CodeGenerator generator;
  MemoryContext context;
  std::string error;
  ASSERT_FALSE(generator.GenerateAll(files_, "nope=1", &context, &error));
  ExpectContains(error, "nope");
}

} // namespace protomod
