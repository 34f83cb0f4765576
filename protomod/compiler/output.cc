// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/output.h"
#include "absl/container/btree_set.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/errors.h"
#include <fstream>
#include <iostream>
#include <sstream>
#include <system_error>

namespace protomod {

namespace fs = std::filesystem;

static std::string RootFileName(const fs::path &output_dir) {
  return output_dir.filename().string() + ".rs";
}

absl::StatusOr<std::string> ReadFile(const fs::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
      return absl::NotFoundError(
          absl::StrFormat("No such file %s", path.string()));
    }
    return absl::InternalError(
        absl::StrFormat("Failed to open %s for reading", path.string()));
  }
  std::stringstream ss;
  ss << in.rdbuf();
  if (in.bad()) {
    return absl::InternalError(
        absl::StrFormat("Failed to read %s", path.string()));
  }
  return ss.str();
}

// All regular files under dir, as paths relative to base.
static absl::StatusOr<absl::btree_set<std::string>>
CollectFiles(const fs::path &dir, const fs::path &base) {
  absl::btree_set<std::string> files;
  std::error_code ec;
  if (!fs::exists(dir, ec)) {
    return files;
  }
  if (!fs::is_directory(dir, ec)) {
    return OutputConflictError(absl::StrFormat(
        "Output directory %s exists but is not a directory", dir.string()));
  }
  fs::recursive_directory_iterator it(dir, ec);
  if (ec) {
    return absl::InternalError(absl::StrFormat(
        "Failed to read directory %s: %s", dir.string(), ec.message()));
  }
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) {
      return absl::InternalError(absl::StrFormat(
          "Failed to read directory %s: %s", dir.string(), ec.message()));
    }
    const fs::directory_entry &entry = *it;
    if (entry.is_regular_file(ec)) {
      files.insert(entry.path().lexically_relative(base).generic_string());
    } else if (!entry.is_directory(ec)) {
      return OutputConflictError(absl::StrFormat(
          "Found %s in %s which is neither a file nor a directory",
          entry.path().string(), dir.string()));
    }
  }
  return files;
}

absl::Status CheckOutputConflicts(const fs::path &output_dir) {
  std::error_code ec;
  if (fs::exists(output_dir, ec) && !fs::is_directory(output_dir, ec)) {
    return OutputConflictError(
        absl::StrFormat("Output directory %s exists but is not a directory",
                        output_dir.string()));
  }
  fs::path root_file = output_dir.parent_path() / RootFileName(output_dir);
  if (fs::exists(root_file, ec) && !fs::is_regular_file(root_file, ec)) {
    return OutputConflictError(absl::StrFormat(
        "Module file %s exists but is not a regular file", root_file.string()));
  }
  return absl::OkStatus();
}

absl::StatusOr<int> CountDiffs(const fs::path &output_dir,
                               const std::vector<EmittedFile> &files) {
  fs::path base = output_dir.parent_path();
  std::string root_file = RootFileName(output_dir);
  absl::StatusOr<absl::btree_set<std::string>> existing =
      CollectFiles(output_dir, base);
  if (!existing.ok()) {
    return existing.status();
  }

  int diff = 0;
  bool saw_root = false;
  for (const auto &file : files) {
    bool is_root = file.path == root_file;
    saw_root |= is_root;
    if (!is_root && existing->erase(file.path) == 0) {
      std::cerr << "Found new file at " << file.path << "\n";
      diff++;
      continue;
    }
    absl::StatusOr<std::string> old = ReadFile(base / file.path);
    if (absl::IsNotFound(old.status())) {
      std::cerr << "Found new file at " << file.path << "\n";
      diff++;
      continue;
    }
    if (!old.ok()) {
      return old.status();
    }
    if (*old != file.content) {
      std::cerr << "Found diff in " << file.path << "\n";
      diff++;
    }
  }
  if (!saw_root) {
    return absl::InternalError(
        absl::StrFormat("No module file %s among the emitted files", root_file));
  }
  for (const auto &stale : *existing) {
    std::cerr << "Found stale file at " << stale << "\n";
    diff++;
  }
  return diff;
}

absl::Status WriteTree(const fs::path &output_dir,
                       const std::vector<EmittedFile> &files) {
  if (absl::Status status = CheckOutputConflicts(output_dir); !status.ok()) {
    return status;
  }
  std::error_code ec;
  fs::remove_all(output_dir, ec);
  if (ec) {
    return absl::InternalError(absl::StrFormat(
        "Failed to clean out old dir %s: %s", output_dir.string(), ec.message()));
  }
  fs::create_directories(output_dir, ec);
  if (ec) {
    return absl::InternalError(
        absl::StrFormat("Failed to create output directory %s: %s",
                        output_dir.string(), ec.message()));
  }

  fs::path base = output_dir.parent_path();
  for (const auto &file : files) {
    fs::path path = base / file.path;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      return absl::InternalError(
          absl::StrFormat("Failed to create module directory %s: %s",
                          path.parent_path().string(), ec.message()));
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << file.content;
    out.close();
    if (!out) {
      return absl::InternalError(
          absl::StrFormat("Failed to write %s", path.string()));
    }
  }
  return absl::OkStatus();
}

} // namespace protomod
