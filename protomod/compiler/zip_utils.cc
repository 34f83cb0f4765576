// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/zip_utils.h"
#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/output.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <unistd.h>

namespace protomod {

absl::Status AddFileToZip(zip_t *zip, const std::string &filename,
                          const std::string &content) {
  // libzip takes ownership of the buffer and frees it once the archive is
  // written, so it has to outlive content.
  zip_uint8_t *buffer = nullptr;
  zip_uint64_t buffer_size = content.size();
  if (buffer_size > 0) {
    buffer = static_cast<zip_uint8_t *>(malloc(buffer_size));
    if (buffer == nullptr) {
      return absl::InternalError("Failed to allocate buffer for zip source");
    }
    std::memcpy(buffer, content.data(), buffer_size);
  }

  zip_source_t *source = zip_source_buffer(zip, buffer, buffer_size, 1);
  if (source == nullptr) {
    free(buffer);
    return absl::InternalError(
        absl::StrFormat("Failed to create zip source: %s", zip_strerror(zip)));
  }

  zip_int64_t index =
      zip_file_add(zip, filename.c_str(), source, ZIP_FL_ENC_UTF_8);
  if (index < 0) {
    zip_source_free(source);
    return absl::InternalError(absl::StrFormat(
        "Failed to add file %s to zip: %s", filename, zip_strerror(zip)));
  }
  return absl::OkStatus();
}

absl::StatusOr<std::string> ZipFiles(const std::vector<EmittedFile> &files) {
  // libzip writes archives to files, so build it in a temporary one.
  char tmp_file_template[] = "/tmp/protomod_zip_XXXXXX";
  int fd = mkstemp(tmp_file_template);
  if (fd < 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to create temporary file: %s", strerror(errno)));
  }
  close(fd);
  std::string tmp_file(tmp_file_template);
  absl::Cleanup remove_tmp = [&tmp_file] { std::remove(tmp_file.c_str()); };

  int error;
  zip_t *arc = zip_open(tmp_file.c_str(), ZIP_CREATE | ZIP_TRUNCATE, &error);
  if (arc == nullptr) {
    return absl::InternalError(
        absl::StrFormat("Failed to open zip archive (error code: %d)", error));
  }

  for (auto &file : files) {
    if (absl::Status status = AddFileToZip(arc, file.path, file.content);
        !status.ok()) {
      zip_discard(arc);
      return status;
    }
  }

  // Closing writes the archive.
  if (zip_close(arc) < 0) {
    absl::Status status = absl::InternalError(absl::StrFormat(
        "Failed to close zip archive: %s", zip_strerror(arc)));
    zip_discard(arc);
    return status;
  }
  return ReadFile(tmp_file);
}

} // namespace protomod
