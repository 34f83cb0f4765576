// Copyright 2025 David Allison
// All Rights Reserved
// See LICENSE file for licensing information.

#include "protomod/compiler/formatter.h"
#include "absl/cleanup/cleanup.h"
#include "absl/strings/str_format.h"
#include "protomod/compiler/output.h"
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace protomod {

absl::StatusOr<std::string> FormatRustSource(const std::string &source,
                                             const std::string &edition) {
  // rustfmt formats files in place, so the source goes through a temporary
  // file.
  char tmp_file_template[] = "/tmp/protomod_fmt_XXXXXX.rs";
  int fd = mkstemps(tmp_file_template, 3);
  if (fd < 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to create temporary file: %s", strerror(errno)));
  }
  close(fd);
  std::string tmp_file(tmp_file_template);
  absl::Cleanup remove_tmp = [&tmp_file] { std::remove(tmp_file.c_str()); };

  {
    std::ofstream out(tmp_file, std::ios::binary | std::ios::trunc);
    out << source;
    out.close();
    if (!out) {
      return absl::InternalError(
          absl::StrFormat("Failed to write temporary file %s", tmp_file));
    }
  }

  std::string program = "rustfmt";
  std::string edition_flag = "--edition";
  char *argv[] = {program.data(), edition_flag.data(),
                  const_cast<char *>(edition.c_str()), tmp_file.data(),
                  nullptr};
  pid_t pid;
  int err = posix_spawnp(&pid, program.c_str(), nullptr, nullptr, argv,
                         environ);
  if (err != 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to format generated code, could not run rustfmt: %s",
        strerror(err)));
  }
  int wstatus;
  if (waitpid(pid, &wstatus, 0) < 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to wait for rustfmt: %s", strerror(errno)));
  }
  if (!WIFEXITED(wstatus) || WEXITSTATUS(wstatus) != 0) {
    return absl::InternalError(absl::StrFormat(
        "Failed to format, rustfmt returned error status %d",
        WIFEXITED(wstatus) ? WEXITSTATUS(wstatus) : -1));
  }
  return ReadFile(tmp_file);
}

} // namespace protomod
