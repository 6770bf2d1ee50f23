#pragma once

#include <exception>
#include <string>

namespace feedstore::cli {

enum ExitCode : int {
  kExitOk                 = 0,
  kExitUsage              = 1,
  kExitStorageUnavailable = 2,
  kExitNotFound           = 3,
  kExitConstraint         = 4,
  kExitLockContention     = 5,
  kExitOther              = 6,
};

// Maps a caught error to the process exit code.
int ToExitCode(const std::exception& e);

// One-line operator message: "<kind>: <what>" plus field/id when known.
std::string Describe(const std::exception& e);

} // namespace feedstore::cli
