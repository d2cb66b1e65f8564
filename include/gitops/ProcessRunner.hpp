#pragma once

#include <string>
#include <vector>

namespace mirror::gitops {

/// Captured result of one child process.
/// Class abbreviation: pres
struct ProcessResult {
  int iExitCode = -1;
  std::string sStdout;
  std::string sStderr;

  bool ok() const { return iExitCode == 0; }
  /// stderr followed by stdout, trimmed, for error messages.
  std::string combinedOutput() const;
};

/// Runs an external program with an explicit working directory.
/// Never touches the parent's current directory and never goes through a
/// shell, so concurrent callers with different directories are safe.
/// Class abbreviation: prun
class ProcessRunner {
 public:
  /// Run vArgv (argv[0] resolved through PATH) inside sWorkingDir.
  /// vExtraEnv holds "NAME=value" entries appended to the inherited
  /// environment. Blocks until the child exits.
  /// Throws ToolInvocationError when the child cannot be started.
  static ProcessResult run(const std::vector<std::string>& vArgv, const std::string& sWorkingDir,
                           const std::vector<std::string>& vExtraEnv = {});

  /// Human-readable command line for log and error messages.
  static std::string describe(const std::vector<std::string>& vArgv);
};

}  // namespace mirror::gitops
