#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace mirror::common {

/// Failure category. Decides how far a failure reaches:
/// Configuration stops the process before any cycle, the others end only
/// the current cycle.
enum class ErrorKind { Configuration, RepositoryState, ToolInvocation, FileSystem };

/// Base error for all application-level exceptions.
/// Carries the failure category and machine-readable error code slug.
struct AppError : public std::runtime_error {
  ErrorKind _ekKind;
  std::string _sErrorCode;

  explicit AppError(ErrorKind ekKind, std::string sCode, std::string sMsg)
      : std::runtime_error(std::move(sMsg)),
        _ekKind(ekKind),
        _sErrorCode(std::move(sCode)) {}
};

/// Invalid or missing configuration (bad paths, invalid intervals).
struct ConfigurationError : AppError {
  explicit ConfigurationError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::Configuration, std::move(sCode), std::move(sMsg)) {}
};

/// Path is not a git working tree.
struct NotARepositoryError : AppError {
  explicit NotARepositoryError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::RepositoryState, std::move(sCode), std::move(sMsg)) {}
};

/// Source branch cannot be determined (detached HEAD, empty name).
struct BranchResolutionError : AppError {
  explicit BranchResolutionError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::RepositoryState, std::move(sCode), std::move(sMsg)) {}
};

/// Checkout or branch creation refused by git (dirty tree, name clash).
struct CheckoutConflictError : AppError {
  explicit CheckoutConflictError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::RepositoryState, std::move(sCode), std::move(sMsg)) {}
};

/// Autosquash rebase stopped on a conflict. The rebase is aborted first.
struct RebaseConflictError : AppError {
  explicit RebaseConflictError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::RepositoryState, std::move(sCode), std::move(sMsg)) {}
};

/// External tool could not be run or exited unexpectedly.
/// Keeps the exit code and captured output for diagnostics.
struct ToolInvocationError : AppError {
  int _iExitCode;
  std::string _sOutput;

  explicit ToolInvocationError(std::string sCode, std::string sMsg, int iExitCode = -1,
                               std::string sOutput = {})
      : AppError(ErrorKind::ToolInvocation, std::move(sCode), std::move(sMsg)),
        _iExitCode(iExitCode),
        _sOutput(std::move(sOutput)) {}
};

/// Copy or delete in the mirror working tree failed.
struct FileApplyError : AppError {
  explicit FileApplyError(std::string sCode, std::string sMsg)
      : AppError(ErrorKind::FileSystem, std::move(sCode), std::move(sMsg)) {}
};

/// Short lower-case name for log lines ("configuration", "repository_state", ...).
const char* toString(ErrorKind ekKind);

}  // namespace mirror::common
