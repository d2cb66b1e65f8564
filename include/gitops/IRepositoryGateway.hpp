#pragma once

#include <optional>
#include <string>
#include <vector>

#include "common/Types.hpp"

namespace mirror::gitops {

/// Pure abstract interface to the version-control system.
/// Every verb takes the repository explicitly and maps to one blocking tool
/// invocation; nothing is cached between calls.
///
/// Failures are thrown: NotARepositoryError, CheckoutConflictError,
/// RebaseConflictError, ToolInvocationError. No-op conditions are returned
/// (empty optional, false, empty vector).
class IRepositoryGateway {
 public:
  virtual ~IRepositoryGateway() = default;

  virtual bool isRepository(const common::RepositoryRef& rrRepo) = 0;

  /// Empty string when HEAD is detached.
  virtual std::string currentBranch(const common::RepositoryRef& rrRepo) = 0;

  virtual bool branchExists(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                            common::BranchScope scope) = 0;

  /// Create sBranch and check it out, from the remote tracking branch when
  /// bFromRemote, else from the current HEAD.
  virtual void createBranch(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                            bool bFromRemote) = 0;

  virtual void checkout(const common::RepositoryRef& rrRepo, const std::string& sBranch) = 0;

  /// Paths changed since the previous revision; the staged tree when there
  /// is no previous revision. Order follows the tool's output.
  virtual std::vector<std::string> changedPathsSincePrevious(
      const common::RepositoryRef& rrRepo) = 0;

  virtual std::vector<std::string> untrackedPaths(const common::RepositoryRef& rrRepo) = 0;

  /// Paths currently staged in the index.
  virtual std::vector<std::string> stagedPaths(const common::RepositoryRef& rrRepo) = 0;

  virtual void stageAll(const common::RepositoryRef& rrRepo) = 0;
  virtual void stageModifiedOnly(const common::RepositoryRef& rrRepo) = 0;

  /// Returns the new commit, or std::nullopt when there was nothing to commit.
  virtual std::optional<std::string> commit(const common::RepositoryRef& rrRepo,
                                            const std::string& sMessage,
                                            const std::optional<std::string>& oAuthor) = 0;

  virtual std::string fixupCommit(const common::RepositoryRef& rrRepo,
                                  const std::string& sBaseCommit, const std::string& sMessage,
                                  const std::optional<std::string>& oAuthor) = 0;

  /// Rewrite history so fixup commits are folded into sBaseCommit.
  virtual void autosquashRebase(const common::RepositoryRef& rrRepo,
                                const std::string& sBaseCommit) = 0;

  /// HEAD~n, or std::nullopt when history is shorter than n.
  virtual std::optional<std::string> revisionBefore(const common::RepositoryRef& rrRepo,
                                                    int iCount) = 0;

  /// HEAD, or std::nullopt in a repository without commits.
  virtual std::optional<std::string> headCommit(const common::RepositoryRef& rrRepo) = 0;

  virtual bool hasUncommittedChanges(const common::RepositoryRef& rrRepo) = 0;

  /// Like hasUncommittedChanges, but untracked files do not count.
  virtual bool hasTrackedChanges(const common::RepositoryRef& rrRepo) = 0;

  virtual bool hasPaused(const common::RepositoryRef& rrRepo,
                         const std::string& sLockFileName) = 0;
};

}  // namespace mirror::gitops
