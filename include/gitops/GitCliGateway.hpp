#pragma once

#include <optional>
#include <string>
#include <vector>

#include "gitops/IRepositoryGateway.hpp"
#include "gitops/ProcessRunner.hpp"

namespace mirror::gitops {

/// IRepositoryGateway backed by the git command-line client.
/// Class abbreviation: gw
class GitCliGateway : public IRepositoryGateway {
 public:
  explicit GitCliGateway(std::string sRemoteName = "origin");
  ~GitCliGateway() override;

  bool isRepository(const common::RepositoryRef& rrRepo) override;
  std::string currentBranch(const common::RepositoryRef& rrRepo) override;
  bool branchExists(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                    common::BranchScope scope) override;
  void createBranch(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                    bool bFromRemote) override;
  void checkout(const common::RepositoryRef& rrRepo, const std::string& sBranch) override;
  std::vector<std::string> changedPathsSincePrevious(const common::RepositoryRef& rrRepo) override;
  std::vector<std::string> untrackedPaths(const common::RepositoryRef& rrRepo) override;
  std::vector<std::string> stagedPaths(const common::RepositoryRef& rrRepo) override;
  void stageAll(const common::RepositoryRef& rrRepo) override;
  void stageModifiedOnly(const common::RepositoryRef& rrRepo) override;
  std::optional<std::string> commit(const common::RepositoryRef& rrRepo,
                                    const std::string& sMessage,
                                    const std::optional<std::string>& oAuthor) override;
  std::string fixupCommit(const common::RepositoryRef& rrRepo, const std::string& sBaseCommit,
                          const std::string& sMessage,
                          const std::optional<std::string>& oAuthor) override;
  void autosquashRebase(const common::RepositoryRef& rrRepo,
                        const std::string& sBaseCommit) override;
  std::optional<std::string> revisionBefore(const common::RepositoryRef& rrRepo,
                                            int iCount) override;
  std::optional<std::string> headCommit(const common::RepositoryRef& rrRepo) override;
  bool hasUncommittedChanges(const common::RepositoryRef& rrRepo) override;
  bool hasTrackedChanges(const common::RepositoryRef& rrRepo) override;
  bool hasPaused(const common::RepositoryRef& rrRepo, const std::string& sLockFileName) override;

  /// Split NUL-separated tool output (the -z forms) into paths.
  static std::vector<std::string> splitNulList(const std::string& sOutput);

 private:
  /// Run git with vArgs inside the repository.
  ProcessResult git(const common::RepositoryRef& rrRepo, const std::vector<std::string>& vArgs,
                    const std::vector<std::string>& vExtraEnv = {});

  /// Run git and throw ToolInvocationError on a non-zero exit.
  ProcessResult gitChecked(const common::RepositoryRef& rrRepo,
                           const std::vector<std::string>& vArgs);

  /// Throw NotARepositoryError unless rrRepo is a working tree.
  void requireRepository(const common::RepositoryRef& rrRepo);

  std::optional<std::string> verifyRevision(const common::RepositoryRef& rrRepo,
                                            const std::string& sRevision);

  std::string _sRemoteName;
};

}  // namespace mirror::gitops
