#include "gitops/GitCliGateway.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <filesystem>
#include <system_error>
#include <utility>

namespace mirror::gitops {

namespace {

std::string firstLine(const std::string& sOutput) {
  const auto iEnd = sOutput.find_first_of("\r\n");
  return iEnd == std::string::npos ? sOutput : sOutput.substr(0, iEnd);
}

}  // namespace

GitCliGateway::GitCliGateway(std::string sRemoteName) : _sRemoteName(std::move(sRemoteName)) {}
GitCliGateway::~GitCliGateway() = default;

std::vector<std::string> GitCliGateway::splitNulList(const std::string& sOutput) {
  std::vector<std::string> vPaths;
  std::size_t iStart = 0;
  while (iStart < sOutput.size()) {
    auto iEnd = sOutput.find('\0', iStart);
    if (iEnd == std::string::npos) {
      iEnd = sOutput.size();
    }
    if (iEnd > iStart) {
      vPaths.emplace_back(sOutput, iStart, iEnd - iStart);
    }
    iStart = iEnd + 1;
  }
  return vPaths;
}

ProcessResult GitCliGateway::git(const common::RepositoryRef& rrRepo,
                                 const std::vector<std::string>& vArgs,
                                 const std::vector<std::string>& vExtraEnv) {
  std::vector<std::string> vArgv;
  vArgv.reserve(vArgs.size() + 1);
  vArgv.push_back(rrRepo.sExecutable);
  vArgv.insert(vArgv.end(), vArgs.begin(), vArgs.end());

  auto spLog = common::Logger::get();
  spLog->trace("[{}] {}", rrRepo.sPath, ProcessRunner::describe(vArgv));

  auto pres = ProcessRunner::run(vArgv, rrRepo.sPath, vExtraEnv);
  if (!pres.ok()) {
    spLog->trace("[{}] exit {}: {}", rrRepo.sPath, pres.iExitCode, pres.combinedOutput());
  }
  return pres;
}

ProcessResult GitCliGateway::gitChecked(const common::RepositoryRef& rrRepo,
                                        const std::vector<std::string>& vArgs) {
  auto pres = git(rrRepo, vArgs);
  if (!pres.ok()) {
    throw common::ToolInvocationError(
        "git_failed",
        "git " + ProcessRunner::describe(vArgs) + " failed in " + rrRepo.sPath + " (exit " +
            std::to_string(pres.iExitCode) + "): " + pres.combinedOutput(),
        pres.iExitCode, pres.combinedOutput());
  }
  return pres;
}

void GitCliGateway::requireRepository(const common::RepositoryRef& rrRepo) {
  if (!isRepository(rrRepo)) {
    throw common::NotARepositoryError("not_a_repository",
                                      "Not a git repository: " + rrRepo.sPath);
  }
}

std::optional<std::string> GitCliGateway::verifyRevision(const common::RepositoryRef& rrRepo,
                                                         const std::string& sRevision) {
  auto pres = git(rrRepo, {"rev-parse", "--verify", "--quiet", sRevision + "^{commit}"});
  if (pres.iExitCode == 1) {
    return std::nullopt;
  }
  if (!pres.ok()) {
    throw common::ToolInvocationError(
        "git_failed", "git rev-parse " + sRevision + " failed: " + pres.combinedOutput(),
        pres.iExitCode, pres.combinedOutput());
  }
  return firstLine(pres.sStdout);
}

bool GitCliGateway::isRepository(const common::RepositoryRef& rrRepo) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path(rrRepo.sPath) / ".git", ec);
}

std::string GitCliGateway::currentBranch(const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  auto pres = gitChecked(rrRepo, {"branch", "--show-current"});
  return firstLine(pres.sStdout);
}

bool GitCliGateway::branchExists(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                                 common::BranchScope scope) {
  const std::string sRef = scope == common::BranchScope::Local
                               ? "refs/heads/" + sBranch
                               : "refs/remotes/" + _sRemoteName + "/" + sBranch;
  auto pres = git(rrRepo, {"show-ref", "--verify", "--quiet", sRef});
  if (pres.ok()) {
    return true;
  }
  if (pres.iExitCode == 1) {
    return false;
  }
  throw common::ToolInvocationError(
      "git_failed", "git show-ref " + sRef + " failed: " + pres.combinedOutput(),
      pres.iExitCode, pres.combinedOutput());
}

void GitCliGateway::createBranch(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                                 bool bFromRemote) {
  std::vector<std::string> vArgs{"checkout", "-b", sBranch};
  if (bFromRemote) {
    vArgs.push_back(_sRemoteName + "/" + sBranch);
  }
  auto pres = git(rrRepo, vArgs);
  if (!pres.ok()) {
    throw common::CheckoutConflictError(
        "branch_create_failed", "Cannot create branch '" + sBranch + "'" +
                                    (bFromRemote ? " from " + _sRemoteName : std::string{}) +
                                    " in " + rrRepo.sPath + ": " + pres.combinedOutput());
  }
}

void GitCliGateway::checkout(const common::RepositoryRef& rrRepo, const std::string& sBranch) {
  auto pres = git(rrRepo, {"checkout", sBranch});
  if (!pres.ok()) {
    throw common::CheckoutConflictError(
        "checkout_failed", "Cannot check out '" + sBranch + "' in " + rrRepo.sPath + ": " +
                               pres.combinedOutput());
  }
}

std::vector<std::string> GitCliGateway::changedPathsSincePrevious(
    const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  auto pres = git(rrRepo, {"diff", "--name-only", "-z", "HEAD^", "--"});
  if (!pres.ok()) {
    // No previous revision yet: fall back to what is staged
    common::Logger::get()->debug("[{}] no previous revision, diffing the staged tree",
                                 rrRepo.sPath);
    pres = gitChecked(rrRepo, {"diff", "--name-only", "-z", "--cached"});
  }
  return splitNulList(pres.sStdout);
}

std::vector<std::string> GitCliGateway::untrackedPaths(const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  auto pres = gitChecked(rrRepo, {"ls-files", "--others", "--exclude-standard", "-z"});
  return splitNulList(pres.sStdout);
}

std::vector<std::string> GitCliGateway::stagedPaths(const common::RepositoryRef& rrRepo) {
  auto pres = gitChecked(rrRepo, {"diff", "--cached", "--name-only", "-z"});
  return splitNulList(pres.sStdout);
}

void GitCliGateway::stageAll(const common::RepositoryRef& rrRepo) {
  gitChecked(rrRepo, {"add", "-A"});
}

void GitCliGateway::stageModifiedOnly(const common::RepositoryRef& rrRepo) {
  gitChecked(rrRepo, {"add", "-u"});
}

std::optional<std::string> GitCliGateway::commit(const common::RepositoryRef& rrRepo,
                                                 const std::string& sMessage,
                                                 const std::optional<std::string>& oAuthor) {
  std::vector<std::string> vArgs{"commit", "-m", sMessage};
  if (oAuthor) {
    vArgs.push_back("--author");
    vArgs.push_back(*oAuthor);
  }

  // Exit 0 means the index matches HEAD; git's own message is localized
  auto presDiff = git(rrRepo, {"diff", "--cached", "--quiet"});
  if (presDiff.iExitCode == 0) {
    return std::nullopt;
  }
  if (presDiff.iExitCode != 1) {
    throw common::ToolInvocationError("git_failed",
                                      "git diff --cached failed in " + rrRepo.sPath + ": " +
                                          presDiff.combinedOutput(),
                                      presDiff.iExitCode, presDiff.combinedOutput());
  }

  auto pres = git(rrRepo, vArgs);
  if (!pres.ok()) {
    throw common::ToolInvocationError("commit_failed",
                                      "git commit failed in " + rrRepo.sPath + ": " +
                                          pres.combinedOutput(),
                                      pres.iExitCode, pres.combinedOutput());
  }
  return headCommit(rrRepo);
}

std::string GitCliGateway::fixupCommit(const common::RepositoryRef& rrRepo,
                                       const std::string& sBaseCommit,
                                       const std::string& sMessage,
                                       const std::optional<std::string>& oAuthor) {
  std::vector<std::string> vArgs{"commit", "--fixup", sBaseCommit, "-m", sMessage};
  if (oAuthor) {
    vArgs.push_back("--author");
    vArgs.push_back(*oAuthor);
  }

  auto pres = git(rrRepo, vArgs);
  if (!pres.ok()) {
    throw common::ToolInvocationError("fixup_commit_failed",
                                      "git commit --fixup " + sBaseCommit + " failed in " +
                                          rrRepo.sPath + ": " + pres.combinedOutput(),
                                      pres.iExitCode, pres.combinedOutput());
  }

  auto oHead = headCommit(rrRepo);
  if (!oHead) {
    throw common::ToolInvocationError("fixup_commit_failed",
                                      "HEAD missing after fixup commit in " + rrRepo.sPath);
  }
  return *oHead;
}

void GitCliGateway::autosquashRebase(const common::RepositoryRef& rrRepo,
                                     const std::string& sBaseCommit) {
  // The base itself must be inside the rebased range for its fixups to fold
  std::vector<std::string> vArgs{"rebase", "-i", "--autosquash"};
  if (auto oParent = verifyRevision(rrRepo, sBaseCommit + "^")) {
    vArgs.push_back(*oParent);
  } else {
    vArgs.push_back("--root");
  }

  auto pres = git(rrRepo, vArgs, {"GIT_SEQUENCE_EDITOR=true", "GIT_EDITOR=true"});
  if (pres.ok()) {
    return;
  }

  auto presAbort = git(rrRepo, {"rebase", "--abort"});
  if (!presAbort.ok()) {
    common::Logger::get()->warn("[{}] git rebase --abort failed: {}", rrRepo.sPath,
                                presAbort.combinedOutput());
  }
  throw common::RebaseConflictError("autosquash_failed",
                                    "Autosquash rebase onto " + sBaseCommit + " failed in " +
                                        rrRepo.sPath + ": " + pres.combinedOutput());
}

std::optional<std::string> GitCliGateway::revisionBefore(const common::RepositoryRef& rrRepo,
                                                         int iCount) {
  requireRepository(rrRepo);
  return verifyRevision(rrRepo, "HEAD~" + std::to_string(iCount));
}

std::optional<std::string> GitCliGateway::headCommit(const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  return verifyRevision(rrRepo, "HEAD");
}

bool GitCliGateway::hasUncommittedChanges(const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  auto pres = gitChecked(rrRepo, {"status", "--porcelain"});
  return pres.sStdout.find_first_not_of(" \t\r\n") != std::string::npos;
}

bool GitCliGateway::hasTrackedChanges(const common::RepositoryRef& rrRepo) {
  requireRepository(rrRepo);
  auto pres = gitChecked(rrRepo, {"status", "--porcelain", "--untracked-files=no"});
  return pres.sStdout.find_first_not_of(" \t\r\n") != std::string::npos;
}

bool GitCliGateway::hasPaused(const common::RepositoryRef& rrRepo,
                              const std::string& sLockFileName) {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path(rrRepo.sPath) / sLockFileName, ec);
}

}  // namespace mirror::gitops
