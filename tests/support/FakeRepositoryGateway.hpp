#pragma once

#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include "common/Errors.hpp"
#include "gitops/IRepositoryGateway.hpp"

namespace mirror::test {

/// Scripted state of one repository behind FakeRepositoryGateway.
struct FakeRepoState {
  bool bIsRepository = true;
  std::string sBranch = "main";
  std::set<std::string> setLocalBranches{"main"};
  std::set<std::string> setRemoteBranches;
  std::vector<std::string> vChanged;
  std::vector<std::string> vUntracked;
  std::vector<std::string> vStaged;
  std::optional<std::string> oHead = std::string("1111111122222222333333334444444455555555");
  std::optional<std::string> oPrevious = std::string("aaaaaaaabbbbbbbbccccccccddddddddeeeeeeee");
  bool bUncommitted = false;
  bool bPaused = false;
};

/// In-memory IRepositoryGateway. Records every verb as "verb:<repo path>"
/// and answers from FakeRepoState keyed by repository path. Verbs are
/// serialized so timer threads may share one instance.
class FakeRepositoryGateway : public gitops::IRepositoryGateway {
 public:
  FakeRepoState& repo(const std::string& sPath) { return _mRepos[sPath]; }

  /// Make the named verb throw ToolInvocationError (RebaseConflictError for
  /// autosquashRebase).
  void failOn(const std::string& sVerb) { _setFailing.insert(sVerb); }

  /// Answer commit() with "nothing to commit".
  void commitFindsNothing() { _bNothingToCommit = true; }

  const std::vector<std::string>& calls() const { return _vCalls; }

  bool called(const std::string& sVerb) const {
    for (const auto& sCall : _vCalls) {
      if (sCall.rfind(sVerb + ":", 0) == 0) return true;
    }
    return false;
  }

  /// Calls that change repository state.
  std::vector<std::string> mutatingCalls() const {
    static const std::set<std::string> setMutating{"createBranch", "checkout", "stageAll",
                                                   "stageModifiedOnly", "commit", "fixupCommit",
                                                   "autosquashRebase"};
    std::vector<std::string> vOut;
    for (const auto& sCall : _vCalls) {
      if (setMutating.count(sCall.substr(0, sCall.find(':'))) > 0) vOut.push_back(sCall);
    }
    return vOut;
  }

  std::string sLastMessage;
  std::optional<std::string> oLastAuthor;
  std::string sLastFixupBase;
  std::string sCommitHash = "c0ffee00c0ffee00c0ffee00c0ffee00c0ffee00";
  std::string sFixupHash = "f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1f1";

  bool isRepository(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("isRepository", rrRepo);
    return _mRepos[rrRepo.sPath].bIsRepository;
  }

  std::string currentBranch(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("currentBranch", rrRepo);
    return _mRepos[rrRepo.sPath].sBranch;
  }

  bool branchExists(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                    common::BranchScope scope) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("branchExists", rrRepo);
    const auto& frsRepo = _mRepos[rrRepo.sPath];
    const auto& setBranches =
        scope == common::BranchScope::Local ? frsRepo.setLocalBranches : frsRepo.setRemoteBranches;
    return setBranches.count(sBranch) > 0;
  }

  void createBranch(const common::RepositoryRef& rrRepo, const std::string& sBranch,
                    bool bFromRemote) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("createBranch", rrRepo);
    _bLastCreateFromRemote = bFromRemote;
    if (_setFailing.count("createBranch") > 0) {
      throw common::CheckoutConflictError("branch_create_failed", "scripted failure");
    }
    auto& frsRepo = _mRepos[rrRepo.sPath];
    frsRepo.setLocalBranches.insert(sBranch);
    frsRepo.sBranch = sBranch;
  }

  void checkout(const common::RepositoryRef& rrRepo, const std::string& sBranch) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("checkout", rrRepo);
    if (_setFailing.count("checkout") > 0) {
      throw common::CheckoutConflictError("checkout_failed", "scripted failure");
    }
    _mRepos[rrRepo.sPath].sBranch = sBranch;
  }

  std::vector<std::string> changedPathsSincePrevious(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("changedPathsSincePrevious", rrRepo);
    maybeFail("changedPathsSincePrevious");
    return _mRepos[rrRepo.sPath].vChanged;
  }

  std::vector<std::string> untrackedPaths(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("untrackedPaths", rrRepo);
    maybeFail("untrackedPaths");
    return _mRepos[rrRepo.sPath].vUntracked;
  }

  std::vector<std::string> stagedPaths(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("stagedPaths", rrRepo);
    return _mRepos[rrRepo.sPath].vStaged;
  }

  void stageAll(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("stageAll", rrRepo);
    maybeFail("stageAll");
  }

  void stageModifiedOnly(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("stageModifiedOnly", rrRepo);
    maybeFail("stageModifiedOnly");
  }

  std::optional<std::string> commit(const common::RepositoryRef& rrRepo,
                                    const std::string& sMessage,
                                    const std::optional<std::string>& oAuthor) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("commit", rrRepo);
    maybeFail("commit");
    sLastMessage = sMessage;
    oLastAuthor = oAuthor;
    if (_bNothingToCommit) {
      return std::nullopt;
    }
    return sCommitHash;
  }

  std::string fixupCommit(const common::RepositoryRef& rrRepo, const std::string& sBaseCommit,
                          const std::string& sMessage,
                          const std::optional<std::string>& oAuthor) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("fixupCommit", rrRepo);
    maybeFail("fixupCommit");
    sLastMessage = sMessage;
    oLastAuthor = oAuthor;
    sLastFixupBase = sBaseCommit;
    return sFixupHash;
  }

  void autosquashRebase(const common::RepositoryRef& rrRepo,
                        const std::string& sBaseCommit) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("autosquashRebase", rrRepo);
    if (_setFailing.count("autosquashRebase") > 0) {
      throw common::RebaseConflictError("autosquash_failed",
                                        "Autosquash onto " + sBaseCommit + " hit a conflict");
    }
  }

  std::optional<std::string> revisionBefore(const common::RepositoryRef& rrRepo,
                                            int /*iCount*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("revisionBefore", rrRepo);
    return _mRepos[rrRepo.sPath].oPrevious;
  }

  std::optional<std::string> headCommit(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("headCommit", rrRepo);
    return _mRepos[rrRepo.sPath].oHead;
  }

  bool hasUncommittedChanges(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("hasUncommittedChanges", rrRepo);
    return _mRepos[rrRepo.sPath].bUncommitted;
  }

  // Tracked edits are exactly what stageModifiedOnly would stage
  bool hasTrackedChanges(const common::RepositoryRef& rrRepo) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("hasTrackedChanges", rrRepo);
    const auto& frs = _mRepos[rrRepo.sPath];
    return frs.bUncommitted && !frs.vStaged.empty();
  }

  bool hasPaused(const common::RepositoryRef& rrRepo, const std::string& /*sLockFileName*/) override {
    std::lock_guard<std::mutex> lock(_mtx);
    record("hasPaused", rrRepo);
    return _mRepos[rrRepo.sPath].bPaused;
  }

  bool lastCreateFromRemote() const { return _bLastCreateFromRemote; }

 private:
  void record(const std::string& sVerb, const common::RepositoryRef& rrRepo) {
    _vCalls.push_back(sVerb + ":" + rrRepo.sPath);
  }

  void maybeFail(const std::string& sVerb) {
    if (_setFailing.count(sVerb) > 0) {
      throw common::ToolInvocationError("git_failed", sVerb + " failed (scripted)", 1);
    }
  }

  std::mutex _mtx;
  std::map<std::string, FakeRepoState> _mRepos;
  std::vector<std::string> _vCalls;
  std::set<std::string> _setFailing;
  bool _bNothingToCommit = false;
  bool _bLastCreateFromRemote = false;
};

}  // namespace mirror::test
