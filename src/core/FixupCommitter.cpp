#include "core/FixupCommitter.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BranchResolver.hpp"
#include "core/MessageTemplate.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <utility>

namespace mirror::core {

FixupCommitter::FixupCommitter(gitops::IRepositoryGateway& gwGateway,
                               BranchResolver& bresResolver, common::RepositoryRef rrMirror,
                               FixupSettings fsSettings)
    : _gwGateway(gwGateway),
      _bresResolver(bresResolver),
      _rrMirror(std::move(rrMirror)),
      _fsSettings(std::move(fsSettings)) {}

FixupCommitter::~FixupCommitter() = default;

std::string FixupCommitter::buildMessage(const std::string& sBaseCommit,
                                         std::chrono::system_clock::time_point tpNow) const {
  std::string sMessage = _fsSettings.sMessagePrefix + "Automated fixup";
  if (!sBaseCommit.empty()) {
    sMessage += " for " + sBaseCommit.substr(0, 8);
  }
  sMessage += " @ " + MessageTemplate::formatTimestamp(tpNow);
  return sMessage;
}

std::string FixupCommitter::resolveBaseCommit() {
  if (auto oPrevious = _gwGateway.revisionBefore(_rrMirror, 1)) {
    return *oPrevious;
  }
  if (auto oHead = _gwGateway.headCommit(_rrMirror)) {
    return *oHead;
  }
  throw common::AppError(common::ErrorKind::RepositoryState, "no_base_commit",
                         "Mirror repository has no commits to fix up: " + _rrMirror.sPath);
}

common::FixupOutcome FixupCommitter::run(bool bDryRun) {
  auto spLog = common::Logger::get();

  if (!_gwGateway.isRepository(_rrMirror)) {
    throw common::NotARepositoryError("not_a_repository",
                                      "Mirror is not a git repository: " + _rrMirror.sPath);
  }

  _bresResolver.resolve(bDryRun);

  common::FixupOutcome foOutcome;
  if (!_gwGateway.hasUncommittedChanges(_rrMirror)) {
    foOutcome.bSucceeded = true;
    return foOutcome;
  }

  // A real run finds this out after staging, which a dry run must not do
  if (bDryRun && !_gwGateway.hasTrackedChanges(_rrMirror)) {
    spLog->info("[dry-run] mirror has only untracked changes; no fixup needed");
    foOutcome.bSucceeded = true;
    return foOutcome;
  }

  foOutcome.sBaseCommit = resolveBaseCommit();

  if (bDryRun) {
    spLog->info("[dry-run] would stage tracked edits and create a fixup commit for {}",
                foOutcome.sBaseCommit.substr(0, 8));
    foOutcome.bSucceeded = true;
    return foOutcome;
  }

  _gwGateway.stageModifiedOnly(_rrMirror);
  const auto vStaged = _gwGateway.stagedPaths(_rrMirror);
  if (vStaged.empty()) {
    // Only untracked files: nothing for a fixup to carry
    spLog->debug("Mirror has only untracked changes; no fixup needed");
    foOutcome.bSucceeded = true;
    return foOutcome;
  }
  foOutcome.iFilesModified = static_cast<int>(vStaged.size());

  foOutcome.oFixupCommit =
      _gwGateway.fixupCommit(_rrMirror, foOutcome.sBaseCommit,
                             buildMessage(foOutcome.sBaseCommit, std::chrono::system_clock::now()),
                             _fsSettings.oAuthor);

  if (_fsSettings.bAutosquash) {
    try {
      _gwGateway.autosquashRebase(_rrMirror, foOutcome.sBaseCommit);
      foOutcome.bSquashed = true;
    } catch (const common::AppError& ex) {
      // The fixup commit stays as valid, unsquashed history
      foOutcome.bSucceeded = false;
      foOutcome.sFailure = ex._sErrorCode + ": " + ex.what();
      return foOutcome;
    }
  }

  foOutcome.bSucceeded = true;
  return foOutcome;
}

}  // namespace mirror::core
