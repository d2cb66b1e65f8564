#include "core/BranchResolver.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <utility>

namespace mirror::core {

BranchResolver::BranchResolver(gitops::IRepositoryGateway& gwGateway,
                               common::RepositoryRef rrSource, common::RepositoryRef rrMirror)
    : _gwGateway(gwGateway), _rrSource(std::move(rrSource)), _rrMirror(std::move(rrMirror)) {}

BranchResolver::~BranchResolver() = default;

common::BranchResolution BranchResolver::resolve(bool bDryRun) {
  auto spLog = common::Logger::get();

  const std::string sSourceBranch = _gwGateway.currentBranch(_rrSource);
  if (sSourceBranch.empty()) {
    throw common::BranchResolutionError(
        "source_branch_unresolvable",
        "Source repository has no current branch (detached HEAD): " + _rrSource.sPath);
  }
  if (sSourceBranch.front() == '-') {
    throw common::BranchResolutionError("source_branch_invalid",
                                        "Refusing branch name '" + sSourceBranch + "'");
  }

  common::BranchResolution brResult;
  brResult.sBranch = sSourceBranch;

  const std::string sMirrorBranch = _gwGateway.currentBranch(_rrMirror);
  if (sMirrorBranch == sSourceBranch) {
    brResult.action = common::BranchAction::AlreadyAligned;
    brResult.bApplied = true;
    return brResult;
  }

  if (_gwGateway.branchExists(_rrMirror, sSourceBranch, common::BranchScope::Local)) {
    brResult.action = common::BranchAction::CheckedOutLocal;
  } else if (_gwGateway.branchExists(_rrMirror, sSourceBranch, common::BranchScope::Remote)) {
    brResult.action = common::BranchAction::CreatedFromRemote;
  } else {
    brResult.action = common::BranchAction::CreatedNew;
  }

  if (bDryRun) {
    spLog->info("[dry-run] mirror would switch '{}' -> '{}' ({})", sMirrorBranch, sSourceBranch,
                common::toString(brResult.action));
    return brResult;
  }

  switch (brResult.action) {
    case common::BranchAction::CheckedOutLocal:
      _gwGateway.checkout(_rrMirror, sSourceBranch);
      break;
    case common::BranchAction::CreatedFromRemote:
      _gwGateway.createBranch(_rrMirror, sSourceBranch, true);
      break;
    case common::BranchAction::CreatedNew:
      // Name match only: the new branch starts from whatever the mirror has
      _gwGateway.createBranch(_rrMirror, sSourceBranch, false);
      break;
    case common::BranchAction::AlreadyAligned:
      break;
  }

  brResult.bApplied = true;
  spLog->info("Mirror switched '{}' -> '{}' ({})", sMirrorBranch, sSourceBranch,
              common::toString(brResult.action));
  return brResult;
}

}  // namespace mirror::core
