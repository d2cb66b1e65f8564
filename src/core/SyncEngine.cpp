#include "core/SyncEngine.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BranchResolver.hpp"
#include "core/ChangeApplier.hpp"
#include "core/ChangeSetDetector.hpp"
#include "core/CommitGenerator.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <utility>

namespace mirror::core {

SyncEngine::SyncEngine(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
                       common::RepositoryRef rrMirror, BranchResolver& bresResolver,
                       ChangeSetDetector& csdDetector, ChangeApplier& caApplier,
                       CommitGenerator& cgGenerator)
    : _gwGateway(gwGateway),
      _rrSource(std::move(rrSource)),
      _rrMirror(std::move(rrMirror)),
      _bresResolver(bresResolver),
      _csdDetector(csdDetector),
      _caApplier(caApplier),
      _cgGenerator(cgGenerator) {}

SyncEngine::~SyncEngine() = default;

SyncResult SyncEngine::run(bool bDryRun) {
  for (const auto* pRepo : {&_rrSource, &_rrMirror}) {
    if (!_gwGateway.isRepository(*pRepo)) {
      throw common::NotARepositoryError("not_a_repository",
                                        "Not a git repository: " + pRepo->sPath);
    }
  }

  SyncResult srResult;
  srResult.bDryRun = bDryRun;
  srResult.brBranch = _bresResolver.resolve(bDryRun);
  srResult.csChanges = _csdDetector.detect();

  if (srResult.csChanges.empty()) {
    return srResult;
  }

  if (bDryRun) {
    auto spLog = common::Logger::get();
    for (const auto& sPath : srResult.csChanges.vAdded) spLog->info("[dry-run] + {}", sPath);
    for (const auto& sPath : srResult.csChanges.vModified) spLog->info("[dry-run] ~ {}", sPath);
    for (const auto& sPath : srResult.csChanges.vDeleted) spLog->info("[dry-run] - {}", sPath);
    return srResult;
  }

  _caApplier.apply(srResult.csChanges);
  _cgGenerator.commit(srResult.csChanges);
  return srResult;
}

}  // namespace mirror::core
