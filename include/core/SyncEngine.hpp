#pragma once

#include "common/Types.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

class BranchResolver;
class ChangeApplier;
class ChangeSetDetector;
class CommitGenerator;

/// Result of one sync pass.
/// Class abbreviation: sr
struct SyncResult {
  common::BranchResolution brBranch;
  common::ChangeSet csChanges;
  bool bDryRun = false;
};

/// One source → mirror propagation pass:
/// resolve branch → detect changes → apply → commit.
/// Class abbreviation: se
class SyncEngine {
 public:
  SyncEngine(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
             common::RepositoryRef rrMirror, BranchResolver& bresResolver,
             ChangeSetDetector& csdDetector, ChangeApplier& caApplier,
             CommitGenerator& cgGenerator);
  ~SyncEngine();

  /// Throws on any failure; an empty change set returns without mutating
  /// the mirror. With bDryRun only read-only queries run.
  SyncResult run(bool bDryRun = false);

 private:
  gitops::IRepositoryGateway& _gwGateway;
  common::RepositoryRef _rrSource;
  common::RepositoryRef _rrMirror;
  BranchResolver& _bresResolver;
  ChangeSetDetector& _csdDetector;
  ChangeApplier& _caApplier;
  CommitGenerator& _cgGenerator;
};

}  // namespace mirror::core
