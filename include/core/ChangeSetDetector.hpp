#pragma once

#include <string>

#include "common/Types.hpp"
#include "core/PathFilter.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

/// Computes the ChangeSet to propagate from source to mirror this cycle.
/// Class abbreviation: csd
class ChangeSetDetector {
 public:
  ChangeSetDetector(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
                    common::RepositoryRef rrMirror, const common::InclusionRule& irRule);
  ~ChangeSetDetector();

  /// Classify the source's changed and untracked paths that pass the
  /// inclusion rule. Paths whose mirror copy already matches the source are
  /// left out. Order follows the gateway's query order. A gateway failure
  /// propagates and no partial ChangeSet is returned.
  common::ChangeSet detect();

 private:
  bool existsUnder(const std::string& sRoot, const std::string& sRelPath) const;
  bool sameContents(const std::string& sRelPath) const;
  void classifyPresent(const std::string& sPath, common::ChangeSet& csChanges) const;

  gitops::IRepositoryGateway& _gwGateway;
  common::RepositoryRef _rrSource;
  common::RepositoryRef _rrMirror;
  PathFilter _pfFilter;
};

}  // namespace mirror::core
