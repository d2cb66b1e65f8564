#pragma once

#include "common/Types.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

/// Keeps the mirror checked out on the same branch name as the source.
/// Class abbreviation: bres
class BranchResolver {
 public:
  BranchResolver(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
                 common::RepositoryRef rrMirror);
  ~BranchResolver();

  /// Align the mirror with the source's current branch:
  /// same name → nothing; local branch exists → checkout; remote tracking
  /// branch exists → create from remote; otherwise → create from mirror HEAD.
  /// With bDryRun the action is decided and reported but not executed.
  /// Throws BranchResolutionError when the source branch is detached or
  /// unusable, CheckoutConflictError when git refuses the switch.
  common::BranchResolution resolve(bool bDryRun = false);

 private:
  gitops::IRepositoryGateway& _gwGateway;
  common::RepositoryRef _rrSource;
  common::RepositoryRef _rrMirror;
};

}  // namespace mirror::core
