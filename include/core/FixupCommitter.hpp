#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

class BranchResolver;

/// Fixup pass settings taken from configuration.
/// Class abbreviation: fs
struct FixupSettings {
  std::string sMessagePrefix = "fixup! ";
  bool bAutosquash = true;
  std::optional<std::string> oAuthor;
};

/// Folds uncommitted mirror edits into history as a fixup commit.
/// Validate → resolve branch → check for edits → pick base (HEAD~1, else
/// HEAD) → stage tracked edits → fixup commit → optional autosquash.
/// Class abbreviation: fc
class FixupCommitter {
 public:
  FixupCommitter(gitops::IRepositoryGateway& gwGateway, BranchResolver& bresResolver,
                 common::RepositoryRef rrMirror, FixupSettings fsSettings);
  ~FixupCommitter();

  /// Run one fixup cycle. No uncommitted edits → filesModified == 0 and no
  /// commit. An autosquash failure keeps the fixup commit and returns an
  /// outcome with bSucceeded == false. Everything before the rebase throws.
  common::FixupOutcome run(bool bDryRun = false);

  /// prefix + "Automated fixup for <base[0..8)> @ <timestamp>"
  std::string buildMessage(const std::string& sBaseCommit,
                           std::chrono::system_clock::time_point tpNow) const;

 private:
  std::string resolveBaseCommit();

  gitops::IRepositoryGateway& _gwGateway;
  BranchResolver& _bresResolver;
  common::RepositoryRef _rrMirror;
  FixupSettings _fsSettings;
};

}  // namespace mirror::core
