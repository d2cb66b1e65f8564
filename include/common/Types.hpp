#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mirror::common {

/// A repository on disk and the git executable used to drive it.
/// Class abbreviation: rr
struct RepositoryRef {
  std::string sPath;
  std::string sExecutable = "git";
};

/// Which ref namespace a branch lookup searches.
enum class BranchScope { Local, Remote };

/// Extension and glob policy deciding which paths propagate.
/// Class abbreviation: ir
struct InclusionRule {
  std::vector<std::string> vExtensions;
  std::vector<std::string> vIncludeGlobs;
  std::vector<std::string> vExcludeGlobs;
};

/// Added/modified/deleted classification for one sync cycle.
/// A path appears in at most one of the three sequences.
/// Class abbreviation: cs
struct ChangeSet {
  std::vector<std::string> vAdded;
  std::vector<std::string> vModified;
  std::vector<std::string> vDeleted;
  std::optional<std::string> oResultingCommit;

  bool empty() const { return vAdded.empty() && vModified.empty() && vDeleted.empty(); }
  std::size_t total() const { return vAdded.size() + vModified.size() + vDeleted.size(); }
};

/// What BranchResolver did (or would do in dry-run) to align the mirror.
enum class BranchAction { AlreadyAligned, CheckedOutLocal, CreatedFromRemote, CreatedNew };

/// Class abbreviation: br
struct BranchResolution {
  std::string sBranch;
  BranchAction action = BranchAction::AlreadyAligned;
  bool bApplied = false;
};

/// Result of one fixup cycle.
/// Class abbreviation: fo
struct FixupOutcome {
  std::string sBaseCommit;
  std::optional<std::string> oFixupCommit;
  int iFilesModified = 0;
  bool bSucceeded = false;
  bool bSquashed = false;
  std::string sFailure;
};

/// Pass kinds driven by CycleScheduler.
enum class PassKind { Sync, Fixup };

/// Terminal state of one pass.
enum class PassStatus { Completed, NoChanges, Paused, DryRun, Skipped, Failed };

/// Everything a pass hands to the logger.
/// Class abbreviation: rpt
struct PassReport {
  PassKind kind = PassKind::Sync;
  PassStatus status = PassStatus::NoChanges;
  std::string sSummary;
  nlohmann::json jDetail;
};

const char* toString(BranchAction action);
const char* toString(PassKind kind);
const char* toString(PassStatus status);

nlohmann::json toJson(const ChangeSet& csChanges);
nlohmann::json toJson(const BranchResolution& brResolution);
nlohmann::json toJson(const FixupOutcome& foOutcome);

}  // namespace mirror::common
