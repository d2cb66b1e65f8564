#include "common/Types.hpp"

namespace mirror::common {

const char* toString(BranchAction action) {
  switch (action) {
    case BranchAction::AlreadyAligned:
      return "already_aligned";
    case BranchAction::CheckedOutLocal:
      return "checked_out_local";
    case BranchAction::CreatedFromRemote:
      return "created_from_remote";
    case BranchAction::CreatedNew:
      return "created_new";
  }
  return "unknown";
}

const char* toString(PassKind kind) {
  return kind == PassKind::Sync ? "sync" : "fixup";
}

const char* toString(PassStatus status) {
  switch (status) {
    case PassStatus::Completed:
      return "completed";
    case PassStatus::NoChanges:
      return "no_changes";
    case PassStatus::Paused:
      return "paused";
    case PassStatus::DryRun:
      return "dry_run";
    case PassStatus::Skipped:
      return "skipped";
    case PassStatus::Failed:
      return "failed";
  }
  return "unknown";
}

nlohmann::json toJson(const ChangeSet& csChanges) {
  nlohmann::json j = {{"added", csChanges.vAdded},
                      {"modified", csChanges.vModified},
                      {"deleted", csChanges.vDeleted}};
  if (csChanges.oResultingCommit) {
    j["commit"] = *csChanges.oResultingCommit;
  } else {
    j["commit"] = nullptr;
  }
  return j;
}

nlohmann::json toJson(const BranchResolution& brResolution) {
  return {{"branch", brResolution.sBranch},
          {"action", toString(brResolution.action)},
          {"applied", brResolution.bApplied}};
}

nlohmann::json toJson(const FixupOutcome& foOutcome) {
  nlohmann::json j = {{"base_commit", foOutcome.sBaseCommit},
                      {"files_modified", foOutcome.iFilesModified},
                      {"succeeded", foOutcome.bSucceeded},
                      {"squashed", foOutcome.bSquashed}};
  j["fixup_commit"] = foOutcome.oFixupCommit ? nlohmann::json(*foOutcome.oFixupCommit)
                                             : nlohmann::json(nullptr);
  if (!foOutcome.sFailure.empty()) {
    j["failure"] = foOutcome.sFailure;
  }
  return j;
}

}  // namespace mirror::common
