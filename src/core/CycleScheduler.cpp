#include "core/CycleScheduler.hpp"

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <utility>

namespace mirror::core {

namespace {

std::string shortHash(const std::string& sHash) { return sHash.substr(0, 8); }

std::string changeCounts(const common::ChangeSet& csChanges) {
  return "+" + std::to_string(csChanges.vAdded.size()) + " ~" +
         std::to_string(csChanges.vModified.size()) + " -" +
         std::to_string(csChanges.vDeleted.size());
}

}  // namespace

CycleScheduler::CycleScheduler(gitops::IRepositoryGateway& gwGateway,
                               common::RepositoryRef rrSource, SchedulerSettings ssSettings,
                               SyncPass fnSync, FixupPass fnFixup)
    : _gwGateway(gwGateway),
      _rrSource(std::move(rrSource)),
      _ssSettings(std::move(ssSettings)),
      _fnSync(std::move(fnSync)),
      _fnFixup(std::move(fnFixup)) {}

CycleScheduler::~CycleScheduler() {
  stop();
}

void CycleScheduler::onReport(ReportHandler fnHandler) {
  _fnReport = std::move(fnHandler);
}

common::PassReport CycleScheduler::runSyncPass() {
  return runGuarded(common::PassKind::Sync, _mtxSyncPass, [this]() { return executeSync(); });
}

common::PassReport CycleScheduler::runFixupPass() {
  return runGuarded(common::PassKind::Fixup, _mtxFixupPass, [this]() { return executeFixup(); });
}

common::PassReport CycleScheduler::runGuarded(common::PassKind kind, std::mutex& mtxKind,
                                              const std::function<common::PassReport()>& fnBody) {
  common::PassReport rptReport;
  rptReport.kind = kind;

  std::unique_lock<std::mutex> lockKind(mtxKind, std::try_to_lock);
  if (!lockKind.owns_lock()) {
    rptReport.status = common::PassStatus::Skipped;
    rptReport.sSummary = "previous pass still running";
    publish(rptReport);
    return rptReport;
  }

  try {
    if (_gwGateway.hasPaused(_rrSource, _ssSettings.sPauseLockFile)) {
      rptReport.status = common::PassStatus::Paused;
      rptReport.sSummary = "paused by " + _ssSettings.sPauseLockFile;
      publish(rptReport);
      return rptReport;
    }

    std::lock_guard<std::mutex> lockMirror(_mtxMirror);
    rptReport = fnBody();
  } catch (const common::AppError& ex) {
    rptReport = common::PassReport{};
    rptReport.kind = kind;
    rptReport.status = common::PassStatus::Failed;
    rptReport.sSummary = ex._sErrorCode + ": " + ex.what();
    rptReport.jDetail = {{"error_kind", common::toString(ex._ekKind)},
                         {"error_code", ex._sErrorCode},
                         {"message", ex.what()}};
  } catch (const std::exception& ex) {
    rptReport = common::PassReport{};
    rptReport.kind = kind;
    rptReport.status = common::PassStatus::Failed;
    rptReport.sSummary = std::string("unexpected error: ") + ex.what();
    rptReport.jDetail = {{"error_code", "unexpected"}, {"message", ex.what()}};
  }

  publish(rptReport);
  return rptReport;
}

common::PassReport CycleScheduler::executeSync() {
  const SyncResult srResult = _fnSync(_ssSettings.bDryRun);

  common::PassReport rptReport;
  rptReport.kind = common::PassKind::Sync;
  rptReport.jDetail = {{"branch", common::toJson(srResult.brBranch)},
                       {"changes", common::toJson(srResult.csChanges)},
                       {"dry_run", srResult.bDryRun}};

  const std::string sBranch = srResult.brBranch.sBranch;
  if (srResult.csChanges.empty()) {
    rptReport.status = common::PassStatus::NoChanges;
    rptReport.sSummary = "no changes on '" + sBranch + "'";
  } else if (srResult.bDryRun) {
    rptReport.status = common::PassStatus::DryRun;
    rptReport.sSummary = "would apply " + changeCounts(srResult.csChanges) + " on '" + sBranch + "'";
  } else if (!srResult.csChanges.oResultingCommit) {
    rptReport.status = common::PassStatus::NoChanges;
    rptReport.sSummary = "mirror already up to date on '" + sBranch + "'";
  } else {
    rptReport.status = common::PassStatus::Completed;
    rptReport.sSummary = changeCounts(srResult.csChanges) + " committed as " +
                         shortHash(*srResult.csChanges.oResultingCommit) + " on '" + sBranch + "'";
  }
  return rptReport;
}

common::PassReport CycleScheduler::executeFixup() {
  const common::FixupOutcome foOutcome = _fnFixup(_ssSettings.bDryRun);

  common::PassReport rptReport;
  rptReport.kind = common::PassKind::Fixup;
  rptReport.jDetail = common::toJson(foOutcome);

  if (!foOutcome.bSucceeded) {
    rptReport.status = common::PassStatus::Failed;
    rptReport.sSummary = foOutcome.sFailure;
    if (foOutcome.oFixupCommit) {
      rptReport.sSummary += " (fixup " + shortHash(*foOutcome.oFixupCommit) + " left unsquashed)";
    }
  } else if (_ssSettings.bDryRun && !foOutcome.sBaseCommit.empty()) {
    rptReport.status = common::PassStatus::DryRun;
    rptReport.sSummary = "would create a fixup for " + shortHash(foOutcome.sBaseCommit);
  } else if (!foOutcome.oFixupCommit) {
    rptReport.status = common::PassStatus::NoChanges;
    rptReport.sSummary = "no uncommitted changes";
  } else {
    rptReport.status = common::PassStatus::Completed;
    rptReport.sSummary = std::to_string(foOutcome.iFilesModified) + " files fixed up into " +
                         shortHash(foOutcome.sBaseCommit) +
                         (foOutcome.bSquashed ? " (squashed)"
                                              : " as " + shortHash(*foOutcome.oFixupCommit));
  }
  return rptReport;
}

void CycleScheduler::publish(const common::PassReport& rptReport) {
  auto spLog = common::Logger::get();
  if (rptReport.status == common::PassStatus::Failed) {
    spLog->error("{} pass failed: {}", common::toString(rptReport.kind), rptReport.sSummary);
  } else {
    spLog->info("{} pass {}: {}", common::toString(rptReport.kind),
                common::toString(rptReport.status), rptReport.sSummary);
  }
  if (!rptReport.jDetail.is_null()) {
    spLog->debug("{} detail: {}", common::toString(rptReport.kind), rptReport.jDetail.dump());
  }

  if (_fnReport) {
    try {
      _fnReport(rptReport);
    } catch (const std::exception& ex) {
      spLog->warn("Report handler threw: {}", ex.what());
    }
  }
}

void CycleScheduler::timerLoop(std::stop_token stToken, common::PassKind kind,
                               std::chrono::milliseconds durInterval) {
  while (!stToken.stop_requested()) {
    if (kind == common::PassKind::Sync) {
      runSyncPass();
    } else {
      runFixupPass();
    }

    // Sleep one interval, or until stop is requested
    std::unique_lock<std::mutex> lock(_mtx);
    _cv.wait_for(lock, stToken, durInterval, []() { return false; });
  }
}

void CycleScheduler::start() {
  std::lock_guard<std::mutex> lock(_mtx);
  if (_bRunning) return;
  _bRunning = true;

  common::Logger::get()->info("Scheduler started (sync every {}, fixup every {}{})",
                              common::Config::formatDuration(_ssSettings.durSyncInterval),
                              common::Config::formatDuration(_ssSettings.durFixupInterval),
                              _ssSettings.bDryRun ? ", dry-run" : "");

  _thSync = std::jthread([this](std::stop_token stToken) {
    timerLoop(stToken, common::PassKind::Sync, _ssSettings.durSyncInterval);
  });
  _thFixup = std::jthread([this](std::stop_token stToken) {
    timerLoop(stToken, common::PassKind::Fixup, _ssSettings.durFixupInterval);
  });
}

void CycleScheduler::stop() {
  {
    std::lock_guard<std::mutex> lock(_mtx);
    if (!_bRunning) return;
    _bRunning = false;
  }

  _thSync.request_stop();
  _thFixup.request_stop();
  _cv.notify_all();

  if (_thSync.joinable()) {
    _thSync.join();
  }
  if (_thFixup.joinable()) {
    _thFixup.join();
  }
  common::Logger::get()->info("Scheduler stopped");
}

bool CycleScheduler::isRunning() const {
  std::lock_guard<std::mutex> lock(_mtx);
  return _bRunning;
}

}  // namespace mirror::core
