#pragma once

#include <chrono>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>

#include "common/Types.hpp"
#include "core/SyncEngine.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

/// Class abbreviation: ss
struct SchedulerSettings {
  std::chrono::milliseconds durSyncInterval = std::chrono::minutes(5);
  std::chrono::milliseconds durFixupInterval = std::chrono::hours(1);
  std::string sPauseLockFile = ".sync-paused";
  bool bDryRun = false;
};

/// Drives sync and fixup passes once or on two independent fixed-interval
/// timers. A tick whose kind is still running is skipped, never queued.
/// Passes of different kinds never overlap on the mirror.
/// Class abbreviation: cys
class CycleScheduler {
 public:
  using SyncPass = std::function<SyncResult(bool bDryRun)>;
  using FixupPass = std::function<common::FixupOutcome(bool bDryRun)>;
  using ReportHandler = std::function<void(const common::PassReport&)>;

  CycleScheduler(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
                 SchedulerSettings ssSettings, SyncPass fnSync, FixupPass fnFixup);
  ~CycleScheduler();

  /// Called after every pass, timer-driven or not. Set before start().
  void onReport(ReportHandler fnHandler);

  common::PassReport runSyncPass();
  common::PassReport runFixupPass();

  /// Start both timers. Each runs its pass immediately, then every interval.
  void start();

  /// Idempotent. A pass in progress runs to completion.
  void stop();

  bool isRunning() const;

 private:
  common::PassReport runGuarded(common::PassKind kind, std::mutex& mtxKind,
                                const std::function<common::PassReport()>& fnBody);
  common::PassReport executeSync();
  common::PassReport executeFixup();
  void timerLoop(std::stop_token stToken, common::PassKind kind,
                 std::chrono::milliseconds durInterval);
  void publish(const common::PassReport& rptReport);

  gitops::IRepositoryGateway& _gwGateway;
  common::RepositoryRef _rrSource;
  SchedulerSettings _ssSettings;
  SyncPass _fnSync;
  FixupPass _fnFixup;
  ReportHandler _fnReport;

  std::mutex _mtxSyncPass;
  std::mutex _mtxFixupPass;
  std::mutex _mtxMirror;

  std::jthread _thSync;
  std::jthread _thFixup;
  mutable std::mutex _mtx;
  std::condition_variable_any _cv;
  bool _bRunning = false;
};

}  // namespace mirror::core
