#include <csignal>
#include <cstdlib>
#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include <pthread.h>

#include <spdlog/fmt/ranges.h>

#include "common/Config.hpp"
#include "common/Errors.hpp"
#include "common/Logger.hpp"
#include "core/BranchResolver.hpp"
#include "core/ChangeApplier.hpp"
#include "core/ChangeSetDetector.hpp"
#include "core/CommitGenerator.hpp"
#include "core/CycleScheduler.hpp"
#include "core/FixupCommitter.hpp"
#include "core/SyncEngine.hpp"
#include "gitops/GitCliGateway.hpp"

namespace {

struct CliOptions {
  std::string sCommand;
  bool bDryRun = false;
  bool bVerbose = false;
  bool bJson = false;
};

void printUsage(std::ostream& os) {
  os << "Usage: mirror-sync <command> [--dry-run] [--verbose] [--json]\n"
        "\n"
        "Commands:\n"
        "  sync             Run one source -> mirror propagation pass\n"
        "  fixup            Run one fixup pass on the mirror\n"
        "  run              Run both passes on their intervals until SIGINT/SIGTERM\n"
        "  validate-config  Load and validate configuration, then exit\n"
        "\n"
        "Configuration comes from MIRROR_* environment variables and the JSON\n"
        "file named by MIRROR_CONFIG_FILE.\n";
}

CliOptions parseArgs(int argc, char** argv) {
  CliOptions coOptions;
  for (int i = 1; i < argc; ++i) {
    const std::string sArg = argv[i];
    if (sArg == "--dry-run") {
      coOptions.bDryRun = true;
    } else if (sArg == "--verbose" || sArg == "-v") {
      coOptions.bVerbose = true;
    } else if (sArg == "--json") {
      coOptions.bJson = true;
    } else if (sArg == "--help" || sArg == "-h") {
      coOptions.sCommand = "help";
    } else if (!sArg.empty() && sArg[0] == '-') {
      throw std::invalid_argument("Unknown option: " + sArg);
    } else if (coOptions.sCommand.empty()) {
      coOptions.sCommand = sArg;
    } else {
      throw std::invalid_argument("Unexpected argument: " + sArg);
    }
  }
  return coOptions;
}

int exitCodeFor(const mirror::common::PassReport& rptReport) {
  return rptReport.status == mirror::common::PassStatus::Failed ? EXIT_FAILURE : EXIT_SUCCESS;
}

}  // namespace

int main(int argc, char** argv) {
  CliOptions coOptions;
  try {
    coOptions = parseArgs(argc, argv);
  } catch (const std::invalid_argument& ex) {
    std::cerr << ex.what() << "\n\n";
    printUsage(std::cerr);
    return EXIT_FAILURE;
  }
  if (coOptions.sCommand.empty() || coOptions.sCommand == "help") {
    printUsage(coOptions.sCommand.empty() ? std::cerr : std::cout);
    return coOptions.sCommand.empty() ? EXIT_FAILURE : EXIT_SUCCESS;
  }
  if (coOptions.sCommand != "sync" && coOptions.sCommand != "fixup" &&
      coOptions.sCommand != "run" && coOptions.sCommand != "validate-config") {
    std::cerr << "Unknown command: " << coOptions.sCommand << "\n\n";
    printUsage(std::cerr);
    return EXIT_FAILURE;
  }

  try {
    // ── Step 1: Load and validate configuration ──────────────────────────
    auto cfgApp = mirror::common::Config::load();
    if (coOptions.bDryRun) {
      cfgApp.bDryRun = true;
    }
    if (coOptions.bVerbose) {
      cfgApp.sLogLevel = "debug";
    }

    mirror::common::Logger::init(cfgApp.sLogLevel, cfgApp.oLogFilePath.value_or(""));
    auto spLog = mirror::common::Logger::get();
    spLog->info("Step 1: Configuration loaded (source={}, mirror={}{})", cfgApp.sSourceRepoPath,
                cfgApp.sMirrorRepoPath, cfgApp.bDryRun ? ", dry-run" : "");

    if (coOptions.sCommand == "validate-config") {
      spLog->info("Configuration is valid");
      spLog->info("  git executable : {} (remote '{}')", cfgApp.sGitExecutable, cfgApp.sRemoteName);
      spLog->info("  extensions     : {}", fmt::join(cfgApp.vIncludeExtensions, ", "));
      spLog->info("  include globs  : {}", fmt::join(cfgApp.vIncludePatterns, ", "));
      spLog->info("  exclude globs  : {}", fmt::join(cfgApp.vExcludePatterns, ", "));
      spLog->info("  sync interval  : {}", mirror::common::Config::formatDuration(cfgApp.durSyncInterval));
      spLog->info("  fixup interval : {} (autosquash {})",
                  mirror::common::Config::formatDuration(cfgApp.durFixupInterval),
                  cfgApp.bAutosquashEnabled ? "on" : "off");
      spLog->info("  pause lock     : {}", cfgApp.sPauseLockFile);
      spLog->info("  commit template: {}", cfgApp.sCommitTemplate);
      return EXIT_SUCCESS;
    }

    // ── Step 2: Repository gateway ───────────────────────────────────────
    auto upGateway = std::make_unique<mirror::gitops::GitCliGateway>(cfgApp.sRemoteName);
    const auto rrSource = cfgApp.sourceRef();
    const auto rrMirror = cfgApp.mirrorRef();
    spLog->info("Step 2: Git gateway ready (executable={}, remote={})", cfgApp.sGitExecutable,
                cfgApp.sRemoteName);

    // ── Step 3: Sync and fixup components ────────────────────────────────
    auto upResolver = std::make_unique<mirror::core::BranchResolver>(*upGateway, rrSource, rrMirror);
    auto upDetector = std::make_unique<mirror::core::ChangeSetDetector>(
        *upGateway, rrSource, rrMirror, cfgApp.inclusionRule());
    auto upApplier = std::make_unique<mirror::core::ChangeApplier>(rrSource, rrMirror);
    auto upGenerator = std::make_unique<mirror::core::CommitGenerator>(
        *upGateway, rrSource, rrMirror, cfgApp.sCommitTemplate, cfgApp.authorIdentity());
    auto upEngine = std::make_unique<mirror::core::SyncEngine>(
        *upGateway, rrSource, rrMirror, *upResolver, *upDetector, *upApplier, *upGenerator);

    mirror::core::FixupSettings fsSettings;
    fsSettings.sMessagePrefix = cfgApp.sFixupMessagePrefix;
    fsSettings.bAutosquash = cfgApp.bAutosquashEnabled;
    fsSettings.oAuthor = cfgApp.authorIdentity();
    auto upFixup = std::make_unique<mirror::core::FixupCommitter>(*upGateway, *upResolver,
                                                                  rrMirror, fsSettings);
    spLog->info("Step 3: Sync and fixup components constructed");

    // ── Step 4: Scheduler ────────────────────────────────────────────────
    mirror::core::SchedulerSettings ssSettings;
    ssSettings.durSyncInterval = cfgApp.durSyncInterval;
    ssSettings.durFixupInterval = cfgApp.durFixupInterval;
    ssSettings.sPauseLockFile = cfgApp.sPauseLockFile;
    ssSettings.bDryRun = cfgApp.bDryRun;

    auto upScheduler = std::make_unique<mirror::core::CycleScheduler>(
        *upGateway, rrSource, ssSettings,
        [&upEngine](bool bDryRun) { return upEngine->run(bDryRun); },
        [&upFixup](bool bDryRun) { return upFixup->run(bDryRun); });

    if (coOptions.bJson) {
      upScheduler->onReport([](const mirror::common::PassReport& rptReport) {
        nlohmann::json jReport = {{"kind", mirror::common::toString(rptReport.kind)},
                                  {"status", mirror::common::toString(rptReport.status)},
                                  {"summary", rptReport.sSummary},
                                  {"detail", rptReport.jDetail}};
        std::cout << jReport.dump() << std::endl;
      });
    }
    spLog->info("Step 4: Scheduler ready");

    if (coOptions.sCommand == "sync") {
      return exitCodeFor(upScheduler->runSyncPass());
    }
    if (coOptions.sCommand == "fixup") {
      return exitCodeFor(upScheduler->runFixupPass());
    }

    // ── Step 5: Run until signalled ──────────────────────────────────────
    // Block the signals before the timer threads exist so they inherit the mask
    sigset_t sigsetStop;
    sigemptyset(&sigsetStop);
    sigaddset(&sigsetStop, SIGINT);
    sigaddset(&sigsetStop, SIGTERM);
    pthread_sigmask(SIG_BLOCK, &sigsetStop, nullptr);

    upScheduler->start();
    spLog->info("Step 5: mirror-sync running (Ctrl-C to stop)");

    int iSignal = 0;
    sigwait(&sigsetStop, &iSignal);
    spLog->info("Received signal {}, shutting down", iSignal);

    upScheduler->stop();
    spLog->info("mirror-sync stopped");
    return EXIT_SUCCESS;
  } catch (const mirror::common::ConfigurationError& ex) {
    std::cerr << "[fatal] configuration error (" << ex._sErrorCode << "): " << ex.what()
              << std::endl;
    return EXIT_FAILURE;
  } catch (const std::exception& ex) {
    std::cerr << "[fatal] " << ex.what() << std::endl;
    return EXIT_FAILURE;
  }
}
