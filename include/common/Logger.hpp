#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace mirror::common {

/// Thin wrapper over spdlog for structured logging.
/// Uses spdlog's default logger to avoid static destruction order issues.
/// Class abbreviation: N/A (static interface)
///
/// Usage:
///   Logger::init("debug");
///   Logger::get()->info("Sync pass finished: {}", sSummary);
class Logger {
 public:
  /// Initialize the global logger with the given level string.
  /// Valid levels: "trace", "debug", "info", "warn", "error", "critical", "off"
  /// (case-insensitive). A non-empty sFilePath adds a file sink next to stdout.
  static void init(const std::string& sLevel, const std::string& sFilePath = {});

  /// Change the level of an initialized logger.
  static void setLevel(const std::string& sLevel);

  /// Get the shared spdlog logger instance.
  /// Returns spdlog's default logger (always valid).
  static std::shared_ptr<spdlog::logger> get();

  /// Map a level string to spdlog's enum. Throws std::invalid_argument on
  /// an unknown name.
  static spdlog::level::level_enum parseLevel(const std::string& sLevel);

 private:
  static bool _bInitialized;
};

}  // namespace mirror::common
