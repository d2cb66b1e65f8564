#pragma once

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "common/Types.hpp"

namespace mirror::common {

/// Configuration loader: optional JSON file named by MIRROR_CONFIG_FILE,
/// overridden field by field from MIRROR_* environment variables.
/// Class abbreviation: cfg
struct Config {
  // ── Repositories ──────────────────────────────────────────────────────
  std::string sSourceRepoPath;
  std::string sMirrorRepoPath;
  std::string sGitExecutable = "git";
  std::string sRemoteName = "origin";

  // ── Inclusion rule ────────────────────────────────────────────────────
  std::vector<std::string> vIncludeExtensions{".cpp", ".h", ".hpp"};
  std::vector<std::string> vIncludePatterns;
  std::vector<std::string> vExcludePatterns;

  // ── Scheduling ────────────────────────────────────────────────────────
  std::chrono::milliseconds durSyncInterval = std::chrono::minutes(5);
  std::chrono::milliseconds durFixupInterval = std::chrono::hours(1);
  std::string sPauseLockFile = ".sync-paused";
  bool bDryRun = false;

  // ── Commits ───────────────────────────────────────────────────────────
  std::string sCommitTemplate = "Auto-sync: ${timestamp} @ ${hash}";
  std::string sFixupMessagePrefix = "fixup! ";
  bool bAutosquashEnabled = true;
  std::optional<std::string> oAuthorName;
  std::optional<std::string> oAuthorEmail;

  // ── Logging ───────────────────────────────────────────────────────────
  std::string sLogLevel = "info";
  std::optional<std::string> oLogFilePath;

  /// Load and validate all config. Reads the JSON file named by
  /// MIRROR_CONFIG_FILE first when set, then applies environment overrides.
  /// Throws ConfigurationError on unreadable files, bad values or failed
  /// validation.
  static Config load();

  /// Apply the keys present in a parsed JSON document on top of this config.
  void applyJson(const nlohmann::json& jDoc);

  /// Throws ConfigurationError when a constraint is violated.
  void validate() const;

  RepositoryRef sourceRef() const { return {sSourceRepoPath, sGitExecutable}; }
  RepositoryRef mirrorRef() const { return {sMirrorRepoPath, sGitExecutable}; }
  InclusionRule inclusionRule() const {
    return {vIncludeExtensions, vIncludePatterns, vExcludePatterns};
  }

  /// Explicit author only when both name and email are configured.
  std::optional<std::string> authorIdentity() const;

  /// Parse "500ms", "45s", "5m", "1h30m". Throws ConfigurationError.
  static std::chrono::milliseconds parseDuration(const std::string& sValue);

  /// Render a duration back into the compact form used by parseDuration.
  static std::string formatDuration(std::chrono::milliseconds dur);

  /// Split a comma-separated list, trimming blanks and dropping empties.
  static std::vector<std::string> splitList(const std::string& sValue);

 private:
  /// Read a JSON file, dropping whole-line // comments.
  static nlohmann::json readJsonFile(const std::string& sPath);

  /// Read an env var, return empty string if unset.
  static std::string getEnv(const char* pVarName);

  /// Read an env var as bool (true/false/1/0/yes/no), default when unset.
  static bool getEnvBool(const char* pVarName, bool bDefault);
};

}  // namespace mirror::common
