#include "common/Config.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace mirror::common {

namespace {

std::string trim(const std::string& sValue) {
  auto itBegin = std::find_if_not(sValue.begin(), sValue.end(),
                                  [](unsigned char c) { return std::isspace(c); });
  auto itEnd = std::find_if_not(sValue.rbegin(), sValue.rend(),
                                [](unsigned char c) { return std::isspace(c); })
                   .base();
  return itBegin < itEnd ? std::string(itBegin, itEnd) : std::string{};
}

std::vector<std::string> stringList(const nlohmann::json& jValue, const char* pKey) {
  if (!jValue.is_array()) {
    throw ConfigurationError("invalid_type", std::string(pKey) + " must be an array of strings");
  }
  return jValue.get<std::vector<std::string>>();
}

}  // namespace

std::string Config::getEnv(const char* pVarName) {
  const char* pValue = std::getenv(pVarName);
  return pValue ? std::string(pValue) : std::string{};
}

bool Config::getEnvBool(const char* pVarName, bool bDefault) {
  const std::string sValue = getEnv(pVarName);
  if (sValue.empty()) {
    return bDefault;
  }
  if (sValue == "true" || sValue == "1" || sValue == "yes") return true;
  if (sValue == "false" || sValue == "0" || sValue == "no") return false;
  throw ConfigurationError("invalid_bool",
                           std::string("Invalid boolean value for ") + pVarName + ": " + sValue);
}

std::vector<std::string> Config::splitList(const std::string& sValue) {
  std::vector<std::string> vItems;
  std::istringstream iss(sValue);
  std::string sItem;
  while (std::getline(iss, sItem, ',')) {
    sItem = trim(sItem);
    if (!sItem.empty()) {
      vItems.push_back(sItem);
    }
  }
  return vItems;
}

std::chrono::milliseconds Config::parseDuration(const std::string& sValue) {
  const std::string sInput = trim(sValue);
  if (sInput.empty()) {
    throw ConfigurationError("invalid_duration", "Duration is empty");
  }

  std::chrono::milliseconds durTotal{0};
  std::size_t iPos = 0;
  while (iPos < sInput.size()) {
    std::size_t iDigitsEnd = iPos;
    while (iDigitsEnd < sInput.size() && std::isdigit(static_cast<unsigned char>(sInput[iDigitsEnd]))) {
      ++iDigitsEnd;
    }
    if (iDigitsEnd == iPos) {
      throw ConfigurationError("invalid_duration", "Expected a number in duration: " + sInput);
    }
    if (iDigitsEnd - iPos > 12) {
      throw ConfigurationError("invalid_duration", "Duration amount too large: " + sInput);
    }
    const long long iAmount = std::stoll(sInput.substr(iPos, iDigitsEnd - iPos));

    std::size_t iUnitEnd = iDigitsEnd;
    while (iUnitEnd < sInput.size() && std::isalpha(static_cast<unsigned char>(sInput[iUnitEnd]))) {
      ++iUnitEnd;
    }
    const std::string sUnit = sInput.substr(iDigitsEnd, iUnitEnd - iDigitsEnd);

    // 12 digits times the largest unit still fits in a milliseconds count
    std::chrono::milliseconds durSegment{0};
    if (sUnit == "ms") {
      durSegment = std::chrono::milliseconds(iAmount);
    } else if (sUnit == "s") {
      durSegment = std::chrono::seconds(iAmount);
    } else if (sUnit == "m") {
      durSegment = std::chrono::minutes(iAmount);
    } else if (sUnit == "h") {
      durSegment = std::chrono::hours(iAmount);
    } else {
      throw ConfigurationError("invalid_duration",
                               "Unknown unit '" + sUnit + "' in duration: " + sInput);
    }
    if (durTotal > std::chrono::milliseconds::max() - durSegment) {
      throw ConfigurationError("invalid_duration", "Duration too large: " + sInput);
    }
    durTotal += durSegment;
    iPos = iUnitEnd;
  }
  return durTotal;
}

std::string Config::formatDuration(std::chrono::milliseconds dur) {
  using namespace std::chrono;
  if (dur.count() == 0) {
    return "0s";
  }
  std::string sOut;
  auto h = duration_cast<hours>(dur);
  dur -= h;
  auto m = duration_cast<minutes>(dur);
  dur -= m;
  auto s = duration_cast<seconds>(dur);
  dur -= s;
  if (h.count() > 0) sOut += std::to_string(h.count()) + "h";
  if (m.count() > 0) sOut += std::to_string(m.count()) + "m";
  if (s.count() > 0) sOut += std::to_string(s.count()) + "s";
  if (dur.count() > 0) sOut += std::to_string(dur.count()) + "ms";
  return sOut;
}

nlohmann::json Config::readJsonFile(const std::string& sPath) {
  std::ifstream ifs(sPath);
  if (!ifs.is_open()) {
    throw ConfigurationError("config_file_unreadable", "Cannot open config file: " + sPath);
  }

  // Hand-edited config files carry // comment lines
  std::ostringstream oss;
  std::string sLine;
  while (std::getline(ifs, sLine)) {
    const std::string sTrimmed = trim(sLine);
    if (sTrimmed.rfind("//", 0) == 0) {
      continue;
    }
    oss << sLine << '\n';
  }

  try {
    return nlohmann::json::parse(oss.str());
  } catch (const nlohmann::json::parse_error& ex) {
    throw ConfigurationError("config_file_invalid",
                             "Cannot parse config file " + sPath + ": " + ex.what());
  }
}

void Config::applyJson(const nlohmann::json& jDoc) {
  if (!jDoc.is_object()) {
    throw ConfigurationError("config_file_invalid", "Config document must be a JSON object");
  }

  try {
    if (jDoc.contains("sourceRepoPath")) sSourceRepoPath = jDoc.at("sourceRepoPath").get<std::string>();
    if (jDoc.contains("mirrorRepoPath")) sMirrorRepoPath = jDoc.at("mirrorRepoPath").get<std::string>();
    if (jDoc.contains("gitExecutable")) sGitExecutable = jDoc.at("gitExecutable").get<std::string>();
    if (jDoc.contains("remoteName")) sRemoteName = jDoc.at("remoteName").get<std::string>();

    if (jDoc.contains("includeExtensions")) {
      vIncludeExtensions = stringList(jDoc.at("includeExtensions"), "includeExtensions");
    }
    if (jDoc.contains("includePatterns")) {
      vIncludePatterns = stringList(jDoc.at("includePatterns"), "includePatterns");
    }
    if (jDoc.contains("excludePatterns")) {
      vExcludePatterns = stringList(jDoc.at("excludePatterns"), "excludePatterns");
    }

    if (jDoc.contains("syncInterval")) {
      durSyncInterval = parseDuration(jDoc.at("syncInterval").get<std::string>());
    }
    if (jDoc.contains("fixupInterval")) {
      durFixupInterval = parseDuration(jDoc.at("fixupInterval").get<std::string>());
    }
    if (jDoc.contains("pauseLockFile")) sPauseLockFile = jDoc.at("pauseLockFile").get<std::string>();
    if (jDoc.contains("dryRun")) bDryRun = jDoc.at("dryRun").get<bool>();

    if (jDoc.contains("commitTemplate")) sCommitTemplate = jDoc.at("commitTemplate").get<std::string>();
    if (jDoc.contains("fixupMessagePrefix")) {
      sFixupMessagePrefix = jDoc.at("fixupMessagePrefix").get<std::string>();
    }
    if (jDoc.contains("autosquashEnabled")) {
      bAutosquashEnabled = jDoc.at("autosquashEnabled").get<bool>();
    }
    if (jDoc.contains("authorName")) oAuthorName = jDoc.at("authorName").get<std::string>();
    if (jDoc.contains("authorEmail")) oAuthorEmail = jDoc.at("authorEmail").get<std::string>();

    if (jDoc.contains("logLevel")) sLogLevel = jDoc.at("logLevel").get<std::string>();
    if (jDoc.contains("logFilePath")) oLogFilePath = jDoc.at("logFilePath").get<std::string>();
  } catch (const nlohmann::json::exception& ex) {
    throw ConfigurationError("invalid_type", std::string("Invalid config value: ") + ex.what());
  }
}

std::optional<std::string> Config::authorIdentity() const {
  if (!oAuthorName || !oAuthorEmail || oAuthorName->empty() || oAuthorEmail->empty()) {
    return std::nullopt;
  }
  return *oAuthorName + " <" + *oAuthorEmail + ">";
}

void Config::validate() const {
  if (sSourceRepoPath.empty()) {
    throw ConfigurationError("missing_source_path", "Source repository path is not set");
  }
  if (sMirrorRepoPath.empty()) {
    throw ConfigurationError("missing_mirror_path", "Mirror repository path is not set");
  }
  if (!std::filesystem::path(sSourceRepoPath).is_absolute()) {
    throw ConfigurationError("relative_source_path",
                             "Source repository path must be absolute: " + sSourceRepoPath);
  }
  if (!std::filesystem::path(sMirrorRepoPath).is_absolute()) {
    throw ConfigurationError("relative_mirror_path",
                             "Mirror repository path must be absolute: " + sMirrorRepoPath);
  }
  if (std::filesystem::path(sSourceRepoPath).lexically_normal() ==
      std::filesystem::path(sMirrorRepoPath).lexically_normal()) {
    throw ConfigurationError("same_repository",
                             "Source and mirror repository paths must differ");
  }

  if (durSyncInterval.count() <= 0) {
    throw ConfigurationError("invalid_interval", "Sync interval must be positive");
  }
  if (durFixupInterval.count() <= 0) {
    throw ConfigurationError("invalid_interval", "Fixup interval must be positive");
  }

  if (sGitExecutable.empty()) {
    throw ConfigurationError("missing_git_executable", "Git executable is not set");
  }
  if (sCommitTemplate.empty()) {
    throw ConfigurationError("empty_commit_template", "Commit template must not be empty");
  }

  const std::filesystem::path pLock(sPauseLockFile);
  if (sPauseLockFile.empty() || pLock.is_absolute() || pLock.has_parent_path()) {
    throw ConfigurationError("invalid_pause_lock_file",
                             "Pause lock file must be a plain file name: " + sPauseLockFile);
  }

  try {
    Logger::parseLevel(sLogLevel);
  } catch (const std::invalid_argument&) {
    throw ConfigurationError("invalid_log_level", "Unknown log level: " + sLogLevel);
  }
}

Config Config::load() {
  Config cfg;

  // ── Config file ────────────────────────────────────────────────────────
  const std::string sConfigFile = getEnv("MIRROR_CONFIG_FILE");
  if (!sConfigFile.empty()) {
    cfg.applyJson(readJsonFile(sConfigFile));
  }

  // ── Environment overrides ──────────────────────────────────────────────
  if (auto s = getEnv("MIRROR_SOURCE_PATH"); !s.empty()) cfg.sSourceRepoPath = s;
  if (auto s = getEnv("MIRROR_TARGET_PATH"); !s.empty()) cfg.sMirrorRepoPath = s;
  if (auto s = getEnv("MIRROR_GIT_EXECUTABLE"); !s.empty()) cfg.sGitExecutable = s;
  if (auto s = getEnv("MIRROR_REMOTE_NAME"); !s.empty()) cfg.sRemoteName = s;

  if (auto s = getEnv("MIRROR_INCLUDE_EXTENSIONS"); !s.empty()) {
    cfg.vIncludeExtensions = splitList(s);
  }
  if (auto s = getEnv("MIRROR_INCLUDE_PATTERNS"); !s.empty()) cfg.vIncludePatterns = splitList(s);
  if (auto s = getEnv("MIRROR_EXCLUDE_PATTERNS"); !s.empty()) cfg.vExcludePatterns = splitList(s);

  if (auto s = getEnv("MIRROR_SYNC_INTERVAL"); !s.empty()) cfg.durSyncInterval = parseDuration(s);
  if (auto s = getEnv("MIRROR_FIXUP_INTERVAL"); !s.empty()) cfg.durFixupInterval = parseDuration(s);
  if (auto s = getEnv("MIRROR_PAUSE_LOCK_FILE"); !s.empty()) cfg.sPauseLockFile = s;
  cfg.bDryRun = getEnvBool("MIRROR_DRY_RUN", cfg.bDryRun);

  if (auto s = getEnv("MIRROR_COMMIT_TEMPLATE"); !s.empty()) cfg.sCommitTemplate = s;
  if (auto s = getEnv("MIRROR_FIXUP_MESSAGE_PREFIX"); !s.empty()) cfg.sFixupMessagePrefix = s;
  cfg.bAutosquashEnabled = getEnvBool("MIRROR_AUTOSQUASH", cfg.bAutosquashEnabled);
  if (auto s = getEnv("MIRROR_AUTHOR_NAME"); !s.empty()) cfg.oAuthorName = s;
  if (auto s = getEnv("MIRROR_AUTHOR_EMAIL"); !s.empty()) cfg.oAuthorEmail = s;

  if (auto s = getEnv("MIRROR_LOG_LEVEL"); !s.empty()) cfg.sLogLevel = s;
  if (auto s = getEnv("MIRROR_LOG_FILE"); !s.empty()) cfg.oLogFilePath = s;

  // ── Validation ─────────────────────────────────────────────────────────
  cfg.validate();
  return cfg;
}

}  // namespace mirror::common
