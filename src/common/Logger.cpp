#include "common/Logger.hpp"

#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <vector>

namespace mirror::common {

bool Logger::_bInitialized = false;

spdlog::level::level_enum Logger::parseLevel(const std::string& sLevel) {
  std::string sLower = sLevel;
  std::transform(sLower.begin(), sLower.end(), sLower.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

  // spdlog maps unknown names to "off"; reject them instead
  if (sLower == "trace") return spdlog::level::trace;
  if (sLower == "debug") return spdlog::level::debug;
  if (sLower == "info") return spdlog::level::info;
  if (sLower == "warn" || sLower == "warning") return spdlog::level::warn;
  if (sLower == "error") return spdlog::level::err;
  if (sLower == "critical") return spdlog::level::critical;
  if (sLower == "off") return spdlog::level::off;
  throw std::invalid_argument("Unknown log level: " + sLevel);
}

void Logger::init(const std::string& sLevel, const std::string& sFilePath) {
  auto level = parseLevel(sLevel);

  if (_bInitialized) {
    // Re-initialization: just update level
    spdlog::set_level(level);
    return;
  }

  std::vector<spdlog::sink_ptr> vSinks;
  vSinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (!sFilePath.empty()) {
    vSinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(sFilePath, false));
  }

  auto spLogger = std::make_shared<spdlog::logger>("mirror", vSinks.begin(), vSinks.end());
  spLogger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%n] %v");
  spLogger->set_level(level);
  spdlog::set_default_logger(spLogger);

  _bInitialized = true;
  spLogger->info("Logger initialized at level '{}'", sLevel);
  if (!sFilePath.empty()) {
    spLogger->info("Logging to file '{}'", sFilePath);
  }
}

void Logger::setLevel(const std::string& sLevel) {
  get()->set_level(parseLevel(sLevel));
}

std::shared_ptr<spdlog::logger> Logger::get() {
  if (!_bInitialized) {
    init("info");
  }
  return spdlog::default_logger();
}

}  // namespace mirror::common
