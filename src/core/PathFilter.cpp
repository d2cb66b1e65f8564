#include "core/PathFilter.hpp"

#include <fnmatch.h>

#include <algorithm>
#include <cctype>
#include <filesystem>

namespace mirror::core {

namespace {

std::string toLower(std::string sValue) {
  std::transform(sValue.begin(), sValue.end(), sValue.begin(),
                 [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return sValue;
}

bool anyGlobMatches(const std::vector<std::string>& vGlobs, const std::string& sPath) {
  return std::any_of(vGlobs.begin(), vGlobs.end(), [&sPath](const std::string& sGlob) {
    return ::fnmatch(sGlob.c_str(), sPath.c_str(), 0) == 0;
  });
}

}  // namespace

PathFilter::PathFilter(const common::InclusionRule& irRule)
    : _vIncludeGlobs(irRule.vIncludeGlobs), _vExcludeGlobs(irRule.vExcludeGlobs) {
  for (const auto& sExt : irRule.vExtensions) {
    if (sExt.empty()) continue;
    _vExtensions.push_back(toLower(sExt.front() == '.' ? sExt : "." + sExt));
  }
}

bool PathFilter::matchesExtension(const std::string& sPath) const {
  const std::string sExt = toLower(std::filesystem::path(sPath).extension().string());
  if (sExt.empty()) {
    return false;
  }
  return std::find(_vExtensions.begin(), _vExtensions.end(), sExt) != _vExtensions.end();
}

bool PathFilter::matchesIncludeGlob(const std::string& sPath) const {
  return anyGlobMatches(_vIncludeGlobs, sPath);
}

bool PathFilter::isExcluded(const std::string& sPath) const {
  return anyGlobMatches(_vExcludeGlobs, sPath);
}

bool PathFilter::includes(const std::string& sPath) const {
  if (!matchesExtension(sPath) && !matchesIncludeGlob(sPath)) {
    return false;
  }
  return !isExcluded(sPath);
}

}  // namespace mirror::core
