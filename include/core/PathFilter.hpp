#pragma once

#include <string>
#include <vector>

#include "common/Types.hpp"

namespace mirror::core {

/// Evaluates an InclusionRule against repository-relative paths.
/// A path is included when its extension matches (case-insensitive) or any
/// include glob matches; an exclude glob match always wins.
/// Globs use fnmatch(3) syntax against the whole relative path, and `*`
/// crosses directory separators.
/// Class abbreviation: pf
class PathFilter {
 public:
  explicit PathFilter(const common::InclusionRule& irRule);

  bool includes(const std::string& sPath) const;
  bool isExcluded(const std::string& sPath) const;

 private:
  bool matchesExtension(const std::string& sPath) const;
  bool matchesIncludeGlob(const std::string& sPath) const;

  std::vector<std::string> _vExtensions;  // lower-case, with leading dot
  std::vector<std::string> _vIncludeGlobs;
  std::vector<std::string> _vExcludeGlobs;
};

}  // namespace mirror::core
