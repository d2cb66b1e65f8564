#include "core/ChangeSetDetector.hpp"

#include "common/Logger.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <system_error>
#include <unordered_set>
#include <utility>

namespace mirror::core {

ChangeSetDetector::ChangeSetDetector(gitops::IRepositoryGateway& gwGateway,
                                     common::RepositoryRef rrSource,
                                     common::RepositoryRef rrMirror,
                                     const common::InclusionRule& irRule)
    : _gwGateway(gwGateway),
      _rrSource(std::move(rrSource)),
      _rrMirror(std::move(rrMirror)),
      _pfFilter(irRule) {}

ChangeSetDetector::~ChangeSetDetector() = default;

bool ChangeSetDetector::existsUnder(const std::string& sRoot, const std::string& sRelPath) const {
  std::error_code ec;
  return std::filesystem::exists(std::filesystem::path(sRoot) / sRelPath, ec);
}

bool ChangeSetDetector::sameContents(const std::string& sRelPath) const {
  const auto pathSource = std::filesystem::path(_rrSource.sPath) / sRelPath;
  const auto pathMirror = std::filesystem::path(_rrMirror.sPath) / sRelPath;

  std::error_code ecSource;
  std::error_code ecMirror;
  const auto iSourceSize = std::filesystem::file_size(pathSource, ecSource);
  const auto iMirrorSize = std::filesystem::file_size(pathMirror, ecMirror);
  if (ecSource || ecMirror || iSourceSize != iMirrorSize) {
    return false;
  }

  std::ifstream ifsSource(pathSource, std::ios::binary);
  std::ifstream ifsMirror(pathMirror, std::ios::binary);
  if (!ifsSource || !ifsMirror) {
    return false;
  }
  return std::equal(std::istreambuf_iterator<char>(ifsSource), std::istreambuf_iterator<char>(),
                    std::istreambuf_iterator<char>(ifsMirror), std::istreambuf_iterator<char>());
}

void ChangeSetDetector::classifyPresent(const std::string& sPath,
                                        common::ChangeSet& csChanges) const {
  if (!existsUnder(_rrMirror.sPath, sPath)) {
    csChanges.vAdded.push_back(sPath);
  } else if (!sameContents(sPath)) {
    csChanges.vModified.push_back(sPath);
  }
}

common::ChangeSet ChangeSetDetector::detect() {
  // Both queries run before any classification so a failure leaves nothing behind
  const auto vTracked = _gwGateway.changedPathsSincePrevious(_rrSource);
  const auto vUntracked = _gwGateway.untrackedPaths(_rrSource);

  auto spLog = common::Logger::get();
  common::ChangeSet csChanges;
  std::unordered_set<std::string> setSeen;

  for (const auto& sPath : vTracked) {
    if (!_pfFilter.includes(sPath) || !setSeen.insert(sPath).second) {
      continue;
    }
    if (!existsUnder(_rrSource.sPath, sPath)) {
      // Already gone from the mirror means an earlier pass propagated it
      if (existsUnder(_rrMirror.sPath, sPath)) {
        csChanges.vDeleted.push_back(sPath);
      }
    } else {
      classifyPresent(sPath, csChanges);
    }
  }

  for (const auto& sPath : vUntracked) {
    if (!_pfFilter.includes(sPath) || !setSeen.insert(sPath).second) {
      continue;
    }
    classifyPresent(sPath, csChanges);
  }

  spLog->debug("Detected {} tracked and {} untracked paths; {} need propagating",
               vTracked.size(), vUntracked.size(), csChanges.total());
  return csChanges;
}

}  // namespace mirror::core
