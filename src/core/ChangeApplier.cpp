#include "core/ChangeApplier.hpp"

#include "common/Errors.hpp"
#include "common/Logger.hpp"

#include <array>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace mirror::core {

namespace {

constexpr std::size_t kCopyBufferSize = 32 * 1024;
constexpr const char* kTempSuffix = ".mirror-sync-tmp";

}  // namespace

ChangeApplier::ChangeApplier(common::RepositoryRef rrSource, common::RepositoryRef rrMirror)
    : _rrSource(std::move(rrSource)), _rrMirror(std::move(rrMirror)) {}

ChangeApplier::~ChangeApplier() = default;

void ChangeApplier::requireContained(const std::string& sRelPath) {
  const fs::path pRel(sRelPath);
  if (sRelPath.empty() || pRel.is_absolute()) {
    throw common::FileApplyError("path_outside_repository",
                                 "Refusing non-relative path '" + sRelPath + "'");
  }
  for (const auto& pPart : pRel) {
    if (pPart == "..") {
      throw common::FileApplyError("path_outside_repository",
                                   "Refusing path with '..' component: " + sRelPath);
    }
  }
}

void ChangeApplier::copyToMirror(const std::string& sRelPath) {
  requireContained(sRelPath);
  const fs::path pSource = fs::path(_rrSource.sPath) / sRelPath;
  const fs::path pTarget = fs::path(_rrMirror.sPath) / sRelPath;

  std::error_code ec;
  if (!fs::is_regular_file(pSource, ec)) {
    throw common::FileApplyError("source_missing",
                                 "Source file does not exist: " + pSource.string());
  }

  fs::create_directories(pTarget.parent_path(), ec);
  if (ec) {
    throw common::FileApplyError("mkdir_failed", "Cannot create directory " +
                                                     pTarget.parent_path().string() + ": " +
                                                     ec.message());
  }

  const fs::path pTemp = pTarget.string() + kTempSuffix;
  {
    std::ifstream ifs(pSource, std::ios::binary);
    if (!ifs.is_open()) {
      throw common::FileApplyError("open_failed", "Cannot open " + pSource.string());
    }
    std::ofstream ofs(pTemp, std::ios::binary | std::ios::trunc);
    if (!ofs.is_open()) {
      throw common::FileApplyError("open_failed", "Cannot create " + pTemp.string());
    }

    std::array<char, kCopyBufferSize> aBuffer{};
    while (ifs) {
      ifs.read(aBuffer.data(), static_cast<std::streamsize>(aBuffer.size()));
      const std::streamsize n = ifs.gcount();
      if (n > 0 && !ofs.write(aBuffer.data(), n)) {
        break;
      }
    }
    ofs.flush();
    if (ifs.bad() || !ofs) {
      ofs.close();
      fs::remove(pTemp, ec);
      throw common::FileApplyError("copy_failed",
                                   "Cannot copy " + pSource.string() + " -> " + pTarget.string());
    }
  }

  fs::permissions(pTemp, fs::status(pSource, ec).permissions(), ec);

  fs::rename(pTemp, pTarget, ec);
  if (ec) {
    std::error_code ecCleanup;
    fs::remove(pTemp, ecCleanup);
    throw common::FileApplyError("rename_failed",
                                 "Cannot move copy into place at " + pTarget.string() + ": " +
                                     ec.message());
  }
}

bool ChangeApplier::removeFromMirror(const std::string& sRelPath) {
  requireContained(sRelPath);
  const fs::path pTarget = fs::path(_rrMirror.sPath) / sRelPath;

  std::error_code ec;
  const bool bRemoved = fs::remove(pTarget, ec);
  if (ec) {
    throw common::FileApplyError("remove_failed",
                                 "Cannot remove " + pTarget.string() + ": " + ec.message());
  }
  return bRemoved;
}

void ChangeApplier::apply(const common::ChangeSet& csChanges) {
  auto spLog = common::Logger::get();

  for (const auto& sPath : csChanges.vAdded) {
    copyToMirror(sPath);
    spLog->debug("  + {}", sPath);
  }
  for (const auto& sPath : csChanges.vModified) {
    copyToMirror(sPath);
    spLog->debug("  ~ {}", sPath);
  }
  for (const auto& sPath : csChanges.vDeleted) {
    if (removeFromMirror(sPath)) {
      spLog->debug("  - {}", sPath);
    } else {
      spLog->debug("  - {} (already absent)", sPath);
    }
  }
}

}  // namespace mirror::core
