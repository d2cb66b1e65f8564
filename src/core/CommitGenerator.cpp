#include "core/CommitGenerator.hpp"

#include "common/Logger.hpp"
#include "gitops/IRepositoryGateway.hpp"

#include <utility>

namespace mirror::core {

namespace {

constexpr std::size_t kShortHashLength = 8;

}  // namespace

CommitGenerator::CommitGenerator(gitops::IRepositoryGateway& gwGateway,
                                 common::RepositoryRef rrSource, common::RepositoryRef rrMirror,
                                 std::string sTemplate, std::optional<std::string> oAuthor)
    : _gwGateway(gwGateway),
      _rrSource(std::move(rrSource)),
      _rrMirror(std::move(rrMirror)),
      _mtTemplate(std::move(sTemplate)),
      _oAuthor(std::move(oAuthor)) {}

CommitGenerator::~CommitGenerator() = default;

std::string CommitGenerator::summarySuffix(const common::ChangeSet& csChanges) {
  return " (" + std::to_string(csChanges.total()) + " files: +" +
         std::to_string(csChanges.vAdded.size()) + " ~" +
         std::to_string(csChanges.vModified.size()) + " -" +
         std::to_string(csChanges.vDeleted.size()) + ")";
}

std::string CommitGenerator::buildMessage(const common::ChangeSet& csChanges,
                                          const std::string& sShortHash,
                                          std::chrono::system_clock::time_point tpNow) const {
  const std::string sBody =
      _mtTemplate.render({{MessageToken::Timestamp, MessageTemplate::formatTimestamp(tpNow)},
                          {MessageToken::Hash, sShortHash}});
  return sBody + summarySuffix(csChanges);
}

std::string CommitGenerator::sourceShortHash() {
  auto oHead = _gwGateway.headCommit(_rrSource);
  if (!oHead) {
    return "pending";
  }
  return oHead->substr(0, kShortHashLength);
}

std::optional<std::string> CommitGenerator::commit(common::ChangeSet& csChanges) {
  if (csChanges.empty()) {
    return std::nullopt;
  }

  _gwGateway.stageAll(_rrMirror);

  const std::string sMessage =
      buildMessage(csChanges, sourceShortHash(), std::chrono::system_clock::now());
  auto oCommit = _gwGateway.commit(_rrMirror, sMessage, _oAuthor);
  if (!oCommit) {
    common::Logger::get()->info("Mirror already matched the source; nothing to commit");
    return std::nullopt;
  }

  csChanges.oResultingCommit = oCommit;
  return oCommit;
}

}  // namespace mirror::core
