#pragma once

#include <chrono>
#include <optional>
#include <string>

#include "common/Types.hpp"
#include "core/MessageTemplate.hpp"

namespace mirror::gitops {
class IRepositoryGateway;
}

namespace mirror::core {

/// Persists an applied ChangeSet as one mirror commit.
/// Class abbreviation: cg
class CommitGenerator {
 public:
  CommitGenerator(gitops::IRepositoryGateway& gwGateway, common::RepositoryRef rrSource,
                  common::RepositoryRef rrMirror, std::string sTemplate,
                  std::optional<std::string> oAuthor);
  ~CommitGenerator();

  /// Stage everything in the mirror and commit with the rendered message.
  /// An empty ChangeSet returns std::nullopt without touching the mirror,
  /// as does a commit git reports as having nothing to record.
  /// On success csChanges.oResultingCommit is set.
  std::optional<std::string> commit(common::ChangeSet& csChanges);

  /// Rendered template plus " (N files: +A ~M -D)".
  std::string buildMessage(const common::ChangeSet& csChanges, const std::string& sShortHash,
                           std::chrono::system_clock::time_point tpNow) const;

  static std::string summarySuffix(const common::ChangeSet& csChanges);

  /// First 8 characters of the source HEAD, "pending" without commits.
  std::string sourceShortHash();

 private:
  gitops::IRepositoryGateway& _gwGateway;
  common::RepositoryRef _rrSource;
  common::RepositoryRef _rrMirror;
  MessageTemplate _mtTemplate;
  std::optional<std::string> _oAuthor;
};

}  // namespace mirror::core
