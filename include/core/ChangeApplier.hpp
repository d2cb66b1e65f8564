#pragma once

#include <string>

#include "common/Types.hpp"

namespace mirror::core {

/// Materializes a ChangeSet onto the mirror's working tree.
/// Class abbreviation: ca
class ChangeApplier {
 public:
  ChangeApplier(common::RepositoryRef rrSource, common::RepositoryRef rrMirror);
  ~ChangeApplier();

  /// Copy added then modified paths, then remove deleted ones.
  /// The first failing path throws FileApplyError; paths already applied
  /// stay applied.
  void apply(const common::ChangeSet& csChanges);

  /// Stream-copy one file into the mirror via a temporary sibling and a
  /// rename, creating missing parent directories.
  void copyToMirror(const std::string& sRelPath);

  /// Remove one file from the mirror. Returns false when it was already gone.
  bool removeFromMirror(const std::string& sRelPath);

 private:
  /// Reject absolute paths and ".." components.
  static void requireContained(const std::string& sRelPath);

  common::RepositoryRef _rrSource;
  common::RepositoryRef _rrMirror;
};

}  // namespace mirror::core
