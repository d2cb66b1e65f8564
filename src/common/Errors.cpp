#include "common/Errors.hpp"

namespace mirror::common {

const char* toString(ErrorKind ekKind) {
  switch (ekKind) {
    case ErrorKind::Configuration:
      return "configuration";
    case ErrorKind::RepositoryState:
      return "repository_state";
    case ErrorKind::ToolInvocation:
      return "tool_invocation";
    case ErrorKind::FileSystem:
      return "file_system";
  }
  return "unknown";
}

}  // namespace mirror::common
