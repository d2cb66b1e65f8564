#include "gitops/ProcessRunner.hpp"

#include "common/Errors.hpp"

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <set>
#include <string>

extern char** environ;

namespace mirror::gitops {

namespace {

/// Closes a descriptor on scope exit unless released.
class FdGuard {
 public:
  explicit FdGuard(int iFd = -1) : _iFd(iFd) {}
  ~FdGuard() { reset(); }
  FdGuard(const FdGuard&) = delete;
  FdGuard& operator=(const FdGuard&) = delete;

  int get() const { return _iFd; }
  void reset(int iFd = -1) {
    if (_iFd >= 0) {
      ::close(_iFd);
    }
    _iFd = iFd;
  }

 private:
  int _iFd;
};

std::string trimmed(const std::string& sValue) {
  const auto iBegin = sValue.find_first_not_of(" \t\r\n");
  if (iBegin == std::string::npos) {
    return {};
  }
  const auto iEnd = sValue.find_last_not_of(" \t\r\n");
  return sValue.substr(iBegin, iEnd - iBegin + 1);
}

/// Inherited environment with vExtraEnv entries replacing same-named ones.
std::vector<std::string> buildEnvironment(const std::vector<std::string>& vExtraEnv) {
  std::set<std::string> setOverridden;
  for (const auto& sEntry : vExtraEnv) {
    setOverridden.insert(sEntry.substr(0, sEntry.find('=')));
  }

  std::vector<std::string> vEnv;
  for (char** pp = environ; pp != nullptr && *pp != nullptr; ++pp) {
    const std::string sEntry(*pp);
    if (setOverridden.count(sEntry.substr(0, sEntry.find('='))) == 0) {
      vEnv.push_back(sEntry);
    }
  }
  vEnv.insert(vEnv.end(), vExtraEnv.begin(), vExtraEnv.end());
  return vEnv;
}

std::vector<char*> toCharPtrs(std::vector<std::string>& vStrings) {
  std::vector<char*> vPtrs;
  vPtrs.reserve(vStrings.size() + 1);
  for (auto& s : vStrings) {
    vPtrs.push_back(s.data());
  }
  vPtrs.push_back(nullptr);
  return vPtrs;
}

}  // namespace

std::string ProcessResult::combinedOutput() const {
  const std::string sErr = trimmed(sStderr);
  const std::string sOut = trimmed(sStdout);
  if (sErr.empty()) return sOut;
  if (sOut.empty()) return sErr;
  return sErr + "\n" + sOut;
}

std::string ProcessRunner::describe(const std::vector<std::string>& vArgv) {
  std::string sOut;
  for (const auto& sArg : vArgv) {
    if (!sOut.empty()) sOut += ' ';
    if (sArg.find_first_of(" \t\"'") != std::string::npos) {
      sOut += '"' + sArg + '"';
    } else {
      sOut += sArg;
    }
  }
  return sOut;
}

ProcessResult ProcessRunner::run(const std::vector<std::string>& vArgv,
                                 const std::string& sWorkingDir,
                                 const std::vector<std::string>& vExtraEnv) {
  if (vArgv.empty()) {
    throw common::ToolInvocationError("empty_command", "No command given");
  }

  // Everything the child needs is prepared before fork(); between fork and
  // exec the child only makes async-signal-safe calls.
  std::vector<std::string> vArgs = vArgv;
  std::vector<std::string> vEnv = buildEnvironment(vExtraEnv);
  std::vector<char*> vArgPtrs = toCharPtrs(vArgs);
  std::vector<char*> vEnvPtrs = toCharPtrs(vEnv);

  int aiOut[2];
  int aiErr[2];
  int aiExec[2];
  if (::pipe2(aiOut, O_CLOEXEC) != 0) {
    throw common::ToolInvocationError("pipe_failed", std::strerror(errno));
  }
  FdGuard fgOutRead(aiOut[0]), fgOutWrite(aiOut[1]);
  if (::pipe2(aiErr, O_CLOEXEC) != 0) {
    throw common::ToolInvocationError("pipe_failed", std::strerror(errno));
  }
  FdGuard fgErrRead(aiErr[0]), fgErrWrite(aiErr[1]);
  if (::pipe2(aiExec, O_CLOEXEC) != 0) {
    throw common::ToolInvocationError("pipe_failed", std::strerror(errno));
  }
  FdGuard fgExecRead(aiExec[0]), fgExecWrite(aiExec[1]);

  const pid_t pid = ::fork();
  if (pid < 0) {
    throw common::ToolInvocationError("fork_failed", std::strerror(errno));
  }

  if (pid == 0) {
    // Child process
    int iDevNull = ::open("/dev/null", O_RDONLY);
    if (iDevNull >= 0) {
      ::dup2(iDevNull, STDIN_FILENO);
    }
    ::dup2(aiOut[1], STDOUT_FILENO);
    ::dup2(aiErr[1], STDERR_FILENO);

    int iErrno = 0;
    if (::chdir(sWorkingDir.c_str()) != 0) {
      iErrno = errno;
    } else {
      ::execvpe(vArgPtrs[0], vArgPtrs.data(), vEnvPtrs.data());
      iErrno = errno;
    }
    ssize_t iIgnored = ::write(aiExec[1], &iErrno, sizeof(iErrno));
    (void)iIgnored;
    ::_exit(127);
  }

  // Parent process
  fgOutWrite.reset();
  fgErrWrite.reset();
  fgExecWrite.reset();

  ProcessResult pres;

  // Drain both pipes together so a chatty stderr cannot block the child
  pollfd aPoll[2] = {{fgOutRead.get(), POLLIN, 0}, {fgErrRead.get(), POLLIN, 0}};
  int iOpen = 2;
  char acBuffer[4096];
  while (iOpen > 0) {
    if (::poll(aPoll, 2, -1) < 0) {
      if (errno == EINTR) continue;
      break;
    }
    for (int i = 0; i < 2; ++i) {
      if (aPoll[i].fd < 0 || aPoll[i].revents == 0) continue;
      const ssize_t n = ::read(aPoll[i].fd, acBuffer, sizeof(acBuffer));
      if (n > 0) {
        (i == 0 ? pres.sStdout : pres.sStderr).append(acBuffer, static_cast<std::size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        aPoll[i].fd = -1;
        --iOpen;
      }
    }
  }

  int iStatus = 0;
  while (::waitpid(pid, &iStatus, 0) < 0) {
    if (errno != EINTR) {
      throw common::ToolInvocationError("wait_failed", std::strerror(errno));
    }
  }

  int iChildErrno = 0;
  ssize_t nExec;
  do {
    nExec = ::read(fgExecRead.get(), &iChildErrno, sizeof(iChildErrno));
  } while (nExec < 0 && errno == EINTR);
  if (nExec == static_cast<ssize_t>(sizeof(iChildErrno))) {
    throw common::ToolInvocationError(
        "spawn_failed",
        "Cannot run '" + describe(vArgv) + "' in " + sWorkingDir + ": " +
            std::strerror(iChildErrno),
        127);
  }

  if (WIFEXITED(iStatus)) {
    pres.iExitCode = WEXITSTATUS(iStatus);
  } else if (WIFSIGNALED(iStatus)) {
    pres.iExitCode = 128 + WTERMSIG(iStatus);
  }
  return pres;
}

}  // namespace mirror::gitops
