#include "PseudoTerminalProcess.hpp"

#include "FdUtils.hpp"
#include "TetherException.hpp"

namespace tether {
PseudoTerminalProcess::PseudoTerminalProcess()
    : childPid(-1), masterFd(-1), reaped(false), terminated(false) {}

PseudoTerminalProcess::~PseudoTerminalProcess() {
  terminate();
  if (childPid > 0) {
    reap();
  }
  FdUtils::closeIfOpen(&masterFd);
}

namespace {
// Stages a child can fail in before exec replaces it.
enum ChildFailure { ENTER_CWD = 1, EXEC_SHELL = 2 };

// Reports the failure to the parent over the status pipe and exits.  If
// the report cannot be written the parent sees EOF and the exit shows up
// as the terminal closing.
[[noreturn]] void failInChild(int statusFd, int stage, int exitCode) {
  int report[2] = {stage, errno};
  while (::write(statusFd, report, sizeof(report)) == -1 && errno == EINTR) {
  }
  _exit(exitCode);
}

int openStatusPipe(int fds[2]) {
  if (::pipe(fds) == -1) {
    return -1;
  }
  for (int a = 0; a < 2; a++) {
    if (fcntl(fds[a], F_SETFD, FD_CLOEXEC) == -1) {
      ::close(fds[0]);
      ::close(fds[1]);
      return -1;
    }
  }
  return 0;
}
}  // namespace

void PseudoTerminalProcess::start(const string &cwd, const string &shell,
                                  int cols, int rows) {
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;

  // Closed by a successful exec, so the parent reads EOF.
  int statusPipe[2];
  if (openStatusPipe(statusPipe) == -1) {
    throw TetherException(ErrorKind::SpawnFailure,
                          string("Cannot create status pipe: ") +
                              strerror(GetErrno()));
  }

  // Prepared before forking: the child only execs.
  string version = TETHER_VERSION;
  pid_t pid = forkpty(&masterFd, NULL, NULL, &tmpwin);
  switch (pid) {
    case -1: {
      int forkErrno = GetErrno();
      ::close(statusPipe[0]);
      ::close(statusPipe[1]);
      throw TetherException(ErrorKind::SpawnFailure,
                            string("forkpty failed: ") + strerror(forkErrno));
    }
    case 0: {
      ::close(statusPipe[0]);
      if (chdir(cwd.c_str()) == -1) {
        failInChild(statusPipe[1], ENTER_CWD, 126);
      }
      setenv("TERM", "xterm-256color", 1);
      setenv("TETHER_VERSION", version.c_str(), 1);
      // bash remembers the SIGCHLD disposition it was started with as the
      // "original value", so make sure it is the default before exec.
      signal(SIGCHLD, SIG_DFL);
      signal(SIGPIPE, SIG_DFL);
      execl(shell.c_str(), shell.c_str(), "-l", NULL);
      failInChild(statusPipe[1], EXEC_SHELL, 127);
    }
    default:
      break;
  }

  // parent
  ::close(statusPipe[1]);
  int report[2] = {0, 0};
  ssize_t got;
  do {
    got = ::read(statusPipe[0], report, sizeof(report));
  } while (got < 0 && GetErrno() == EINTR);
  ::close(statusPipe[0]);
  childPid = pid;

  if (got == ssize_t(sizeof(report))) {
    reap();
    FdUtils::closeIfOpen(&masterFd);
    string reason = strerror(report[1]);
    if (report[0] == ENTER_CWD) {
      throw TetherException(ErrorKind::SpawnFailure,
                            "Cannot enter " + cwd + ": " + reason);
    }
    throw TetherException(ErrorKind::SpawnFailure,
                          "Cannot run " + shell + ": " + reason);
  }

  try {
    FdUtils::setNonBlocking(masterFd);
  } catch (const std::runtime_error &ex) {
    terminate();
    reap();
    FdUtils::closeIfOpen(&masterFd);
    throw TetherException(ErrorKind::SpawnFailure, ex.what());
  }
  VLOG(1) << "pty opened " << masterFd << " for pid " << pid;
}

#define BUF_SIZE (16 * 1024)

int PseudoTerminalProcess::readOutput(char *buf, size_t count,
                                      int64_t timeoutMs) {
  if (masterFd < 0) {
    return -1;
  }
  if (!FdUtils::waitForData(masterFd, timeoutMs)) {
    return 0;
  }
  int rc = ::read(masterFd, buf, std::min(count, size_t(BUF_SIZE)));
  if (rc < 0) {
    if (GetErrno() == EAGAIN || GetErrno() == EINTR) {
      return 0;
    }
    // EIO once the slave side is gone
    VLOG(1) << "Terminal read ended: " << strerror(GetErrno());
    return -1;
  }
  if (rc == 0) {
    return -1;
  }
  return rc;
}

void PseudoTerminalProcess::write(const string &data) {
  size_t bytesWritten = 0;
  while (bytesWritten < data.length()) {
    if (terminated) {
      throw std::runtime_error("Terminal closed with input pending");
    }
    int rc = ::write(masterFd, data.data() + bytesWritten,
                     data.length() - bytesWritten);
    if (rc < 0) {
      auto localErrno = GetErrno();
      if (localErrno == EAGAIN || localErrno == EWOULDBLOCK ||
          localErrno == EINTR) {
        // The shell is not reading; check back so terminate() can end this.
        FdUtils::waitForWritable(masterFd, 50);
        continue;
      }
      throw std::runtime_error(string("Cannot write to terminal: ") +
                               strerror(localErrno));
    }
    bytesWritten += rc;
  }
}

void PseudoTerminalProcess::resize(int cols, int rows) {
  winsize tmpwin;
  tmpwin.ws_row = rows;
  tmpwin.ws_col = cols;
  tmpwin.ws_xpixel = 0;
  tmpwin.ws_ypixel = 0;
  if (ioctl(masterFd, TIOCSWINSZ, &tmpwin) == -1) {
    throw std::runtime_error(string("Cannot resize terminal: ") +
                             strerror(GetErrno()));
  }
}

void PseudoTerminalProcess::terminate() {
  terminated = true;
  lock_guard<mutex> guard(processMutex);
  if (childPid > 0 && !reaped) {
    // forkpty makes the child a session leader, so its pid is the group id.
    ::kill(-childPid, SIGKILL);
    ::kill(childPid, SIGKILL);
  }
}

void PseudoTerminalProcess::reap() {
  if (childPid <= 0) {
    return;
  }
  {
    lock_guard<mutex> guard(processMutex);
    if (reaped) {
      return;
    }
  }
  // Wait without reaping so the pid stays reserved while terminate() may
  // still signal it.
  siginfo_t childInfo;
  int rc;
  do {
    rc = waitid(P_PID, childPid, &childInfo, WEXITED | WNOWAIT);
  } while (rc < 0 && GetErrno() == EINTR);
  lock_guard<mutex> guard(processMutex);
  if (!reaped) {
    rc = waitid(P_PID, childPid, &childInfo, WEXITED);
    if (rc < 0 && GetErrno() != ECHILD) {
      FATAL_FAIL(rc);
    }
    reaped = true;
    VLOG(1) << "Reaped terminal pid " << childPid;
  }
}
}  // namespace tether
