#include "ChildProcess.hpp"

#include "FdUtils.hpp"

namespace tether {
ChildProcess::~ChildProcess() {
  terminate();
  FdUtils::closeIfOpen(&stdoutFd);
}

void ChildProcess::start(const string& command, const vector<string>& args,
                         const string& cwd) {
  // Built before forking: the child may only make async-signal-safe calls.
  vector<char*> argv;
  argv.push_back(const_cast<char*>(command.c_str()));
  for (const auto& arg : args) {
    argv.push_back(const_cast<char*>(arg.c_str()));
  }
  argv.push_back(NULL);

  int link_child[2];
  if (pipe(link_child) == -1) {
    throw std::runtime_error(string("pipe failed: ") + strerror(GetErrno()));
  }

  pid_t childPid = fork();
  if (childPid == 0) {
    // child process
    setpgid(0, 0);
    dup2(link_child[1], STDOUT_FILENO);
    close(link_child[0]);
    close(link_child[1]);
    int devNull = open("/dev/null", O_RDWR);
    if (devNull >= 0) {
      dup2(devNull, STDIN_FILENO);
      close(devNull);
    }
    if (!cwd.empty() && chdir(cwd.c_str()) == -1) {
      _exit(127);
    }
    signal(SIGCHLD, SIG_DFL);
    signal(SIGPIPE, SIG_DFL);
    execvp(argv[0], argv.data());
    _exit(127);
  } else if (childPid > 0) {
    // parent process
    close(link_child[1]);
    lock_guard<mutex> guard(processMutex);
    pid = childPid;
    stdoutFd = link_child[0];
    VLOG(1) << "Started " << command << " as pid " << pid;
  } else {
    int forkErrno = GetErrno();
    close(link_child[0]);
    close(link_child[1]);
    throw std::runtime_error(string("fork failed: ") + strerror(forkErrno));
  }
}

ChildProcess::ReadStatus ChildProcess::readLine(string* line,
                                                int64_t timeoutMs) {
  auto deadline = std::chrono::steady_clock::now() +
                  std::chrono::milliseconds(timeoutMs);
  char buf[4096];
  while (true) {
    auto newline = readBuffer.find('\n');
    if (newline != string::npos) {
      *line = readBuffer.substr(0, newline);
      readBuffer.erase(0, newline + 1);
      return ReadStatus::Line;
    }
    int fd = stdoutFd;
    if (fd < 0) {
      return ReadStatus::End;
    }
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
                         deadline - std::chrono::steady_clock::now())
                         .count();
    if (remaining <= 0) {
      return ReadStatus::Timeout;
    }
    if (!FdUtils::waitForData(fd, std::min<int64_t>(remaining, 50))) {
      continue;
    }
    int rc = ::read(fd, buf, sizeof(buf));
    if (rc < 0) {
      if (GetErrno() == EINTR || GetErrno() == EAGAIN) {
        continue;
      }
      return ReadStatus::End;
    }
    if (rc == 0) {
      if (!readBuffer.empty()) {
        // Last line without a trailing newline
        line->swap(readBuffer);
        readBuffer.clear();
        return ReadStatus::Line;
      }
      return ReadStatus::End;
    }
    readBuffer.append(buf, rc);
  }
}

void ChildProcess::terminate() {
  lock_guard<mutex> guard(processMutex);
  if (pid > 0 && !status) {
    ::kill(-pid, SIGKILL);
    ::kill(pid, SIGKILL);
    int childStatus;
    if (waitpid(pid, &childStatus, 0) == pid) {
      status = WIFEXITED(childStatus) ? WEXITSTATUS(childStatus) : -1;
    } else {
      status = -1;
    }
    VLOG(1) << "Terminated pid " << pid;
  }
}

optional<int> ChildProcess::exitCode() {
  lock_guard<mutex> guard(processMutex);
  if (pid > 0 && !status) {
    int childStatus;
    pid_t rc = waitpid(pid, &childStatus, WNOHANG);
    if (rc == pid) {
      status = WIFEXITED(childStatus) ? WEXITSTATUS(childStatus) : -1;
    }
  }
  return status;
}
}  // namespace tether
