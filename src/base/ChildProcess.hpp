#ifndef __TETHER_CHILD_PROCESS__
#define __TETHER_CHILD_PROCESS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Runs a command without a shell and exposes its stdout as lines.
 *
 * The child gets its own process group so that `terminate()` also takes
 * down anything it spawned.  Destroying the object terminates the child.
 */
class ChildProcess {
 public:
  enum class ReadStatus { Line, Timeout, End };

  ChildProcess() : pid(-1), stdoutFd(-1) {}
  ~ChildProcess();

  ChildProcess(const ChildProcess&) = delete;
  ChildProcess& operator=(const ChildProcess&) = delete;

  /**
   * @brief Forks and execs `command` with `args` inside `cwd`.
   * @throws std::runtime_error if the pipe or fork fails.  A failing exec is
   * reported by the child exiting with status 127.
   */
  void start(const string& command, const vector<string>& args,
             const string& cwd);

  /**
   * @brief Reads the next newline-terminated line from the child's stdout.
   * @param timeoutMs How long to wait for a complete line.
   */
  ReadStatus readLine(string* line, int64_t timeoutMs);

  /**
   * @brief Kills the process group and reaps the child.  Idempotent and safe
   * to call from another thread while `readLine` is blocked; the reader then
   * sees end of stream.
   */
  void terminate();

  /** @brief Reaps the child if it has exited and returns its exit code. */
  optional<int> exitCode();

  pid_t getPid() const { return pid; }

 protected:
  pid_t pid;
  int stdoutFd;
  string readBuffer;
  optional<int> status;
  mutex processMutex;
};
}  // namespace tether

#endif  // __TETHER_CHILD_PROCESS__
