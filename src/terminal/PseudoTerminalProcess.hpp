#ifndef __TETHER_PSEUDO_TERMINAL_PROCESS__
#define __TETHER_PSEUDO_TERMINAL_PROCESS__

#include "PtyProcess.hpp"

namespace tether {
/**
 * @brief Forks a pseudo-terminal and runs a shell on it.
 *
 * The master side is non-blocking.  A failed chdir or exec in the child is
 * reported back to `start()` through a close-on-exec status pipe.
 */
class PseudoTerminalProcess : public PtyProcess {
 public:
  PseudoTerminalProcess();
  virtual ~PseudoTerminalProcess();

  virtual void start(const string &cwd, const string &shell, int cols,
                     int rows);
  virtual int readOutput(char *buf, size_t count, int64_t timeoutMs);
  virtual void write(const string &data);
  virtual void resize(int cols, int rows);
  virtual void terminate();
  virtual void reap();

  pid_t getPid() const { return childPid; }

 protected:
  /** @brief PID of the child shell spawned by `forkpty`. */
  pid_t childPid;
  /** @brief Master side of the pty. */
  int masterFd;
  bool reaped;
  atomic<bool> terminated;
  // Guards signalling against reaping so a recycled pid is never hit.
  mutex processMutex;
};
}  // namespace tether

#endif  // __TETHER_PSEUDO_TERMINAL_PROCESS__
