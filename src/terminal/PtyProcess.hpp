#ifndef __TETHER_PTY_PROCESS__
#define __TETHER_PTY_PROCESS__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Abstract process attached to a pseudo-terminal.
 */
class PtyProcess {
 public:
  virtual ~PtyProcess() {}

  /**
   * @brief Launches `shell` inside `cwd` with the given window size.
   * @throws TetherException(SpawnFailure) if the process cannot start.
   */
  virtual void start(const string &cwd, const string &shell, int cols,
                     int rows) = 0;
  /**
   * @brief Reads terminal output, waiting at most `timeoutMs`.
   * @return Bytes read, 0 on timeout, or -1 once the terminal has closed.
   */
  virtual int readOutput(char *buf, size_t count, int64_t timeoutMs) = 0;
  /**
   * @brief Sends input bytes to the terminal.  Waits while the terminal is
   * not reading, and gives up with an error once terminate() was called.
   */
  virtual void write(const string &data) = 0;
  /** @brief Applies a new window size to the running terminal. */
  virtual void resize(int cols, int rows) = 0;
  /** @brief Kills the process group.  Idempotent. */
  virtual void terminate() = 0;
  /** @brief Blocks until the child has exited and reaps it. */
  virtual void reap() = 0;
};

typedef std::function<unique_ptr<PtyProcess>()> PtyProcessFactory;
}  // namespace tether

#endif  // __TETHER_PTY_PROCESS__
