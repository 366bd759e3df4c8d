#ifndef __TETHER_SESSION_REGISTRY__
#define __TETHER_SESSION_REGISTRY__

#include "Headers.hpp"
#include "PtyProcess.hpp"

namespace tether {
/**
 * @brief Owns the live terminal sessions, keyed by an opaque session id.
 *
 * Each session has an output pump thread that batches terminal output and
 * hands it to the output sink.  The sink acknowledges every chunk through
 * the callback it is given; at most `MAX_IN_FLIGHT_CHUNKS` chunks per
 * session may be unacknowledged.  While that many are pending and the
 * coalescing buffer is full the pump stops reading, so the child blocks on
 * a full pty instead of growing memory.
 *
 * Input goes the other way through a per-session writer thread, so
 * `write` only queues and never waits on a terminal that is not reading.
 * At most `MAX_PENDING_INPUT_BYTES` may be queued per session.
 */
class SessionRegistry {
 public:
  static const int MAX_IN_FLIGHT_CHUNKS = 4;
  static const size_t MAX_PENDING_INPUT_BYTES = 1024 * 1024;

  /**
   * @brief Receives a chunk of output.  `delivered` must be called once the
   * chunk has been consumed.
   */
  typedef std::function<void(const string &sessionId, const string &data,
                             std::function<void()> delivered)>
      OutputSink;
  /** @brief Told when a session's terminal closed on its own. */
  typedef std::function<void(const string &sessionId)> ExitSink;

  SessionRegistry(PtyProcessFactory _factory, const string &_shell);
  virtual ~SessionRegistry();

  void setSinks(OutputSink _outputSink, ExitSink _exitSink);

  /**
   * @brief Starts a shell for `worktreeId` in `cwd`.
   *
   * `onSpawned` runs after the session is registered and before its pump
   * starts, so anything it queues is ordered before the session's output.
   * @throws TetherException(SpawnFailure)
   */
  string spawn(const string &worktreeId, const string &cwd, int cols,
               int rows,
               const std::function<void(const string &)> &onSpawned = nullptr);

  /**
   * @brief Queues input for the session's terminal.  A write into an empty
   * queue is always accepted, whatever its size.
   * @throws TetherException(UnknownSession), or TetherException(InvalidAction)
   * when the queued input would exceed `MAX_PENDING_INPUT_BYTES`.
   */
  void write(const string &sessionId, const string &data);
  /** @throws TetherException(UnknownSession) */
  void resize(const string &sessionId, int cols, int rows);
  /**
   * @brief Kills the process, stops the pump and drops the entry.  Unknown
   * ids are ignored.
   */
  void kill(const string &sessionId);
  virtual void killWorktree(const string &worktreeId);
  void killAll();

  bool contains(const string &sessionId) const;
  size_t size() const;

  /** @brief `$SHELL` if set, else `/bin/sh`. */
  static string defaultShell();

 protected:
  struct Session;

  void pump(shared_ptr<Session> session);
  void writeInput(shared_ptr<Session> session);
  shared_ptr<Session> find(const string &sessionId) const;
  void stop(shared_ptr<Session> session);

  PtyProcessFactory factory;
  string shell;
  OutputSink outputSink;
  ExitSink exitSink;
  map<string, shared_ptr<Session>> sessions;
  mutable mutex registryMutex;
};
}  // namespace tether

#endif  // __TETHER_SESSION_REGISTRY__
