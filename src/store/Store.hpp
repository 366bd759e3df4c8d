#ifndef __TETHER_STORE__
#define __TETHER_STORE__

#include "Action.hpp"
#include "AppState.hpp"
#include "Broadcaster.hpp"
#include "DirectoryReader.hpp"
#include "Effect.hpp"
#include "EffectScheduler.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"
#include "RecordStore.hpp"
#include "SessionRegistry.hpp"
#include "SnapshotStore.hpp"
#include "TetherException.hpp"

namespace tether {
/** @brief Outcome of submitting one action. */
struct DispatchResult {
  bool ok = true;
  ErrorKind kind = ErrorKind::InvalidAction;
  string message;

  static DispatchResult success() { return DispatchResult(); }
  static DispatchResult failure(ErrorKind kind, const string &message) {
    DispatchResult result;
    result.ok = false;
    result.kind = kind;
    result.message = message;
    return result;
  }

  /** @brief `{"ok":bool,"error":{"kind","message"}?}` */
  json toJson() const;
};

/**
 * @brief Collaborators the store drives.  The record and snapshot stores
 * may be null, in which case nothing is persisted.
 */
struct StoreDependencies {
  shared_ptr<SessionRegistry> registry;
  shared_ptr<EffectScheduler> scheduler;
  shared_ptr<DirectoryReader> directoryReader;
  shared_ptr<RecordStore> recordStore;
  shared_ptr<SnapshotStore> snapshotStore;
};

/**
 * @brief Owns the canonical AppState and serializes every change to it.
 *
 * All actions, whether dispatched by a front end or posted by a background
 * producer, go through one FIFO queue drained by a single mutation thread.
 * Each action is stamped with a timestamp and fresh ids, reduced, and
 * committed: records are written, the new snapshot is published and
 * broadcast, and the resulting effects are started.  Subscribers are called
 * on the mutation thread and must not block on `dispatch`.
 */
class Store {
 public:
  typedef std::function<void()> Unsubscribe;
  typedef std::function<void(const DispatchResult &)> DoneCallback;

  explicit Store(const StoreDependencies &_deps,
                 const AppState &initialState = AppState(),
                 int backgroundThreads = 4);
  virtual ~Store();

  /**
   * @brief Submits an action and waits until it committed or was rejected.
   *
   * Calling this from the mutation thread (for example from a subscriber)
   * would deadlock, so it is rejected with InvalidAction.
   */
  DispatchResult dispatch(Action action);

  /** @brief Parses a `{type, payload}` envelope and dispatches it. */
  DispatchResult dispatchJson(const string &envelope);

  /**
   * @brief Queues an action without waiting.  `done` runs on the mutation
   * thread after the action was applied, or inline if the store has shut
   * down.
   */
  void post(Action action, DoneCallback done = nullptr);

  /** @brief Latest committed snapshot.  Never mutated after publication. */
  shared_ptr<const AppState> getState() const;

  /**
   * @brief Registers a callback that receives the serialized state after
   * every committed transition.
   */
  Unsubscribe subscribe(Broadcaster::Subscriber subscriber);

  /**
   * @brief Blocks until the queue is empty and no spawn or directory read
   * is outstanding.
   */
  void waitForIdle();

  /**
   * @brief Stops intake, drains the queue, cancels completions, kills all
   * sessions and saves the recovery snapshot.  Idempotent.
   */
  void shutdown();

  bool isMutationThread() const;

 protected:
  struct PendingAction {
    Action action;
    shared_ptr<std::promise<DispatchResult>> promise;
    DoneCallback done;
  };

  void stamp(Action *action);
  bool enqueue(PendingAction pending);
  void run();
  DispatchResult apply(const Action &action);
  void writeRecords(const vector<PersistedRecord> &records);
  void scheduleSnapshot(shared_ptr<const AppState> snapshot);

  /** @brief Queues work on the background pool, tracked for waitForIdle. */
  void runInBackground(std::function<void()> job);

  void runEffect(const SpawnSessionEffect &effect);
  void runEffect(const KillSessionEffect &effect);
  void runEffect(const KillWorktreeSessionsEffect &effect);
  void runEffect(const ResizeSessionEffect &effect);
  void runEffect(const WriteSessionEffect &effect);
  void runEffect(const StartCompletionEffect &effect);
  void runEffect(const CancelCompletionEffect &effect);
  void runEffect(const LoadDirectoryEffect &effect);
  void runEffect(const QueryCommentsEffect &effect);

  StoreDependencies deps;
  Broadcaster broadcaster;

  shared_ptr<const AppState> state;
  mutable mutex stateMutex;

  std::deque<PendingAction> queue;
  mutex queueMutex;
  condition_variable queueCv;
  condition_variable idleCv;
  bool stopping;
  bool busy;
  int backgroundJobs;

  unique_ptr<ThreadPool> backgroundPool;

  // Only the newest snapshot waiting to be written is kept.
  unique_ptr<ThreadPool> snapshotPool;
  shared_ptr<const AppState> pendingSnapshot;
  mutex snapshotMutex;

  thread mutationThread;
  atomic<std::thread::id> mutationThreadId;
  mutex shutdownMutex;
  bool shutdownDone;
};
}  // namespace tether

#endif  // __TETHER_STORE__
