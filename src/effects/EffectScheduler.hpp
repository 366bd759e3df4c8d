#ifndef __TETHER_EFFECT_SCHEDULER__
#define __TETHER_EFFECT_SCHEDULER__

#include "Action.hpp"
#include "CompletionBackend.hpp"
#include "Headers.hpp"

namespace tether {
/**
 * @brief Runs chat completions off the mutation path and feeds their
 * progress back into the store as ordinary actions.
 *
 * There is at most one completion per worktree.  Starting a new one for a
 * worktree cancels the previous one.  Cancelled tasks stop posting.
 */
class EffectScheduler {
 public:
  explicit EffectScheduler(shared_ptr<CompletionBackend> _backend,
                           int maxConcurrent = 4);
  virtual ~EffectScheduler();

  void setPoster(ActionPoster _poster);

  void runChatCompletion(const CompletionRequest &request);
  void cancel(const string &worktreeId);
  void cancelAll();
  /** @brief Cancels everything and waits for the workers to finish. */
  void shutdown();

  /** @brief Number of completions that have not finished yet. */
  size_t inFlight() const;

 protected:
  struct Task;

  void runTask(shared_ptr<Task> task);
  void post(const shared_ptr<Task> &task, Action action);
  void finish(const shared_ptr<Task> &task);

  shared_ptr<CompletionBackend> backend;
  ActionPoster poster;
  map<string, shared_ptr<Task>> tasks;
  mutable mutex schedulerMutex;
  unique_ptr<ThreadPool> pool;
};
}  // namespace tether

#endif  // __TETHER_EFFECT_SCHEDULER__
