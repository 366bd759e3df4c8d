#ifndef __TETHER_REDUCER__
#define __TETHER_REDUCER__

#include "Action.hpp"
#include "AppState.hpp"
#include "Effect.hpp"
#include "Headers.hpp"
#include "Record.hpp"

namespace tether {
/** @brief Output of one transition. */
struct ReduceResult {
  AppState state;
  vector<Effect> effects;
  vector<PersistedRecord> records;
};

/**
 * @brief Mutable scratch space handed to the per-area reducers while a
 * single action is applied.
 */
class ReduceContext {
 public:
  ReduceContext(const AppState &state, const ActionMeta &_meta)
      : meta(_meta) {
    result.state = state;
  }

  AppState &state() { return result.state; }

  void emit(Effect effect) { result.effects.push_back(std::move(effect)); }

  void record(PersistedRecord record) {
    result.records.push_back(std::move(record));
  }

  /** @brief Appends an activity log row for `project`. */
  void logActivity(const Project &project, const string &scope,
                   const string &level, const string &content);

  /**
   * @brief Resolves an optional worktree id: the named worktree, or the
   * active one when no id is given.  Returns nullptr if neither exists.
   */
  Worktree *resolveWorktree(const optional<string> &worktreeId);

  /**
   * @brief Returns the active worktree.
   * @throws TetherException(InvalidAction) when no project is open.
   */
  Worktree &requireActiveWorktree();

  /**
   * @brief Returns the active project.
   * @throws TetherException(InvalidAction) when no project is open.
   */
  Project &requireActiveProject();

  const ActionMeta &meta;
  ReduceResult result;
};

/**
 * @brief Pure transition function over the whole state tree.
 *
 * Equal inputs always produce equal outputs: ids and time come from the
 * action's metadata, never from the environment.
 */
class Reducer {
 public:
  /**
   * @brief Applies `action` to `state`.  The returned state has its version
   * bumped.
   * @throws TetherException(InvalidAction) if the action does not apply to
   * this state (for example an out-of-range index).  Nothing is changed in
   * that case.
   */
  static ReduceResult reduce(const AppState &state, const Action &action);
};
}  // namespace tether

#endif  // __TETHER_REDUCER__
