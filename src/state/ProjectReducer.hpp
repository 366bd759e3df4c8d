#ifndef __TETHER_PROJECT_REDUCER__
#define __TETHER_PROJECT_REDUCER__

#include "Reducer.hpp"

namespace tether {
/**
 * @brief Transitions for the project list, worktrees and global settings.
 */
class ProjectReducer {
 public:
  static void apply(ReduceContext &ctx, const OpenProject &action);
  static void apply(ReduceContext &ctx, const CloseProject &action);
  static void apply(ReduceContext &ctx, const SwitchProject &action);
  static void apply(ReduceContext &ctx, const AddWorktree &action);
  static void apply(ReduceContext &ctx, const SwitchWorktree &action);
  static void apply(ReduceContext &ctx, const RemoveWorktree &action);
  static void apply(ReduceContext &ctx, const SetEnvConfig &action);
  static void apply(ReduceContext &ctx, const SetActiveView &action);
  static void apply(ReduceContext &ctx, const SetTheme &action);
  static void apply(ReduceContext &ctx, const SetDockerAvailable &action);
  static void apply(ReduceContext &ctx, const SetDockerServices &action);

  /** @brief Deterministic worktree id: hash of the path and the branch. */
  static string worktreeId(const string &path, const string &branch);

 protected:
  static Worktree makeWorktree(const string &path, const string &branch,
                               bool isMain);
  /** @brief Releases everything a worktree holds outside the state tree. */
  static void releaseWorktree(ReduceContext &ctx, const Worktree &worktree);
  static void touchRecent(AppState &state, const string &path);
};
}  // namespace tether

#endif  // __TETHER_PROJECT_REDUCER__
