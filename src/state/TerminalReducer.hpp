#ifndef __TETHER_TERMINAL_REDUCER__
#define __TETHER_TERMINAL_REDUCER__

#include "Reducer.hpp"

namespace tether {
/**
 * @brief Transitions for worktree terminals.  The state only tracks the
 * session id and status; the process itself lives in the SessionRegistry
 * and is driven through effects.
 */
class TerminalReducer {
 public:
  static void apply(ReduceContext &ctx, const SpawnTerminal &action);
  static void apply(ReduceContext &ctx, const TerminalSpawned &action);
  static void apply(ReduceContext &ctx, const TerminalSpawnFailed &action);
  static void apply(ReduceContext &ctx, const ResizeTerminal &action);
  static void apply(ReduceContext &ctx, const WriteTerminal &action);
  static void apply(ReduceContext &ctx, const KillTerminal &action);
  static void apply(ReduceContext &ctx, const TerminalOutput &action);
  static void apply(ReduceContext &ctx, const TerminalExited &action);
};
}  // namespace tether

#endif  // __TETHER_TERMINAL_REDUCER__
