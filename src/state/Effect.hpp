#ifndef __TETHER_EFFECT__
#define __TETHER_EFFECT__

#include "Headers.hpp"

namespace tether {
/**
 * @brief Side-effecting work requested by a transition.  The store runs
 * these after the new state is committed.
 */
struct SpawnSessionEffect {
  string worktree_id;
  string cwd;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

struct KillSessionEffect {
  string session_id;
};

/** @brief Kills every session that belongs to a removed worktree. */
struct KillWorktreeSessionsEffect {
  string worktree_id;
};

struct ResizeSessionEffect {
  string session_id;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

struct WriteSessionEffect {
  string session_id;
  string data;
};

struct StartCompletionEffect {
  string worktree_id;
  string message_id;
  string prompt;
  string cwd;
};

struct CancelCompletionEffect {
  string worktree_id;
};

struct LoadDirectoryEffect {
  string worktree_id;
  string path;
};

struct QueryCommentsEffect {
  string worktree_id;
  string project_key;
  string path;
};

using Effect =
    std::variant<SpawnSessionEffect, KillSessionEffect,
                 KillWorktreeSessionsEffect, ResizeSessionEffect,
                 WriteSessionEffect, StartCompletionEffect,
                 CancelCompletionEffect, LoadDirectoryEffect,
                 QueryCommentsEffect>;
}  // namespace tether

#endif  // __TETHER_EFFECT__
