#include "TerminalReducer.hpp"

#include "TetherException.hpp"

namespace tether {
namespace {
void resetSession(TerminalState &terminal) {
  terminal.session_id.reset();
  terminal.status = TerminalStatus::Idle;
  terminal.error.reset();
}
}  // namespace

void TerminalReducer::apply(ReduceContext &ctx, const SpawnTerminal &action) {
  Worktree *worktree = ctx.resolveWorktree(action.worktree_id);
  if (worktree == nullptr) {
    throw TetherException(ErrorKind::InvalidAction,
                          action.worktree_id
                              ? "Unknown worktree: " + *action.worktree_id
                              : string("No active worktree"));
  }
  TerminalState &terminal = worktree->terminal;
  if (terminal.session_id || terminal.status == TerminalStatus::Spawning) {
    VLOG(1) << "Terminal for " << worktree->id << " is already up";
    return;
  }
  terminal.status = TerminalStatus::Spawning;
  terminal.error.reset();
  terminal.cols = action.cols;
  terminal.rows = action.rows;
  ctx.emit(SpawnSessionEffect{worktree->id, worktree->path, action.cols,
                              action.rows});
}

void TerminalReducer::apply(ReduceContext &ctx,
                            const TerminalSpawned &action) {
  Worktree *worktree = ctx.state().findWorktree(action.worktree_id);
  if (worktree == nullptr ||
      worktree->terminal.status != TerminalStatus::Spawning) {
    // Nobody is waiting for this session any more.
    LOG(INFO) << "Discarding orphaned session " << action.session_id;
    ctx.emit(KillSessionEffect{action.session_id});
    return;
  }
  worktree->terminal.session_id = action.session_id;
  worktree->terminal.status = TerminalStatus::Running;
  worktree->terminal.error.reset();
  const Project *project = ctx.state().findProjectOfWorktree(worktree->id);
  ctx.logActivity(*project, "terminal", "info",
                  "Terminal started in " + worktree->path);
}

void TerminalReducer::apply(ReduceContext &ctx,
                            const TerminalSpawnFailed &action) {
  Worktree *worktree = ctx.state().findWorktree(action.worktree_id);
  if (worktree == nullptr) {
    return;
  }
  worktree->terminal.session_id.reset();
  worktree->terminal.status = TerminalStatus::Error;
  worktree->terminal.error = action.error;
  const Project *project = ctx.state().findProjectOfWorktree(worktree->id);
  ctx.logActivity(*project, "terminal", "error",
                  "Terminal failed to start: " + action.error);
}

void TerminalReducer::apply(ReduceContext &ctx, const ResizeTerminal &action) {
  Worktree *worktree = ctx.state().findWorktreeBySession(action.session_id);
  if (worktree != nullptr) {
    worktree->terminal.cols = action.cols;
    worktree->terminal.rows = action.rows;
  }
  ctx.emit(ResizeSessionEffect{action.session_id, action.cols, action.rows});
}

void TerminalReducer::apply(ReduceContext &ctx, const WriteTerminal &action) {
  ctx.emit(WriteSessionEffect{action.session_id, action.data});
}

void TerminalReducer::apply(ReduceContext &ctx, const KillTerminal &action) {
  Worktree *worktree = ctx.state().findWorktreeBySession(action.session_id);
  if (worktree != nullptr) {
    resetSession(worktree->terminal);
  }
  ctx.emit(KillSessionEffect{action.session_id});
}

void TerminalReducer::apply(ReduceContext &ctx, const TerminalOutput &action) {
  Worktree *worktree = ctx.state().findWorktreeBySession(action.session_id);
  if (worktree == nullptr) {
    return;
  }
  worktree->terminal.scrollback =
      appendScrollback(worktree->terminal.scrollback, action.data);
}

void TerminalReducer::apply(ReduceContext &ctx, const TerminalExited &action) {
  Worktree *worktree = ctx.state().findWorktreeBySession(action.session_id);
  if (worktree != nullptr) {
    resetSession(worktree->terminal);
    const Project *project = ctx.state().findProjectOfWorktree(worktree->id);
    ctx.logActivity(*project, "terminal", "info", "Terminal exited");
  }
  // Drops the registry entry in the same step that clears the id.
  ctx.emit(KillSessionEffect{action.session_id});
}
}  // namespace tether
