#include "Reducer.hpp"

#include "ChatReducer.hpp"
#include "ExplorerReducer.hpp"
#include "ProjectReducer.hpp"
#include "TerminalReducer.hpp"
#include "TetherException.hpp"

namespace tether {
namespace {
/**
 * Routes each action kind to the reducer for its area.  There is no generic
 * overload, so a new kind that is not handled here does not compile.
 */
struct ActionVisitor {
  ReduceContext &ctx;

  // Projects and global settings
  void operator()(const OpenProject &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const CloseProject &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SwitchProject &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const AddWorktree &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SwitchWorktree &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const RemoveWorktree &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SetEnvConfig &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SetActiveView &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SetTheme &a) { ProjectReducer::apply(ctx, a); }
  void operator()(const SetDockerAvailable &a) {
    ProjectReducer::apply(ctx, a);
  }
  void operator()(const SetDockerServices &a) {
    ProjectReducer::apply(ctx, a);
  }

  // Explorer
  void operator()(const ExploreDir &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const ExpandDirectory &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const CollapseDirectory &a) {
    ExplorerReducer::apply(ctx, a);
  }
  void operator()(const RefreshDirectory &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const SetDirectoryCache &a) {
    ExplorerReducer::apply(ctx, a);
  }
  void operator()(const DirectoryLoadFailed &a) {
    ExplorerReducer::apply(ctx, a);
  }
  void operator()(const OpenFile &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const PinTab &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const CloseTab &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const SwitchTab &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const SetTabScroll &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const AddFileComment &a) { ExplorerReducer::apply(ctx, a); }
  void operator()(const LoadFileComments &a) {
    ExplorerReducer::apply(ctx, a);
  }
  void operator()(const SetFileComments &a) { ExplorerReducer::apply(ctx, a); }

  // Terminal
  void operator()(const SpawnTerminal &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const TerminalSpawned &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const TerminalSpawnFailed &a) {
    TerminalReducer::apply(ctx, a);
  }
  void operator()(const ResizeTerminal &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const WriteTerminal &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const KillTerminal &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const TerminalOutput &a) { TerminalReducer::apply(ctx, a); }
  void operator()(const TerminalExited &a) { TerminalReducer::apply(ctx, a); }

  // Chat
  void operator()(const SubmitChatMessage &a) { ChatReducer::apply(ctx, a); }
  void operator()(const UpdateChatMessage &a) { ChatReducer::apply(ctx, a); }
  void operator()(const CompleteChatMessage &a) {
    ChatReducer::apply(ctx, a);
  }
  void operator()(const FailChatMessage &a) { ChatReducer::apply(ctx, a); }
  void operator()(const ClearChat &a) { ChatReducer::apply(ctx, a); }
};
}  // namespace

void ReduceContext::logActivity(const Project &project, const string &scope,
                                const string &level, const string &content) {
  PersistedRecord log;
  log.project_key = project.key;
  log.table = RecordTable::ActivityLogs;
  log.scope = scope;
  log.level = level;
  log.content = content;
  log.created_at = meta.timestamp_ms;
  record(std::move(log));
}

Worktree *ReduceContext::resolveWorktree(const optional<string> &worktreeId) {
  if (worktreeId) {
    return state().findWorktree(*worktreeId);
  }
  return state().activeWorktree();
}

Worktree &ReduceContext::requireActiveWorktree() {
  Worktree *worktree = state().activeWorktree();
  if (worktree == nullptr) {
    throw TetherException(ErrorKind::InvalidAction, "No active worktree");
  }
  return *worktree;
}

Project &ReduceContext::requireActiveProject() {
  Project *project = state().activeProject();
  if (project == nullptr) {
    throw TetherException(ErrorKind::InvalidAction, "No active project");
  }
  return *project;
}

ReduceResult Reducer::reduce(const AppState &state, const Action &action) {
  ReduceContext ctx(state, action.meta);
  std::visit(ActionVisitor{ctx}, action.payload);
  ctx.state().version = state.version + 1;
  return std::move(ctx.result);
}
}  // namespace tether
