#include "ProjectReducer.hpp"

#include "ExplorerReducer.hpp"
#include "ProjectKey.hpp"
#include "TetherException.hpp"

namespace tether {
namespace {
int checkedIndex(int index, size_t size, const char *what) {
  if (index < 0 || index >= int(size)) {
    throw TetherException(ErrorKind::InvalidAction,
                          string(what) + " index out of range: " +
                              to_string(index));
  }
  return index;
}

string projectName(const string &path) {
  string name = fs::path(path).filename().string();
  return name.empty() ? path : name;
}
}  // namespace

string ProjectReducer::worktreeId(const string &path, const string &branch) {
  // NUL cannot appear in a path, so the concatenation is unambiguous.
  return hashToHex(normalizePath(path) + string(1, '\0') + branch);
}

Worktree ProjectReducer::makeWorktree(const string &path, const string &branch,
                                      bool isMain) {
  Worktree worktree;
  worktree.id = worktreeId(path, branch);
  worktree.path = path;
  worktree.branch = branch;
  worktree.is_main = isMain;
  return worktree;
}

void ProjectReducer::releaseWorktree(ReduceContext &ctx,
                                     const Worktree &worktree) {
  ctx.emit(KillWorktreeSessionsEffect{worktree.id});
  ctx.emit(CancelCompletionEffect{worktree.id});
}

void ProjectReducer::touchRecent(AppState &state, const string &path) {
  auto &recent = state.recent_projects;
  recent.erase(std::remove(recent.begin(), recent.end(), path), recent.end());
  recent.insert(recent.begin(), path);
  if (recent.size() > size_t(MAX_RECENT_PROJECTS)) {
    recent.resize(MAX_RECENT_PROJECTS);
  }
}

void ProjectReducer::apply(ReduceContext &ctx, const OpenProject &action) {
  AppState &state = ctx.state();
  const string path = normalizePath(action.path);
  touchRecent(state, path);

  for (int a = 0; a < int(state.projects.size()); a++) {
    if (state.projects[a].path == path) {
      state.active_project_index = a;
      return;
    }
  }

  Project project;
  project.path = path;
  project.key = ProjectKey::fromPath(path).hex();
  project.name = projectName(path);
  project.worktrees.push_back(makeWorktree(path, "main", true));
  project.active_worktree_index = 0;
  state.projects.push_back(std::move(project));
  state.active_project_index = int(state.projects.size()) - 1;

  Project &opened = state.projects.back();
  ExplorerReducer::exploreDir(ctx, opened.worktrees.front(), path);
  ctx.logActivity(opened, "project", "info", "Opened project " + path);
}

void ProjectReducer::apply(ReduceContext &ctx, const CloseProject &action) {
  AppState &state = ctx.state();
  int index = checkedIndex(action.index, state.projects.size(), "Project");
  const Project &closing = state.projects[index];
  for (const auto &worktree : closing.worktrees) {
    releaseWorktree(ctx, worktree);
  }
  ctx.logActivity(closing, "project", "info", "Closed project " + closing.path);
  state.projects.erase(state.projects.begin() + index);

  if (state.projects.empty()) {
    state.active_project_index.reset();
  } else if (state.active_project_index) {
    int active = *state.active_project_index;
    if (active > index) {
      active--;
    } else if (active == index) {
      active = std::min(index, int(state.projects.size()) - 1);
    }
    state.active_project_index = active;
  }
}

void ProjectReducer::apply(ReduceContext &ctx, const SwitchProject &action) {
  AppState &state = ctx.state();
  state.active_project_index =
      checkedIndex(action.index, state.projects.size(), "Project");
  touchRecent(state, state.projects[action.index].path);
}

void ProjectReducer::apply(ReduceContext &ctx, const AddWorktree &action) {
  Project &project = ctx.requireActiveProject();
  const string path = normalizePath(action.path);
  const string id = worktreeId(path, action.branch);
  for (int a = 0; a < int(project.worktrees.size()); a++) {
    if (project.worktrees[a].id == id) {
      project.active_worktree_index = a;
      return;
    }
  }
  project.worktrees.push_back(makeWorktree(path, action.branch, false));
  project.active_worktree_index = int(project.worktrees.size()) - 1;
  ExplorerReducer::exploreDir(ctx, project.worktrees.back(), path);
  ctx.logActivity(project, "worktree", "info",
                  "Added worktree " + action.branch + " at " + path);
}

void ProjectReducer::apply(ReduceContext &ctx, const SwitchWorktree &action) {
  Project &project = ctx.requireActiveProject();
  project.active_worktree_index =
      checkedIndex(action.index, project.worktrees.size(), "Worktree");
}

void ProjectReducer::apply(ReduceContext &ctx, const RemoveWorktree &action) {
  Project &project = ctx.requireActiveProject();
  int index =
      checkedIndex(action.index, project.worktrees.size(), "Worktree");
  const Worktree &removing = project.worktrees[index];
  if (removing.is_main) {
    throw TetherException(ErrorKind::InvalidAction,
                          "The main worktree cannot be removed");
  }
  releaseWorktree(ctx, removing);
  ctx.logActivity(project, "worktree", "info",
                  "Removed worktree " + removing.branch);
  project.worktrees.erase(project.worktrees.begin() + index);

  int active = project.active_worktree_index;
  if (active > index) {
    active--;
  } else if (active == index) {
    active = std::min(index, int(project.worktrees.size()) - 1);
  }
  project.active_worktree_index = active;
}

void ProjectReducer::apply(ReduceContext &ctx, const SetEnvConfig &action) {
  Project &project = ctx.requireActiveProject();
  project.env_config.tracked_patterns = action.tracked_patterns;
  project.env_config.auto_copy_enabled = action.auto_copy_enabled;
  project.env_config.source_worktree = action.source_worktree;
}

void ProjectReducer::apply(ReduceContext &ctx, const SetActiveView &action) {
  ctx.state().active_view = action.view;
}

void ProjectReducer::apply(ReduceContext &ctx, const SetTheme &action) {
  ctx.state().theme = action.theme;
}

void ProjectReducer::apply(ReduceContext &ctx,
                           const SetDockerAvailable &action) {
  ctx.state().docker.available = action.available;
}

void ProjectReducer::apply(ReduceContext &ctx,
                           const SetDockerServices &action) {
  ctx.state().docker.services = action.services;
}
}  // namespace tether
