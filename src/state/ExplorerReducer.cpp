#include "ExplorerReducer.hpp"

#include "ProjectKey.hpp"

namespace tether {
namespace {
vector<FileTab>::iterator findTab(ExplorerState &explorer,
                                  const string &path) {
  return std::find_if(
      explorer.open_tabs.begin(), explorer.open_tabs.end(),
      [&path](const FileTab &tab) { return tab.path == path; });
}
}  // namespace

vector<FileEntry> ExplorerReducer::sortEntries(vector<FileEntry> entries) {
  std::stable_sort(entries.begin(), entries.end(),
                   [](const FileEntry &a, const FileEntry &b) {
                     if (a.is_dir != b.is_dir) {
                       return a.is_dir;
                     }
                     return a.name < b.name;
                   });
  return entries;
}

void ExplorerReducer::requestLoad(ReduceContext &ctx, Worktree &worktree,
                                  const string &path) {
  ExplorerState &explorer = worktree.explorer;
  if (explorer.directory_cache.count(path) ||
      explorer.loading_paths.count(path)) {
    return;
  }
  explorer.loading_paths.insert(path);
  ctx.emit(LoadDirectoryEffect{worktree.id, path});
}

void ExplorerReducer::exploreDir(ReduceContext &ctx, Worktree &worktree,
                                 const string &path) {
  worktree.explorer.root_path = path;
  worktree.explorer.error.reset();
  requestLoad(ctx, worktree, path);
}

void ExplorerReducer::apply(ReduceContext &ctx, const ExploreDir &action) {
  exploreDir(ctx, ctx.requireActiveWorktree(), normalizePath(action.path));
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const ExpandDirectory &action) {
  Worktree &worktree = ctx.requireActiveWorktree();
  const string path = normalizePath(action.path);
  worktree.explorer.expanded_paths.insert(path);
  requestLoad(ctx, worktree, path);
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const CollapseDirectory &action) {
  Worktree &worktree = ctx.requireActiveWorktree();
  worktree.explorer.expanded_paths.erase(normalizePath(action.path));
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const RefreshDirectory &action) {
  Worktree &worktree = ctx.requireActiveWorktree();
  const string path = normalizePath(action.path);
  worktree.explorer.directory_cache.erase(path);
  requestLoad(ctx, worktree, path);
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const SetDirectoryCache &action) {
  Worktree *worktree = ctx.resolveWorktree(action.worktree_id);
  if (worktree == nullptr) {
    // The worktree went away while the read was running.
    return;
  }
  const string path = normalizePath(action.path);
  worktree->explorer.loading_paths.erase(path);
  worktree->explorer.directory_cache[path] = sortEntries(action.entries);
  worktree->explorer.error.reset();
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const DirectoryLoadFailed &action) {
  Worktree *worktree = ctx.resolveWorktree(action.worktree_id);
  if (worktree == nullptr) {
    return;
  }
  const string path = normalizePath(action.path);
  worktree->explorer.loading_paths.erase(path);
  worktree->explorer.error = path + ": " + action.error;
}

void ExplorerReducer::openFile(ExplorerState &explorer, const string &path) {
  auto existing = findTab(explorer, path);
  if (existing == explorer.open_tabs.end()) {
    auto preview = std::find_if(
        explorer.open_tabs.begin(), explorer.open_tabs.end(),
        [](const FileTab &tab) { return !tab.is_pinned; });
    if (preview != explorer.open_tabs.end()) {
      preview->path = path;
      preview->scroll_position = 0;
    } else {
      FileTab tab;
      tab.path = path;
      tab.is_pinned = false;
      explorer.open_tabs.push_back(tab);
    }
  }
  explorer.active_tab_path = path;
}

void ExplorerReducer::pinTab(ExplorerState &explorer, const string &path) {
  auto tab = findTab(explorer, path);
  if (tab != explorer.open_tabs.end()) {
    tab->is_pinned = true;
  }
}

void ExplorerReducer::closeTab(ExplorerState &explorer, const string &path) {
  auto tab = findTab(explorer, path);
  if (tab == explorer.open_tabs.end()) {
    return;
  }
  size_t index = tab - explorer.open_tabs.begin();
  explorer.open_tabs.erase(tab);
  if (!explorer.active_tab_path || *explorer.active_tab_path != path) {
    return;
  }
  if (explorer.open_tabs.empty()) {
    explorer.active_tab_path.reset();
  } else {
    index = std::min(index, explorer.open_tabs.size() - 1);
    explorer.active_tab_path = explorer.open_tabs[index].path;
  }
}

void ExplorerReducer::apply(ReduceContext &ctx, const OpenFile &action) {
  openFile(ctx.requireActiveWorktree().explorer, action.path);
}

void ExplorerReducer::apply(ReduceContext &ctx, const PinTab &action) {
  pinTab(ctx.requireActiveWorktree().explorer, action.path);
}

void ExplorerReducer::apply(ReduceContext &ctx, const CloseTab &action) {
  closeTab(ctx.requireActiveWorktree().explorer, action.path);
}

void ExplorerReducer::apply(ReduceContext &ctx, const SwitchTab &action) {
  ExplorerState &explorer = ctx.requireActiveWorktree().explorer;
  if (findTab(explorer, action.path) != explorer.open_tabs.end()) {
    explorer.active_tab_path = action.path;
  }
}

void ExplorerReducer::apply(ReduceContext &ctx, const SetTabScroll &action) {
  ExplorerState &explorer = ctx.requireActiveWorktree().explorer;
  auto tab = findTab(explorer, action.path);
  if (tab != explorer.open_tabs.end()) {
    tab->scroll_position = action.scroll_position;
  }
}

void ExplorerReducer::apply(ReduceContext &ctx, const AddFileComment &action) {
  Project &project = ctx.requireActiveProject();
  Worktree &worktree = ctx.requireActiveWorktree();

  FileComment comment;
  comment.path = action.path;
  comment.content = action.content;
  comment.author = "user";
  comment.created_at = ctx.meta.timestamp_ms;
  worktree.explorer.comments[action.path].push_back(comment);

  PersistedRecord record;
  record.project_key = project.key;
  record.table = RecordTable::FileComments;
  record.scope = action.path;
  record.content = action.content;
  record.author = comment.author;
  record.created_at = comment.created_at;
  ctx.record(std::move(record));

  // Reload once the row is written so the comment picks up its stored id.
  ctx.emit(QueryCommentsEffect{worktree.id, project.key, action.path});
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const LoadFileComments &action) {
  Project &project = ctx.requireActiveProject();
  Worktree &worktree = ctx.requireActiveWorktree();
  ctx.emit(QueryCommentsEffect{worktree.id, project.key, action.path});
}

void ExplorerReducer::apply(ReduceContext &ctx,
                            const SetFileComments &action) {
  Worktree *worktree = ctx.resolveWorktree(action.worktree_id);
  if (worktree == nullptr) {
    return;
  }
  worktree->explorer.comments[action.path] = action.comments;
}
}  // namespace tether
