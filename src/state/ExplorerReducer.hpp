#ifndef __TETHER_EXPLORER_REDUCER__
#define __TETHER_EXPLORER_REDUCER__

#include "Reducer.hpp"

namespace tether {
/**
 * @brief Transitions for the file explorer of a worktree: the directory
 * tree, its cache, open tabs and file comments.
 */
class ExplorerReducer {
 public:
  static void apply(ReduceContext &ctx, const ExploreDir &action);
  static void apply(ReduceContext &ctx, const ExpandDirectory &action);
  static void apply(ReduceContext &ctx, const CollapseDirectory &action);
  static void apply(ReduceContext &ctx, const RefreshDirectory &action);
  static void apply(ReduceContext &ctx, const SetDirectoryCache &action);
  static void apply(ReduceContext &ctx, const DirectoryLoadFailed &action);
  static void apply(ReduceContext &ctx, const OpenFile &action);
  static void apply(ReduceContext &ctx, const PinTab &action);
  static void apply(ReduceContext &ctx, const CloseTab &action);
  static void apply(ReduceContext &ctx, const SwitchTab &action);
  static void apply(ReduceContext &ctx, const SetTabScroll &action);
  static void apply(ReduceContext &ctx, const AddFileComment &action);
  static void apply(ReduceContext &ctx, const LoadFileComments &action);
  static void apply(ReduceContext &ctx, const SetFileComments &action);

  /** @brief Makes `path` the explorer root and loads it if needed. */
  static void exploreDir(ReduceContext &ctx, Worktree &worktree,
                         const string &path);

  /**
   * @brief Opens `path` as described for the preview tab: reuse an existing
   * tab, else replace the unpinned tab in place, else append a new
   * unpinned tab.  The opened tab becomes active.
   */
  static void openFile(ExplorerState &explorer, const string &path);
  static void pinTab(ExplorerState &explorer, const string &path);
  /**
   * @brief Removes a tab.  If it was active, the tab now at the same index
   * (or the one before it) becomes active.
   */
  static void closeTab(ExplorerState &explorer, const string &path);

  /** @brief Sorts entries directories first, then by name. */
  static vector<FileEntry> sortEntries(vector<FileEntry> entries);

 protected:
  /**
   * @brief Emits a directory read unless the listing is cached or a read is
   * already in flight.
   */
  static void requestLoad(ReduceContext &ctx, Worktree &worktree,
                          const string &path);
};
}  // namespace tether

#endif  // __TETHER_EXPLORER_REDUCER__
