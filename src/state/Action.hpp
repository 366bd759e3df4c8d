#ifndef __TETHER_ACTION__
#define __TETHER_ACTION__

#include "AppState.hpp"
#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tether {
// Projects

struct OpenProject {
  static constexpr const char *TYPE = "OpenProject";
  string path;
};

struct CloseProject {
  static constexpr const char *TYPE = "CloseProject";
  int index = 0;
};

struct SwitchProject {
  static constexpr const char *TYPE = "SwitchProject";
  int index = 0;
};

struct AddWorktree {
  static constexpr const char *TYPE = "AddWorktree";
  string path;
  string branch;
};

struct SwitchWorktree {
  static constexpr const char *TYPE = "SwitchWorktree";
  int index = 0;
};

struct RemoveWorktree {
  static constexpr const char *TYPE = "RemoveWorktree";
  int index = 0;
};

struct SetEnvConfig {
  static constexpr const char *TYPE = "SetEnvConfig";
  vector<string> tracked_patterns;
  bool auto_copy_enabled = false;
  optional<string> source_worktree;
};

// Global

struct SetActiveView {
  static constexpr const char *TYPE = "SetActiveView";
  ActiveView view = ActiveView::Explorer;
};

struct SetTheme {
  static constexpr const char *TYPE = "SetTheme";
  Theme theme = Theme::System;
};

struct SetDockerAvailable {
  static constexpr const char *TYPE = "SetDockerAvailable";
  bool available = false;
};

struct SetDockerServices {
  static constexpr const char *TYPE = "SetDockerServices";
  vector<DockerService> services;
};

// Explorer.  Results of background reads carry the worktree they were
// issued for; everything else targets the active worktree.

struct ExploreDir {
  static constexpr const char *TYPE = "ExploreDir";
  string path;
};

struct ExpandDirectory {
  static constexpr const char *TYPE = "ExpandDirectory";
  string path;
};

struct CollapseDirectory {
  static constexpr const char *TYPE = "CollapseDirectory";
  string path;
};

struct RefreshDirectory {
  static constexpr const char *TYPE = "RefreshDirectory";
  string path;
};

struct SetDirectoryCache {
  static constexpr const char *TYPE = "SetDirectoryCache";
  optional<string> worktree_id;
  string path;
  vector<FileEntry> entries;
};

struct DirectoryLoadFailed {
  static constexpr const char *TYPE = "DirectoryLoadFailed";
  optional<string> worktree_id;
  string path;
  string error;
};

struct OpenFile {
  static constexpr const char *TYPE = "OpenFile";
  string path;
};

struct PinTab {
  static constexpr const char *TYPE = "PinTab";
  string path;
};

struct CloseTab {
  static constexpr const char *TYPE = "CloseTab";
  string path;
};

struct SwitchTab {
  static constexpr const char *TYPE = "SwitchTab";
  string path;
};

struct SetTabScroll {
  static constexpr const char *TYPE = "SetTabScroll";
  string path;
  double scroll_position = 0;
};

struct AddFileComment {
  static constexpr const char *TYPE = "AddFileComment";
  string path;
  string content;
};

struct LoadFileComments {
  static constexpr const char *TYPE = "LoadFileComments";
  string path;
};

struct SetFileComments {
  static constexpr const char *TYPE = "SetFileComments";
  optional<string> worktree_id;
  string path;
  vector<FileComment> comments;
};

// Terminal

struct SpawnTerminal {
  static constexpr const char *TYPE = "SpawnTerminal";
  optional<string> worktree_id;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

struct TerminalSpawned {
  static constexpr const char *TYPE = "TerminalSpawned";
  string worktree_id;
  string session_id;
};

struct TerminalSpawnFailed {
  static constexpr const char *TYPE = "TerminalSpawnFailed";
  string worktree_id;
  string error;
};

struct ResizeTerminal {
  static constexpr const char *TYPE = "ResizeTerminal";
  string session_id;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
};

struct WriteTerminal {
  static constexpr const char *TYPE = "WriteTerminal";
  string session_id;
  string data;
};

struct KillTerminal {
  static constexpr const char *TYPE = "KillTerminal";
  string session_id;
};

struct TerminalOutput {
  static constexpr const char *TYPE = "TerminalOutput";
  string session_id;
  string data;
};

struct TerminalExited {
  static constexpr const char *TYPE = "TerminalExited";
  string session_id;
};

// Chat.  Omitted ids target the active worktree and its streaming message.

struct SubmitChatMessage {
  static constexpr const char *TYPE = "SubmitChatMessage";
  string text;
};

struct UpdateChatMessage {
  static constexpr const char *TYPE = "UpdateChatMessage";
  optional<string> worktree_id;
  optional<string> message_id;
  string delta;
};

struct CompleteChatMessage {
  static constexpr const char *TYPE = "CompleteChatMessage";
  optional<string> worktree_id;
  optional<string> message_id;
};

struct FailChatMessage {
  static constexpr const char *TYPE = "FailChatMessage";
  optional<string> worktree_id;
  optional<string> message_id;
  string error;
};

struct ClearChat {
  static constexpr const char *TYPE = "ClearChat";
  optional<string> worktree_id;
};

using ActionPayload =
    std::variant<OpenProject, CloseProject, SwitchProject, AddWorktree,
                 SwitchWorktree, RemoveWorktree, SetEnvConfig, SetActiveView,
                 SetTheme, SetDockerAvailable, SetDockerServices, ExploreDir,
                 ExpandDirectory, CollapseDirectory, RefreshDirectory,
                 SetDirectoryCache, DirectoryLoadFailed, OpenFile, PinTab,
                 CloseTab, SwitchTab, SetTabScroll, AddFileComment,
                 LoadFileComments, SetFileComments, SpawnTerminal,
                 TerminalSpawned, TerminalSpawnFailed, ResizeTerminal,
                 WriteTerminal, KillTerminal, TerminalOutput, TerminalExited,
                 SubmitChatMessage, UpdateChatMessage, CompleteChatMessage,
                 FailChatMessage, ClearChat>;

/**
 * @brief Inputs the reducer may not compute itself.  The store fills these
 * in before an action is queued so that reducing stays deterministic.
 */
struct ActionMeta {
  int64_t timestamp_ms = 0;
  // Fresh ids, consumed in order by reducers that create entities.
  vector<string> ids;

  /** @brief Returns the n-th generated id. */
  const string &id(size_t n) const;
};

/** @brief Number of ids the store generates for every action. */
const int ACTION_GENERATED_IDS = 2;

struct Action {
  Action() {}
  template <typename T, typename = typename std::enable_if<
                            !std::is_same<T, Action>::value>::type>
  Action(T _payload) : payload(std::move(_payload)) {}

  ActionPayload payload;
  ActionMeta meta;
};

/**
 * @brief Hands an action to the store without blocking.  `done` runs on the
 * mutation thread once the action committed or was rejected.
 */
using ActionPoster =
    std::function<void(Action action, std::function<void()> done)>;

/** @brief Returns the wire name of an action kind. */
string actionTypeName(const Action &action);

/**
 * @brief True for the results the store's own producers post back (spawn
 * and exit reports, terminal output, directory listings, loaded comments,
 * chat stream updates).  Front ends may not submit these.
 */
bool isFollowUpAction(const Action &action);

/**
 * @brief Parses a `{type, payload}` envelope.
 * @throws TetherException(InvalidAction) on unknown kinds or bad payloads.
 */
Action parseAction(const json &envelope);
Action parseAction(const string &text);

/** @brief Renders an action as a `{type, payload}` envelope. */
json actionToJson(const Action &action);

/**
 * @brief Rejects actions whose fields are out of range, regardless of state.
 * @throws TetherException(InvalidAction)
 */
void validateAction(const Action &action);
}  // namespace tether

#endif  // __TETHER_ACTION__
