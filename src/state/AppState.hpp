#ifndef __TETHER_APP_STATE__
#define __TETHER_APP_STATE__

#include "Headers.hpp"
#include "JsonLib.hpp"

namespace tether {
const int MAX_CHAT_MESSAGES = 100;
const int MAX_RECENT_PROJECTS = 10;
const size_t MAX_SCROLLBACK_BYTES = 64 * 1024;

enum class ActiveView {
  Explorer,
  Terminal,
  Chat,
  Tasks,
  Dockers,
  Env,
  Settings,
  Mcp,
  Workflows,
};

enum class Theme { System, Light, Dark };

enum class TerminalStatus { Idle, Spawning, Running, Error };

enum class ChatRole { User, Assistant, System };

enum class MessageStatus { Streaming, Complete, Error };

/** @brief One entry of a directory listing. */
struct FileEntry {
  string name;
  string path;
  bool is_dir = false;
  int64_t size = 0;
};

/** @brief An open editor tab.  At most one tab is unpinned (the preview). */
struct FileTab {
  string path;
  bool is_pinned = false;
  double scroll_position = 0;
};

/** @brief A comment attached to a file, as stored in `file_comments`. */
struct FileComment {
  int64_t id = 0;
  string path;
  string content;
  string author;
  int64_t created_at = 0;
};

struct ExplorerState {
  string root_path;
  set<string> expanded_paths;
  map<string, vector<FileEntry>> directory_cache;
  // Reads in flight, so a second expand does not read the directory again.
  set<string> loading_paths;
  vector<FileTab> open_tabs;
  optional<string> active_tab_path;
  map<string, vector<FileComment>> comments;
  optional<string> error;
};

/**
 * @brief Serializable view of a worktree's terminal.  The live process is
 * owned by the SessionRegistry and only referenced here by id.
 */
struct TerminalState {
  optional<string> session_id;
  TerminalStatus status = TerminalStatus::Idle;
  optional<string> error;
  int cols = DEFAULT_TERMINAL_COLS;
  int rows = DEFAULT_TERMINAL_ROWS;
  // Raw bytes; base64 on the wire.
  string scrollback;
};

struct ChatMessage {
  string id;
  ChatRole role = ChatRole::User;
  string content;
  int64_t timestamp = 0;
  MessageStatus status = MessageStatus::Complete;
  optional<string> error;
};

struct ChatState {
  vector<ChatMessage> messages;
  optional<string> streaming_message_id;
  optional<string> error;
};

struct Worktree {
  string id;
  string path;
  string branch;
  bool is_main = false;
  ExplorerState explorer;
  TerminalState terminal;
  ChatState chat;
};

struct EnvConfig {
  vector<string> tracked_patterns;
  bool auto_copy_enabled = false;
  optional<string> source_worktree;
};

struct Project {
  string path;
  // 32 hex chars, derived once when the project is opened.
  string key;
  string name;
  vector<Worktree> worktrees;
  int active_worktree_index = 0;
  EnvConfig env_config;

  Worktree *activeWorktree();
  const Worktree *activeWorktree() const;
};

struct DockerService {
  string id;
  string name;
  string image;
  string status;
  optional<int> port;
};

struct DockerState {
  bool available = false;
  vector<DockerService> services;
};

/**
 * @brief Root of the state tree.  Published versions are immutable; every
 * committed transition produces a new AppState.
 */
struct AppState {
  int64_t version = 0;
  vector<Project> projects;
  optional<int> active_project_index;
  ActiveView active_view = ActiveView::Explorer;
  Theme theme = Theme::System;
  vector<string> recent_projects;
  DockerState docker;

  Project *activeProject();
  const Project *activeProject() const;
  Worktree *activeWorktree();
  const Worktree *activeWorktree() const;
  Worktree *findWorktree(const string &worktreeId);
  const Worktree *findWorktree(const string &worktreeId) const;
  /** @brief Returns the project that owns a worktree, or nullptr. */
  const Project *findProjectOfWorktree(const string &worktreeId) const;
  /** @brief Returns the worktree whose terminal holds `sessionId`. */
  Worktree *findWorktreeBySession(const string &sessionId);
  const Worktree *findWorktreeBySession(const string &sessionId) const;
};

bool operator==(const AppState &a, const AppState &b);
bool operator!=(const AppState &a, const AppState &b);

/**
 * @brief Appends terminal output, keeping only the newest
 * `MAX_SCROLLBACK_BYTES` bytes.
 */
string appendScrollback(const string &existing, const string &data);

/**
 * @brief Clears what cannot survive a restart: live sessions, directory
 * reads in flight and messages that were still streaming.
 */
AppState sanitizeForRecovery(AppState state);

string activeViewName(ActiveView view);
/** @throws TetherException(InvalidAction) on an unknown name. */
ActiveView activeViewFromName(const string &name);
string themeName(Theme theme);
Theme themeFromName(const string &name);
string terminalStatusName(TerminalStatus status);
TerminalStatus terminalStatusFromName(const string &name);
string chatRoleName(ChatRole role);
ChatRole chatRoleFromName(const string &name);
string messageStatusName(MessageStatus status);
MessageStatus messageStatusFromName(const string &name);

void to_json(json &j, const FileEntry &v);
void from_json(const json &j, FileEntry &v);
void to_json(json &j, const FileTab &v);
void from_json(const json &j, FileTab &v);
void to_json(json &j, const FileComment &v);
void from_json(const json &j, FileComment &v);
void to_json(json &j, const ExplorerState &v);
void from_json(const json &j, ExplorerState &v);
void to_json(json &j, const TerminalState &v);
void from_json(const json &j, TerminalState &v);
void to_json(json &j, const ChatMessage &v);
void from_json(const json &j, ChatMessage &v);
void to_json(json &j, const ChatState &v);
void from_json(const json &j, ChatState &v);
void to_json(json &j, const Worktree &v);
void from_json(const json &j, Worktree &v);
void to_json(json &j, const EnvConfig &v);
void from_json(const json &j, EnvConfig &v);
void to_json(json &j, const Project &v);
void from_json(const json &j, Project &v);
void to_json(json &j, const DockerService &v);
void from_json(const json &j, DockerService &v);
void to_json(json &j, const DockerState &v);
void from_json(const json &j, DockerState &v);
void to_json(json &j, const AppState &v);
void from_json(const json &j, AppState &v);
}  // namespace tether

#endif  // __TETHER_APP_STATE__
