#include "AppState.hpp"

#include "TetherException.hpp"

namespace tether {
namespace {
template <typename E, size_t N>
string enumToName(E value, const std::array<pair<E, const char *>, N> &names) {
  for (const auto &it : names) {
    if (it.first == value) {
      return it.second;
    }
  }
  STFATAL << "Enum value without a name: " << int(value);
  return "";
}

template <typename E, size_t N>
E enumFromName(const string &name,
               const std::array<pair<E, const char *>, N> &names,
               const char *what) {
  for (const auto &it : names) {
    if (name == it.second) {
      return it.first;
    }
  }
  throw TetherException(ErrorKind::InvalidAction,
                        string("Unknown ") + what + ": " + name);
}

const std::array<pair<ActiveView, const char *>, 9> VIEW_NAMES = {{
    {ActiveView::Explorer, "explorer"},
    {ActiveView::Terminal, "terminal"},
    {ActiveView::Chat, "chat"},
    {ActiveView::Tasks, "tasks"},
    {ActiveView::Dockers, "dockers"},
    {ActiveView::Env, "env"},
    {ActiveView::Settings, "settings"},
    {ActiveView::Mcp, "mcp"},
    {ActiveView::Workflows, "workflows"},
}};

const std::array<pair<Theme, const char *>, 3> THEME_NAMES = {{
    {Theme::System, "system"},
    {Theme::Light, "light"},
    {Theme::Dark, "dark"},
}};

const std::array<pair<TerminalStatus, const char *>, 4> TERMINAL_STATUS_NAMES =
    {{
        {TerminalStatus::Idle, "idle"},
        {TerminalStatus::Spawning, "spawning"},
        {TerminalStatus::Running, "running"},
        {TerminalStatus::Error, "error"},
    }};

const std::array<pair<ChatRole, const char *>, 3> ROLE_NAMES = {{
    {ChatRole::User, "user"},
    {ChatRole::Assistant, "assistant"},
    {ChatRole::System, "system"},
}};

const std::array<pair<MessageStatus, const char *>, 3> MESSAGE_STATUS_NAMES = {{
    {MessageStatus::Streaming, "streaming"},
    {MessageStatus::Complete, "complete"},
    {MessageStatus::Error, "error"},
}};
}  // namespace

string activeViewName(ActiveView view) { return enumToName(view, VIEW_NAMES); }
ActiveView activeViewFromName(const string &name) {
  return enumFromName(name, VIEW_NAMES, "view");
}
string themeName(Theme theme) { return enumToName(theme, THEME_NAMES); }
Theme themeFromName(const string &name) {
  return enumFromName(name, THEME_NAMES, "theme");
}
string terminalStatusName(TerminalStatus status) {
  return enumToName(status, TERMINAL_STATUS_NAMES);
}
TerminalStatus terminalStatusFromName(const string &name) {
  return enumFromName(name, TERMINAL_STATUS_NAMES, "terminal status");
}
string chatRoleName(ChatRole role) { return enumToName(role, ROLE_NAMES); }
ChatRole chatRoleFromName(const string &name) {
  return enumFromName(name, ROLE_NAMES, "chat role");
}
string messageStatusName(MessageStatus status) {
  return enumToName(status, MESSAGE_STATUS_NAMES);
}
MessageStatus messageStatusFromName(const string &name) {
  return enumFromName(name, MESSAGE_STATUS_NAMES, "message status");
}

Worktree *Project::activeWorktree() {
  if (active_worktree_index < 0 ||
      active_worktree_index >= int(worktrees.size())) {
    return nullptr;
  }
  return &worktrees[active_worktree_index];
}

const Worktree *Project::activeWorktree() const {
  return const_cast<Project *>(this)->activeWorktree();
}

Project *AppState::activeProject() {
  if (!active_project_index || *active_project_index < 0 ||
      *active_project_index >= int(projects.size())) {
    return nullptr;
  }
  return &projects[*active_project_index];
}

const Project *AppState::activeProject() const {
  return const_cast<AppState *>(this)->activeProject();
}

Worktree *AppState::activeWorktree() {
  Project *project = activeProject();
  return project ? project->activeWorktree() : nullptr;
}

const Worktree *AppState::activeWorktree() const {
  return const_cast<AppState *>(this)->activeWorktree();
}

Worktree *AppState::findWorktree(const string &worktreeId) {
  for (auto &project : projects) {
    for (auto &worktree : project.worktrees) {
      if (worktree.id == worktreeId) {
        return &worktree;
      }
    }
  }
  return nullptr;
}

const Worktree *AppState::findWorktree(const string &worktreeId) const {
  return const_cast<AppState *>(this)->findWorktree(worktreeId);
}

const Project *AppState::findProjectOfWorktree(const string &worktreeId) const {
  for (const auto &project : projects) {
    for (const auto &worktree : project.worktrees) {
      if (worktree.id == worktreeId) {
        return &project;
      }
    }
  }
  return nullptr;
}

Worktree *AppState::findWorktreeBySession(const string &sessionId) {
  for (auto &project : projects) {
    for (auto &worktree : project.worktrees) {
      if (worktree.terminal.session_id &&
          *worktree.terminal.session_id == sessionId) {
        return &worktree;
      }
    }
  }
  return nullptr;
}

const Worktree *AppState::findWorktreeBySession(const string &sessionId) const {
  return const_cast<AppState *>(this)->findWorktreeBySession(sessionId);
}

bool operator==(const AppState &a, const AppState &b) {
  return json(a) == json(b);
}

bool operator!=(const AppState &a, const AppState &b) { return !(a == b); }

string appendScrollback(const string &existing, const string &data) {
  if (data.length() >= MAX_SCROLLBACK_BYTES) {
    return data.substr(data.length() - MAX_SCROLLBACK_BYTES);
  }
  string result = existing;
  result.append(data);
  if (result.length() > MAX_SCROLLBACK_BYTES) {
    result.erase(0, result.length() - MAX_SCROLLBACK_BYTES);
  }
  return result;
}

AppState sanitizeForRecovery(AppState state) {
  for (auto &project : state.projects) {
    for (auto &worktree : project.worktrees) {
      worktree.terminal.session_id.reset();
      if (worktree.terminal.status != TerminalStatus::Error) {
        worktree.terminal.status = TerminalStatus::Idle;
      }
      worktree.explorer.loading_paths.clear();
      for (auto &message : worktree.chat.messages) {
        if (message.status == MessageStatus::Streaming) {
          message.status = MessageStatus::Error;
          message.error = string("interrupted");
        }
      }
      worktree.chat.streaming_message_id.reset();
    }
  }
  return state;
}

void to_json(json &j, const FileEntry &v) {
  j = json{{"name", v.name},
           {"path", v.path},
           {"is_dir", v.is_dir},
           {"size", v.size}};
}

void from_json(const json &j, FileEntry &v) {
  v.name = j.at("name").get<string>();
  v.path = j.at("path").get<string>();
  v.is_dir = getOr<bool>(j, "is_dir", false);
  v.size = getOr<int64_t>(j, "size", 0);
}

void to_json(json &j, const FileTab &v) {
  j = json{{"path", v.path},
           {"is_pinned", v.is_pinned},
           {"scroll_position", v.scroll_position}};
}

void from_json(const json &j, FileTab &v) {
  v.path = j.at("path").get<string>();
  v.is_pinned = getOr<bool>(j, "is_pinned", false);
  v.scroll_position = getOr<double>(j, "scroll_position", 0);
}

void to_json(json &j, const FileComment &v) {
  j = json{{"id", v.id},
           {"path", v.path},
           {"content", v.content},
           {"author", v.author},
           {"created_at", v.created_at}};
}

void from_json(const json &j, FileComment &v) {
  v.id = getOr<int64_t>(j, "id", 0);
  v.path = j.at("path").get<string>();
  v.content = j.at("content").get<string>();
  v.author = getOr<string>(j, "author", "");
  v.created_at = getOr<int64_t>(j, "created_at", 0);
}

void to_json(json &j, const ExplorerState &v) {
  j = json::object();
  j["root_path"] = v.root_path;
  j["expanded_paths"] = v.expanded_paths;
  j["directory_cache"] = v.directory_cache;
  j["loading_paths"] = v.loading_paths;
  j["open_tabs"] = v.open_tabs;
  putOptional(j, "active_tab_path", v.active_tab_path);
  j["comments"] = v.comments;
  putOptional(j, "error", v.error);
}

void from_json(const json &j, ExplorerState &v) {
  v.root_path = getOr<string>(j, "root_path", "");
  v.expanded_paths = getOr<set<string>>(j, "expanded_paths", {});
  v.directory_cache =
      getOr<map<string, vector<FileEntry>>>(j, "directory_cache", {});
  v.loading_paths = getOr<set<string>>(j, "loading_paths", {});
  v.open_tabs = getOr<vector<FileTab>>(j, "open_tabs", {});
  v.active_tab_path = getOptional<string>(j, "active_tab_path");
  v.comments = getOr<map<string, vector<FileComment>>>(j, "comments", {});
  v.error = getOptional<string>(j, "error");
}

void to_json(json &j, const TerminalState &v) {
  j = json::object();
  putOptional(j, "session_id", v.session_id);
  j["status"] = terminalStatusName(v.status);
  putOptional(j, "error", v.error);
  j["cols"] = v.cols;
  j["rows"] = v.rows;
  string encoded;
  if (!Base64::Encode(v.scrollback, &encoded)) {
    STFATAL << "b64 encode failed";
  }
  j["scrollback"] = encoded;
}

void from_json(const json &j, TerminalState &v) {
  v.session_id = getOptional<string>(j, "session_id");
  v.status = terminalStatusFromName(getOr<string>(j, "status", "idle"));
  v.error = getOptional<string>(j, "error");
  v.cols = getOr<int>(j, "cols", DEFAULT_TERMINAL_COLS);
  v.rows = getOr<int>(j, "rows", DEFAULT_TERMINAL_ROWS);
  v.scrollback.clear();
  string encoded = getOr<string>(j, "scrollback", "");
  if (!encoded.empty() && !Base64::Decode(encoded, &v.scrollback)) {
    throw TetherException(ErrorKind::InvalidAction,
                          "b64 decode of scrollback failed");
  }
}

void to_json(json &j, const ChatMessage &v) {
  j = json::object();
  j["id"] = v.id;
  j["role"] = chatRoleName(v.role);
  j["content"] = v.content;
  j["timestamp"] = v.timestamp;
  j["status"] = messageStatusName(v.status);
  putOptional(j, "error", v.error);
}

void from_json(const json &j, ChatMessage &v) {
  v.id = j.at("id").get<string>();
  v.role = chatRoleFromName(j.at("role").get<string>());
  v.content = getOr<string>(j, "content", "");
  v.timestamp = getOr<int64_t>(j, "timestamp", 0);
  v.status = messageStatusFromName(getOr<string>(j, "status", "complete"));
  v.error = getOptional<string>(j, "error");
}

void to_json(json &j, const ChatState &v) {
  j = json::object();
  j["messages"] = v.messages;
  putOptional(j, "streaming_message_id", v.streaming_message_id);
  putOptional(j, "error", v.error);
}

void from_json(const json &j, ChatState &v) {
  v.messages = getOr<vector<ChatMessage>>(j, "messages", {});
  v.streaming_message_id = getOptional<string>(j, "streaming_message_id");
  v.error = getOptional<string>(j, "error");
}

void to_json(json &j, const Worktree &v) {
  j = json{{"id", v.id},           {"path", v.path},
           {"branch", v.branch},   {"is_main", v.is_main},
           {"explorer", v.explorer}, {"terminal", v.terminal},
           {"chat", v.chat}};
}

void from_json(const json &j, Worktree &v) {
  v.id = j.at("id").get<string>();
  v.path = j.at("path").get<string>();
  v.branch = j.at("branch").get<string>();
  v.is_main = getOr<bool>(j, "is_main", false);
  v.explorer = getOr<ExplorerState>(j, "explorer", ExplorerState());
  v.terminal = getOr<TerminalState>(j, "terminal", TerminalState());
  v.chat = getOr<ChatState>(j, "chat", ChatState());
}

void to_json(json &j, const EnvConfig &v) {
  j = json::object();
  j["tracked_patterns"] = v.tracked_patterns;
  j["auto_copy_enabled"] = v.auto_copy_enabled;
  putOptional(j, "source_worktree", v.source_worktree);
}

void from_json(const json &j, EnvConfig &v) {
  v.tracked_patterns = getOr<vector<string>>(j, "tracked_patterns", {});
  v.auto_copy_enabled = getOr<bool>(j, "auto_copy_enabled", false);
  v.source_worktree = getOptional<string>(j, "source_worktree");
}

void to_json(json &j, const Project &v) {
  j = json{{"path", v.path},
           {"key", v.key},
           {"name", v.name},
           {"worktrees", v.worktrees},
           {"active_worktree_index", v.active_worktree_index},
           {"env_config", v.env_config}};
}

void from_json(const json &j, Project &v) {
  v.path = j.at("path").get<string>();
  v.key = j.at("key").get<string>();
  v.name = getOr<string>(j, "name", "");
  v.worktrees = getOr<vector<Worktree>>(j, "worktrees", {});
  v.active_worktree_index = getOr<int>(j, "active_worktree_index", 0);
  v.env_config = getOr<EnvConfig>(j, "env_config", EnvConfig());
}

void to_json(json &j, const DockerService &v) {
  j = json::object();
  j["id"] = v.id;
  j["name"] = v.name;
  j["image"] = v.image;
  j["status"] = v.status;
  putOptional(j, "port", v.port);
}

void from_json(const json &j, DockerService &v) {
  v.id = j.at("id").get<string>();
  v.name = getOr<string>(j, "name", "");
  v.image = getOr<string>(j, "image", "");
  v.status = getOr<string>(j, "status", "");
  v.port = getOptional<int>(j, "port");
}

void to_json(json &j, const DockerState &v) {
  j = json{{"available", v.available}, {"services", v.services}};
}

void from_json(const json &j, DockerState &v) {
  v.available = getOr<bool>(j, "available", false);
  v.services = getOr<vector<DockerService>>(j, "services", {});
}

void to_json(json &j, const AppState &v) {
  j = json::object();
  j["version"] = v.version;
  j["projects"] = v.projects;
  putOptional(j, "active_project_index", v.active_project_index);
  j["active_view"] = activeViewName(v.active_view);
  j["theme"] = themeName(v.theme);
  j["recent_projects"] = v.recent_projects;
  j["docker"] = v.docker;
}

void from_json(const json &j, AppState &v) {
  v.version = getOr<int64_t>(j, "version", 0);
  v.projects = getOr<vector<Project>>(j, "projects", {});
  v.active_project_index = getOptional<int>(j, "active_project_index");
  v.active_view = activeViewFromName(getOr<string>(j, "active_view", "explorer"));
  v.theme = themeFromName(getOr<string>(j, "theme", "system"));
  v.recent_projects = getOr<vector<string>>(j, "recent_projects", {});
  v.docker = getOr<DockerState>(j, "docker", DockerState());
}
}  // namespace tether
