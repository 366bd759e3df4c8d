#include "Action.hpp"

#include "ProjectKey.hpp"
#include "TetherException.hpp"

namespace tether {
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(OpenProject, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CloseProject, index)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SwitchProject, index)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AddWorktree, path, branch)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SwitchWorktree, index)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RemoveWorktree, index)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SetDockerAvailable, available)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SetDockerServices, services)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExploreDir, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ExpandDirectory, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CollapseDirectory, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(RefreshDirectory, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(OpenFile, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(PinTab, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(CloseTab, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SwitchTab, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SetTabScroll, path, scroll_position)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(AddFileComment, path, content)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(LoadFileComments, path)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TerminalSpawned, worktree_id, session_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TerminalSpawnFailed, worktree_id, error)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(ResizeTerminal, session_id, cols, rows)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(WriteTerminal, session_id, data)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(KillTerminal, session_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TerminalOutput, session_id, data)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(TerminalExited, session_id)
NLOHMANN_DEFINE_TYPE_NON_INTRUSIVE(SubmitChatMessage, text)

// Kinds with optional fields, defaults or enums are spelled out.

void to_json(json &j, const SetEnvConfig &v) {
  j = json::object();
  j["tracked_patterns"] = v.tracked_patterns;
  j["auto_copy_enabled"] = v.auto_copy_enabled;
  putOptional(j, "source_worktree", v.source_worktree);
}

void from_json(const json &j, SetEnvConfig &v) {
  v.tracked_patterns = j.at("tracked_patterns").get<vector<string>>();
  v.auto_copy_enabled = j.at("auto_copy_enabled").get<bool>();
  v.source_worktree = getOptional<string>(j, "source_worktree");
}

void to_json(json &j, const SetActiveView &v) {
  j = json{{"view", activeViewName(v.view)}};
}

void from_json(const json &j, SetActiveView &v) {
  v.view = activeViewFromName(j.at("view").get<string>());
}

void to_json(json &j, const SetTheme &v) {
  j = json{{"theme", themeName(v.theme)}};
}

void from_json(const json &j, SetTheme &v) {
  v.theme = themeFromName(j.at("theme").get<string>());
}

void to_json(json &j, const SetDirectoryCache &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  j["path"] = v.path;
  j["entries"] = v.entries;
}

void from_json(const json &j, SetDirectoryCache &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.path = j.at("path").get<string>();
  v.entries = j.at("entries").get<vector<FileEntry>>();
}

void to_json(json &j, const DirectoryLoadFailed &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  j["path"] = v.path;
  j["error"] = v.error;
}

void from_json(const json &j, DirectoryLoadFailed &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.path = j.at("path").get<string>();
  v.error = j.at("error").get<string>();
}

void to_json(json &j, const SetFileComments &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  j["path"] = v.path;
  j["comments"] = v.comments;
}

void from_json(const json &j, SetFileComments &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.path = j.at("path").get<string>();
  v.comments = j.at("comments").get<vector<FileComment>>();
}

void to_json(json &j, const SpawnTerminal &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  j["cols"] = v.cols;
  j["rows"] = v.rows;
}

void from_json(const json &j, SpawnTerminal &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.cols = getOr<int>(j, "cols", DEFAULT_TERMINAL_COLS);
  v.rows = getOr<int>(j, "rows", DEFAULT_TERMINAL_ROWS);
}

void to_json(json &j, const UpdateChatMessage &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  putOptional(j, "message_id", v.message_id);
  j["delta"] = v.delta;
}

void from_json(const json &j, UpdateChatMessage &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.message_id = getOptional<string>(j, "message_id");
  v.delta = j.at("delta").get<string>();
}

void to_json(json &j, const CompleteChatMessage &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  putOptional(j, "message_id", v.message_id);
}

void from_json(const json &j, CompleteChatMessage &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.message_id = getOptional<string>(j, "message_id");
}

void to_json(json &j, const FailChatMessage &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
  putOptional(j, "message_id", v.message_id);
  j["error"] = v.error;
}

void from_json(const json &j, FailChatMessage &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
  v.message_id = getOptional<string>(j, "message_id");
  v.error = j.at("error").get<string>();
}

void to_json(json &j, const ClearChat &v) {
  j = json::object();
  putOptional(j, "worktree_id", v.worktree_id);
}

void from_json(const json &j, ClearChat &v) {
  v.worktree_id = getOptional<string>(j, "worktree_id");
}

namespace {
typedef std::function<ActionPayload(const json &)> PayloadParser;

template <typename T>
void registerKind(map<string, PayloadParser> *parsers) {
  (*parsers)[T::TYPE] = [](const json &payload) {
    return ActionPayload(payload.get<T>());
  };
}

template <size_t... I>
map<string, PayloadParser> buildParsers(std::index_sequence<I...>) {
  map<string, PayloadParser> parsers;
  (registerKind<std::variant_alternative_t<I, ActionPayload>>(&parsers), ...);
  return parsers;
}

const map<string, PayloadParser> &payloadParsers() {
  static const map<string, PayloadParser> parsers = buildParsers(
      std::make_index_sequence<std::variant_size_v<ActionPayload>>());
  return parsers;
}

void requireNonEmpty(const string &value, const char *field) {
  if (value.empty()) {
    throw TetherException(ErrorKind::InvalidAction,
                          string("Field must not be empty: ") + field);
  }
}

void requireAbsolute(const string &path) {
  requireNonEmpty(path, "path");
  if (path[0] != '/') {
    throw TetherException(ErrorKind::InvalidAction,
                          "Path must be absolute: " + path);
  }
}

void requireGeometry(int cols, int rows) {
  if (cols < 1 || cols > 1000 || rows < 1 || rows > 1000) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Invalid terminal size: " + to_string(cols) + "x" +
                              to_string(rows));
  }
}

void requireIndex(int index) {
  if (index < 0) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Invalid index: " + to_string(index));
  }
}

struct ActionValidator {
  void operator()(const OpenProject &a) { requireAbsolute(a.path); }
  void operator()(const CloseProject &a) { requireIndex(a.index); }
  void operator()(const SwitchProject &a) { requireIndex(a.index); }
  void operator()(const AddWorktree &a) {
    requireAbsolute(a.path);
    requireNonEmpty(a.branch, "branch");
  }
  void operator()(const SwitchWorktree &a) { requireIndex(a.index); }
  void operator()(const RemoveWorktree &a) { requireIndex(a.index); }
  void operator()(const SetEnvConfig &) {}
  void operator()(const SetActiveView &) {}
  void operator()(const SetTheme &) {}
  void operator()(const SetDockerAvailable &) {}
  void operator()(const SetDockerServices &) {}
  void operator()(const ExploreDir &a) { requireAbsolute(a.path); }
  void operator()(const ExpandDirectory &a) { requireAbsolute(a.path); }
  void operator()(const CollapseDirectory &a) { requireAbsolute(a.path); }
  void operator()(const RefreshDirectory &a) { requireAbsolute(a.path); }
  void operator()(const SetDirectoryCache &a) { requireAbsolute(a.path); }
  void operator()(const DirectoryLoadFailed &a) { requireAbsolute(a.path); }
  void operator()(const OpenFile &a) { requireNonEmpty(a.path, "path"); }
  void operator()(const PinTab &a) { requireNonEmpty(a.path, "path"); }
  void operator()(const CloseTab &a) { requireNonEmpty(a.path, "path"); }
  void operator()(const SwitchTab &a) { requireNonEmpty(a.path, "path"); }
  void operator()(const SetTabScroll &a) {
    requireNonEmpty(a.path, "path");
    if (a.scroll_position < 0) {
      throw TetherException(ErrorKind::InvalidAction,
                            "Scroll position must not be negative");
    }
  }
  void operator()(const AddFileComment &a) {
    requireNonEmpty(a.path, "path");
    requireNonEmpty(a.content, "content");
  }
  void operator()(const LoadFileComments &a) {
    requireNonEmpty(a.path, "path");
  }
  void operator()(const SetFileComments &a) {
    requireNonEmpty(a.path, "path");
  }
  void operator()(const SpawnTerminal &a) { requireGeometry(a.cols, a.rows); }
  void operator()(const TerminalSpawned &a) {
    requireNonEmpty(a.worktree_id, "worktree_id");
    requireNonEmpty(a.session_id, "session_id");
  }
  void operator()(const TerminalSpawnFailed &a) {
    requireNonEmpty(a.worktree_id, "worktree_id");
  }
  void operator()(const ResizeTerminal &a) {
    requireNonEmpty(a.session_id, "session_id");
    requireGeometry(a.cols, a.rows);
  }
  void operator()(const WriteTerminal &a) {
    requireNonEmpty(a.session_id, "session_id");
  }
  void operator()(const KillTerminal &a) {
    requireNonEmpty(a.session_id, "session_id");
  }
  void operator()(const TerminalOutput &a) {
    requireNonEmpty(a.session_id, "session_id");
  }
  void operator()(const TerminalExited &a) {
    requireNonEmpty(a.session_id, "session_id");
  }
  void operator()(const SubmitChatMessage &a) {
    if (a.text.find_first_not_of(" \t\r\n") == string::npos) {
      throw TetherException(ErrorKind::InvalidAction,
                            "Chat message must not be blank");
    }
  }
  void operator()(const UpdateChatMessage &) {}
  void operator()(const CompleteChatMessage &) {}
  void operator()(const FailChatMessage &) {}
  void operator()(const ClearChat &) {}
};
}  // namespace

const string &ActionMeta::id(size_t n) const {
  if (n >= ids.size()) {
    STFATAL << "Action was not stamped with enough ids: wanted " << (n + 1)
            << ", have " << ids.size();
  }
  return ids[n];
}

string actionTypeName(const Action &action) {
  return std::visit(
      [](const auto &payload) -> string {
        return std::decay_t<decltype(payload)>::TYPE;
      },
      action.payload);
}

bool isFollowUpAction(const Action &action) {
  static const set<string> followUps = {
      SetDirectoryCache::TYPE,   DirectoryLoadFailed::TYPE,
      SetFileComments::TYPE,     TerminalSpawned::TYPE,
      TerminalSpawnFailed::TYPE, TerminalOutput::TYPE,
      TerminalExited::TYPE,      UpdateChatMessage::TYPE,
      CompleteChatMessage::TYPE, FailChatMessage::TYPE,
  };
  return followUps.count(actionTypeName(action)) > 0;
}

Action parseAction(const json &envelope) {
  if (!envelope.is_object()) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Action envelope must be an object");
  }
  auto typeIt = envelope.find("type");
  if (typeIt == envelope.end() || !typeIt->is_string()) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Action envelope is missing a type");
  }
  const string type = typeIt->get<string>();
  const auto &parsers = payloadParsers();
  auto parserIt = parsers.find(type);
  if (parserIt == parsers.end()) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Unknown action type: " + type);
  }

  json payload = json::object();
  auto payloadIt = envelope.find("payload");
  if (payloadIt != envelope.end() && !payloadIt->is_null()) {
    payload = *payloadIt;
  }
  if (!payload.is_object()) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Payload of " + type + " must be an object");
  }

  Action action;
  try {
    action.payload = parserIt->second(payload);
  } catch (const json::exception &ex) {
    throw TetherException(ErrorKind::InvalidAction,
                          "Malformed payload for " + type + ": " + ex.what());
  }
  validateAction(action);
  return action;
}

Action parseAction(const string &text) {
  json envelope;
  try {
    envelope = json::parse(text);
  } catch (const json::parse_error &ex) {
    throw TetherException(ErrorKind::InvalidAction,
                          string("Action is not valid json: ") + ex.what());
  }
  return parseAction(envelope);
}

json actionToJson(const Action &action) {
  json envelope;
  envelope["type"] = actionTypeName(action);
  envelope["payload"] =
      std::visit([](const auto &payload) { return json(payload); },
                 action.payload);
  return envelope;
}

void validateAction(const Action &action) {
  std::visit(ActionValidator(), action.payload);
}
}  // namespace tether
