#include "Store.hpp"

#include "FakeCompletionBackend.hpp"
#include "FakeDirectoryReader.hpp"
#include "FakePtyProcess.hpp"
#include "TestHeaders.hpp"

using namespace tether;

namespace {
/** @brief A store wired to in-memory collaborators. */
class StoreHarness {
 public:
  explicit StoreHarness(shared_ptr<SnapshotStore> snapshotStore = nullptr,
                        const AppState &initialState = AppState(),
                        shared_ptr<SessionRegistry> registry = nullptr)
      : backend(new FakeCompletionBackend()),
        reader(new FakeDirectoryReader()) {
    deps.registry = registry;
    if (!deps.registry) {
      deps.registry.reset(new SessionRegistry(ptys.factory(), "/bin/sh"));
    }
    deps.scheduler.reset(new EffectScheduler(backend));
    deps.directoryReader = reader;
    deps.recordStore.reset(new RecordStore(":memory:"));
    deps.snapshotStore = snapshotStore;
    store.reset(new Store(deps, initialState));
  }

  ~StoreHarness() { store.reset(); }

  DispatchResult dispatchAndSettle(Action action) {
    DispatchResult result = store->dispatch(std::move(action));
    store->waitForIdle();
    return result;
  }

  shared_ptr<const AppState> state() { return store->getState(); }

  // Valid until the next call.
  const Worktree &worktree() {
    current = store->getState();
    return *current->activeWorktree();
  }

  FakePtyFactory ptys;
  shared_ptr<FakeCompletionBackend> backend;
  shared_ptr<FakeDirectoryReader> reader;
  StoreDependencies deps;
  unique_ptr<Store> store;
  shared_ptr<const AppState> current;
};

/** @brief Kills like the real registry, then fails the way a join can. */
class FailingKillRegistry : public SessionRegistry {
 public:
  explicit FailingKillRegistry(PtyProcessFactory factory)
      : SessionRegistry(factory, "/bin/sh") {}

  virtual void killWorktree(const string &worktreeId) {
    SessionRegistry::killWorktree(worktreeId);
    throw std::system_error(
        std::make_error_code(std::errc::resource_deadlock_would_occur));
  }
};

FileEntry entry(const string &dir, const string &name, bool isDir) {
  FileEntry e;
  e.name = name;
  e.path = dir + "/" + name;
  e.is_dir = isDir;
  return e;
}
}  // namespace

TEST_CASE("Concurrent dispatches are applied one at a time", "[Store]") {
  StoreHarness harness;
  mutex versionsMutex;
  vector<int64_t> versions;
  bool snapshotsMatch = true;
  auto unsubscribe = harness.store->subscribe(
      [&](const string &snapshot, int64_t version) {
        lock_guard<mutex> guard(versionsMutex);
        if (json::parse(snapshot)["version"].get<int64_t>() != version) {
          snapshotsMatch = false;
        }
        versions.push_back(version);
      });

  const int threads = 8;
  const int perThread = 25;
  vector<std::thread> workers;
  for (int t = 0; t < threads; t++) {
    workers.emplace_back([&harness, t] {
      for (int a = 0; a < perThread; a++) {
        DispatchResult result = harness.store->dispatch(
            SetDockerAvailable{(t + a) % 2 == 0});
        if (!result.ok) {
          throw std::runtime_error(result.message);
        }
      }
    });
  }
  for (auto &worker : workers) {
    worker.join();
  }
  harness.store->waitForIdle();
  unsubscribe();

  REQUIRE(harness.state()->version == threads * perThread);
  lock_guard<mutex> guard(versionsMutex);
  REQUIRE(snapshotsMatch);
  REQUIRE(int(versions.size()) == threads * perThread);
  for (int a = 0; a < int(versions.size()); a++) {
    REQUIRE(versions[a] == a + 1);
  }
}

TEST_CASE("Rejected actions leave the state untouched", "[Store]") {
  StoreHarness harness;
  auto before = harness.state();

  DispatchResult result = harness.store->dispatch(ExpandDirectory{"/src"});
  REQUIRE(!result.ok);
  REQUIRE(result.kind == ErrorKind::InvalidAction);

  result = harness.store->dispatchJson(R"({"type":"NoSuchAction"})");
  REQUIRE(!result.ok);
  REQUIRE(result.toJson()["error"]["kind"] == "InvalidAction");

  result = harness.store->dispatchJson("{broken");
  REQUIRE(!result.ok);

  result = harness.store->dispatch(SpawnTerminal{nullopt, 0, 24});
  REQUIRE(!result.ok);

  REQUIRE(harness.state() == before);
  REQUIRE(harness.state()->version == 0);
}

TEST_CASE("Envelopes are dispatched like actions", "[Store]") {
  StoreHarness harness;
  DispatchResult result = harness.store->dispatchJson(
      R"({"type":"OpenProject","payload":{"path":"/repo"}})");
  REQUIRE(result.ok);
  REQUIRE(result.toJson() == json{{"ok", true}});
  harness.store->waitForIdle();
  REQUIRE(harness.state()->projects.size() == 1);
  REQUIRE(harness.state()->projects[0].path == "/repo");
}

TEST_CASE("Each directory is read once", "[Store]") {
  StoreHarness harness;
  harness.reader->setListing("/repo", {entry("/repo", "src", true),
                                       entry("/repo", "README.md", false)});
  harness.reader->setListing("/repo/src", {entry("/repo/src", "main.cpp",
                                                 false)});

  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(ExploreDir{"/repo"}).ok);
  REQUIRE(harness.reader->readsOf("/repo") == 1);

  REQUIRE(harness.store->dispatch(ExpandDirectory{"/repo/src"}).ok);
  REQUIRE(harness.store->dispatch(ExpandDirectory{"/repo/src"}).ok);
  harness.store->waitForIdle();
  REQUIRE(harness.reader->readsOf("/repo/src") == 1);

  const ExplorerState &explorer = harness.worktree().explorer;
  REQUIRE(explorer.directory_cache.at("/repo").size() == 2);
  REQUIRE(explorer.directory_cache.at("/repo").front().name == "src");
  REQUIRE(explorer.directory_cache.at("/repo/src").size() == 1);
  REQUIRE(explorer.loading_paths.empty());
}

TEST_CASE("Failed reads are reported in the explorer", "[Store]") {
  StoreHarness harness;
  harness.reader->failOn("/repo/secret");
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(ExpandDirectory{"/repo/secret"}).ok);

  const ExplorerState &explorer = harness.worktree().explorer;
  REQUIRE(explorer.loading_paths.empty());
  REQUIRE(explorer.error);
  REQUIRE(explorer.error->find("Permission denied") != string::npos);
}

TEST_CASE("Terminal sessions live and die with the state", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);

  const TerminalState &terminal = harness.worktree().terminal;
  REQUIRE(terminal.status == TerminalStatus::Running);
  REQUIRE(terminal.session_id);
  string sessionId = *terminal.session_id;
  REQUIRE(harness.deps.registry->contains(sessionId));
  auto control = harness.ptys.last();
  REQUIRE(control->cwd == "/repo");
  REQUIRE(control->cols == 80);

  control->emit("$ ");
  REQUIRE(waitUntil([&] {
    return harness.worktree().terminal.scrollback == "$ ";
  }));

  REQUIRE(harness.dispatchAndSettle(WriteTerminal{sessionId, "ls\n"}).ok);
  REQUIRE(waitUntil([&] { return control->written() == "ls\n"; }));

  REQUIRE(harness.dispatchAndSettle(KillTerminal{sessionId}).ok);
  REQUIRE(!harness.deps.registry->contains(sessionId));
  REQUIRE(!harness.worktree().terminal.session_id);
  REQUIRE(control->isTerminated());

  DispatchResult result =
      harness.store->dispatch(ResizeTerminal{sessionId, 100, 30});
  REQUIRE(!result.ok);
  REQUIRE(result.kind == ErrorKind::UnknownSession);
  result = harness.store->dispatch(WriteTerminal{sessionId, "ls\n"});
  REQUIRE(result.kind == ErrorKind::UnknownSession);
}

TEST_CASE("A terminal that exits is cleared", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
  string sessionId = *harness.worktree().terminal.session_id;

  harness.ptys.last()->close();
  REQUIRE(waitUntil([&] { return !harness.deps.registry->contains(sessionId); }));
  harness.store->waitForIdle();
  REQUIRE(!harness.worktree().terminal.session_id);
  REQUIRE(harness.worktree().terminal.status == TerminalStatus::Idle);
}

TEST_CASE("Spawn failures surface on the terminal", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  harness.ptys.failNextSpawn();
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);

  const TerminalState &terminal = harness.worktree().terminal;
  REQUIRE(terminal.status == TerminalStatus::Error);
  REQUIRE(*terminal.error == "forkpty failed");
  REQUIRE(harness.deps.registry->size() == 0);
}

TEST_CASE("Closing a project kills its terminals", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
  REQUIRE(harness.deps.registry->size() == 1);

  REQUIRE(harness.dispatchAndSettle(CloseProject{0}).ok);
  REQUIRE(harness.deps.registry->size() == 0);
  REQUIRE(harness.state()->projects.empty());
}

TEST_CASE("Subscribers see every commit and may not dispatch", "[Store]") {
  StoreHarness harness;
  atomic<int> calls(0);
  optional<DispatchResult> nested;
  auto unsubscribe = harness.store->subscribe(
      [&](const string &, int64_t) {
        if (calls++ == 0) {
          nested = harness.store->dispatch(SetTheme{Theme::Dark});
        }
      });

  REQUIRE(harness.dispatchAndSettle(SetTheme{Theme::Light}).ok);
  REQUIRE(calls == 1);
  REQUIRE(nested);
  REQUIRE(!nested->ok);
  REQUIRE(nested->kind == ErrorKind::InvalidAction);
  REQUIRE(harness.state()->theme == Theme::Light);

  unsubscribe();
  REQUIRE(harness.dispatchAndSettle(SetTheme{Theme::Dark}).ok);
  REQUIRE(calls == 1);
}

TEST_CASE("Chat replies stream into the state", "[Store]") {
  StoreHarness harness;
  harness.backend->setScript(
      {CompletionEvent::delta("Hello"), CompletionEvent::delta(", world")},
      false);
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.store->dispatch(SubmitChatMessage{"hi"}).ok);

  REQUIRE(waitUntil([&] {
    const ChatState &chat = harness.worktree().chat;
    return chat.messages.size() == 2 &&
           chat.messages[1].status == MessageStatus::Complete;
  }));
  const ChatState &chat = harness.worktree().chat;
  REQUIRE(chat.messages[1].content == "Hello, world");
  REQUIRE(!chat.streaming_message_id);
  REQUIRE(harness.backend->lastRequest().cwd == "/repo");
  REQUIRE(harness.backend->lastRequest().prompt == "hi");
}

TEST_CASE("Clearing the chat cancels the running reply", "[Store]") {
  StoreHarness harness;
  harness.backend->setScript({CompletionEvent::delta("Thinking")}, true);
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.store->dispatch(SubmitChatMessage{"hi"}).ok);
  REQUIRE(waitUntil([&] {
    return harness.worktree().chat.messages.size() == 2 &&
           harness.worktree().chat.messages[1].content == "Thinking";
  }));

  REQUIRE(harness.dispatchAndSettle(ClearChat{}).ok);
  REQUIRE(waitUntil([&] { return harness.backend->cancelled() == 1; }));
  harness.store->waitForIdle();
  REQUIRE(harness.worktree().chat.messages.empty());
  REQUIRE(!harness.worktree().chat.streaming_message_id);
}

TEST_CASE("Comments are stored and reloaded with their ids", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(
                     AddFileComment{"/repo/main.cpp", "check the bounds"})
              .ok);

  const auto &comments =
      harness.worktree().explorer.comments.at("/repo/main.cpp");
  REQUIRE(comments.size() == 1);
  REQUIRE(comments[0].id > 0);
  REQUIRE(comments[0].content == "check the bounds");

  ProjectKey key = ProjectKey::fromPath("/repo");
  auto logs = harness.deps.recordStore->queryRecords(
      key, RecordTable::ActivityLogs, "project");
  REQUIRE(!logs.empty());

  // Another project sees none of them.
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/elsewhere"}).ok);
  REQUIRE(harness.dispatchAndSettle(LoadFileComments{"/repo/main.cpp"}).ok);
  REQUIRE(harness.worktree().explorer.comments.at("/repo/main.cpp").empty());
}

TEST_CASE("Shutdown writes the recovery snapshot", "[Store]") {
  TempDirectory dir;
  auto snapshots = make_shared<SnapshotStore>(dir.path, "test");
  {
    StoreHarness harness(snapshots);
    REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
    REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
    harness.store->shutdown();

    DispatchResult late = harness.store->dispatch(SetTheme{Theme::Dark});
    REQUIRE(!late.ok);
  }

  auto recovered = snapshots->load();
  REQUIRE(recovered);
  REQUIRE(recovered->projects.size() == 1);
  REQUIRE(recovered->version > 0);

  // Restarting from the snapshot does not resurrect the dead session.
  StoreHarness restarted(snapshots, *recovered);
  REQUIRE(restarted.state()->projects.size() == 1);
  REQUIRE(!restarted.worktree().terminal.session_id);
  REQUIRE(restarted.worktree().terminal.status == TerminalStatus::Idle);
}

TEST_CASE("A terminal that stops reading does not stall the store",
          "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
  string sessionId = *harness.worktree().terminal.session_id;
  auto control = harness.ptys.last();
  control->setBlockWrites(true);

  string paste;
  for (int a = 0; a < 8192; a++) {
    paste += "echo hello world line\n";
  }
  REQUIRE(harness.store->dispatch(WriteTerminal{sessionId, paste}).ok);
  REQUIRE(waitUntil([&] { return control->writesBlocked() == 1; }));

  REQUIRE(harness.store->dispatch(SetTheme{Theme::Dark}).ok);
  REQUIRE(harness.state()->theme == Theme::Dark);

  REQUIRE(harness.dispatchAndSettle(KillTerminal{sessionId}).ok);
  REQUIRE(!harness.deps.registry->contains(sessionId));
  REQUIRE(control->isTerminated());
}

TEST_CASE("File names that are not UTF-8 do not break later commits",
          "[Store]") {
  TempDirectory dir;
  auto snapshots = make_shared<SnapshotStore>(dir.path, "test");
  StoreHarness harness(snapshots);
  atomic<int> broadcasts(0);
  auto unsubscribe = harness.store->subscribe(
      [&](const string &snapshot, int64_t) {
        if (json::accept(snapshot)) {
          broadcasts++;
        }
      });
  harness.reader->setListing("/repo", {entry("/repo", "bad\xffname", false),
                                       entry("/repo", "main.cpp", false)});

  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(ExploreDir{"/repo"}).ok);
  REQUIRE(harness.worktree().explorer.directory_cache.at("/repo").size() == 2);

  int before = broadcasts;
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
  string sessionId = *harness.worktree().terminal.session_id;
  REQUIRE(harness.deps.registry->contains(sessionId));
  REQUIRE(harness.dispatchAndSettle(KillTerminal{sessionId}).ok);
  REQUIRE(!harness.deps.registry->contains(sessionId));
  REQUIRE(harness.ptys.last()->isTerminated());
  REQUIRE(broadcasts > before);
  unsubscribe();

  harness.store->shutdown();
  auto recovered = snapshots->load();
  REQUIRE(recovered);
  REQUIRE(recovered->projects.size() == 1);
}

TEST_CASE("A failing effect keeps the commit and the effects after it",
          "[Store]") {
  FakePtyFactory ptys;
  StoreHarness harness(nullptr, AppState(),
                       make_shared<FailingKillRegistry>(ptys.factory()));
  harness.backend->setScript({CompletionEvent::delta("Thinking")}, true);
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.store->dispatch(SubmitChatMessage{"hi"}).ok);
  REQUIRE(waitUntil([&] {
    return harness.worktree().chat.messages.size() == 2 &&
           harness.worktree().chat.messages[1].content == "Thinking";
  }));

  DispatchResult result = harness.dispatchAndSettle(CloseProject{0});
  REQUIRE(result.ok);
  REQUIRE(harness.state()->projects.empty());
  // The cancel comes after the kill that threw.
  REQUIRE(waitUntil([&] { return harness.backend->cancelled() == 1; }));

  REQUIRE(harness.dispatchAndSettle(SetTheme{Theme::Light}).ok);
}

TEST_CASE("Front ends may not submit follow-up actions", "[Store]") {
  StoreHarness harness;
  REQUIRE(harness.dispatchAndSettle(OpenProject{"/repo"}).ok);
  REQUIRE(harness.dispatchAndSettle(SpawnTerminal{nullopt, 80, 24}).ok);
  string sessionId = *harness.worktree().terminal.session_id;
  auto before = harness.state();

  DispatchResult result = harness.store->dispatchJson(
      R"({"type":"TerminalExited","payload":{"session_id":")" + sessionId +
      R"("}})");
  REQUIRE(!result.ok);
  REQUIRE(result.kind == ErrorKind::InvalidAction);
  result = harness.store->dispatchJson(
      R"({"type":"TerminalOutput","payload":{"session_id":")" + sessionId +
      R"(","data":"fake"}})");
  REQUIRE(!result.ok);

  REQUIRE(harness.state() == before);
  REQUIRE(harness.deps.registry->contains(sessionId));
}
