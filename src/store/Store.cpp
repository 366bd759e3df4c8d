#include "Store.hpp"

#include "ProjectKey.hpp"
#include "Reducer.hpp"

namespace tether {
json DispatchResult::toJson() const {
  json j;
  j["ok"] = ok;
  if (!ok) {
    j["error"] = {{"kind", errorKindName(kind)}, {"message", message}};
  }
  return j;
}

Store::Store(const StoreDependencies &_deps, const AppState &initialState,
             int backgroundThreads)
    : deps(_deps),
      state(make_shared<const AppState>(sanitizeForRecovery(initialState))),
      stopping(false),
      busy(false),
      backgroundJobs(0),
      backgroundPool(new ThreadPool(backgroundThreads)),
      snapshotPool(new ThreadPool(1)),
      shutdownDone(false) {
  if (!deps.registry || !deps.scheduler || !deps.directoryReader) {
    STFATAL << "Store is missing a required collaborator";
  }

  deps.registry->setSinks(
      [this](const string &sessionId, const string &data,
             std::function<void()> delivered) {
        post(TerminalOutput{sessionId, data},
             [delivered](const DispatchResult &) {
               if (delivered) {
                 delivered();
               }
             });
      },
      [this](const string &sessionId) { post(TerminalExited{sessionId}); });
  deps.scheduler->setPoster([this](Action action, std::function<void()> done) {
    post(std::move(action), [done](const DispatchResult &) {
      if (done) {
        done();
      }
    });
  });

  mutationThread = thread(&Store::run, this);
}

Store::~Store() { shutdown(); }

DispatchResult Store::dispatch(Action action) {
  if (isMutationThread()) {
    STERROR << "Blocking dispatch of " << actionTypeName(action)
            << " from the mutation thread";
    return DispatchResult::failure(
        ErrorKind::InvalidAction,
        "dispatch may not be called from the mutation thread");
  }
  stamp(&action);
  auto promise = make_shared<std::promise<DispatchResult>>();
  auto future = promise->get_future();
  PendingAction pending;
  pending.action = std::move(action);
  pending.promise = promise;
  if (!enqueue(std::move(pending))) {
    return DispatchResult::failure(ErrorKind::InvalidAction,
                                   "store is shut down");
  }
  return future.get();
}

DispatchResult Store::dispatchJson(const string &envelope) {
  Action action;
  try {
    action = parseAction(envelope);
  } catch (const TetherException &ex) {
    VLOG(1) << "Rejected envelope: " << ex.what();
    return DispatchResult::failure(ex.getKind(), ex.what());
  }
  if (isFollowUpAction(action)) {
    LOG(WARNING) << "Rejected " << actionTypeName(action)
                 << " from a front end";
    return DispatchResult::failure(
        ErrorKind::InvalidAction,
        actionTypeName(action) + " is only posted by the store itself");
  }
  return dispatch(std::move(action));
}

void Store::post(Action action, DoneCallback done) {
  stamp(&action);
  string type = actionTypeName(action);
  PendingAction pending;
  pending.action = std::move(action);
  pending.done = done;
  if (!enqueue(std::move(pending))) {
    VLOG(1) << "Dropping " << type << " posted after shutdown";
    if (done) {
      done(DispatchResult::failure(ErrorKind::InvalidAction,
                                   "store is shut down"));
    }
  }
}

shared_ptr<const AppState> Store::getState() const {
  lock_guard<mutex> guard(stateMutex);
  return state;
}

Store::Unsubscribe Store::subscribe(Broadcaster::Subscriber subscriber) {
  int64_t id = broadcaster.subscribe(subscriber);
  return [this, id]() { broadcaster.unsubscribe(id); };
}

void Store::waitForIdle() {
  unique_lock<mutex> lock(queueMutex);
  idleCv.wait(lock, [this] {
    return queue.empty() && !busy && backgroundJobs == 0;
  });
}

bool Store::isMutationThread() const {
  return std::this_thread::get_id() == mutationThreadId;
}

void Store::shutdown() {
  lock_guard<mutex> shutdownGuard(shutdownMutex);
  if (shutdownDone) {
    return;
  }
  shutdownDone = true;
  LOG(INFO) << "Shutting down store";

  {
    lock_guard<mutex> guard(queueMutex);
    stopping = true;
  }
  queueCv.notify_all();
  if (mutationThread.joinable()) {
    mutationThread.join();
  }

  // Pending spawns and reads finish; their follow-ups are dropped.
  backgroundPool.reset();
  deps.scheduler->shutdown();
  deps.registry->killAll();
  deps.registry->setSinks(nullptr, nullptr);
  deps.scheduler->setPoster(nullptr);

  snapshotPool.reset();
  if (deps.snapshotStore) {
    try {
      deps.snapshotStore->save(*getState());
    } catch (const std::exception &ex) {
      LOG(ERROR) << "Could not save the recovery snapshot: " << ex.what();
    }
  }
}

void Store::stamp(Action *action) {
  if (!action->meta.ids.empty()) {
    return;
  }
  action->meta.timestamp_ms = nowMillis();
  for (int a = 0; a < ACTION_GENERATED_IDS; a++) {
    action->meta.ids.push_back(sole::uuid4().str());
  }
}

bool Store::enqueue(PendingAction pending) {
  {
    lock_guard<mutex> guard(queueMutex);
    if (stopping) {
      return false;
    }
    queue.push_back(std::move(pending));
  }
  queueCv.notify_one();
  return true;
}

void Store::run() {
  mutationThreadId = std::this_thread::get_id();
  el::Helpers::setThreadName("store-mutation");
  while (true) {
    PendingAction pending;
    {
      unique_lock<mutex> lock(queueMutex);
      queueCv.wait(lock, [this] { return stopping || !queue.empty(); });
      if (queue.empty()) {
        break;
      }
      pending = std::move(queue.front());
      queue.pop_front();
      busy = true;
    }

    DispatchResult result;
    try {
      result = apply(pending.action);
    } catch (const std::exception &ex) {
      LOG(ERROR) << "Unexpected error applying "
                 << actionTypeName(pending.action) << ": " << ex.what();
      result = DispatchResult::failure(ErrorKind::InvalidAction, ex.what());
    }
    if (pending.promise) {
      pending.promise->set_value(result);
    }
    if (pending.done) {
      pending.done(result);
    }

    {
      lock_guard<mutex> guard(queueMutex);
      busy = false;
    }
    idleCv.notify_all();
  }
}

DispatchResult Store::apply(const Action &action) {
  VLOG(1) << "Applying " << actionTypeName(action);
  if (auto write = std::get_if<WriteTerminal>(&action.payload)) {
    if (!deps.registry->contains(write->session_id)) {
      return DispatchResult::failure(ErrorKind::UnknownSession,
                                     "unknown session " + write->session_id);
    }
  }
  if (auto resize = std::get_if<ResizeTerminal>(&action.payload)) {
    if (!deps.registry->contains(resize->session_id)) {
      return DispatchResult::failure(ErrorKind::UnknownSession,
                                     "unknown session " + resize->session_id);
    }
  }

  shared_ptr<const AppState> current = getState();
  ReduceResult result;
  try {
    validateAction(action);
    result = Reducer::reduce(*current, action);
  } catch (const TetherException &ex) {
    LOG(WARNING) << "Rejected " << actionTypeName(action) << ": "
                 << ex.what();
    return DispatchResult::failure(ex.getKind(), ex.what());
  }

  writeRecords(result.records);

  auto committed = make_shared<const AppState>(std::move(result.state));
  {
    lock_guard<mutex> guard(stateMutex);
    state = committed;
  }

  // The transition is committed from here on, so later failures are only
  // logged.
  if (broadcaster.size()) {
    try {
      broadcaster.broadcast(dumpJson(json(*committed)), committed->version);
    } catch (const std::exception &ex) {
      STERROR << "Could not broadcast version " << committed->version << ": "
              << ex.what();
    }
  }

  for (const auto &effect : result.effects) {
    try {
      std::visit([this](const auto &e) { runEffect(e); }, effect);
    } catch (const std::exception &ex) {
      LOG(ERROR) << "Effect of " << actionTypeName(action)
                 << " failed: " << ex.what();
    }
  }

  try {
    scheduleSnapshot(committed);
  } catch (const std::exception &ex) {
    LOG(ERROR) << "Could not schedule the recovery snapshot: " << ex.what();
  }
  return DispatchResult::success();
}

void Store::writeRecords(const vector<PersistedRecord> &records) {
  if (!deps.recordStore) {
    return;
  }
  for (const auto &record : records) {
    try {
      deps.recordStore->appendRecord(record);
    } catch (const TetherException &ex) {
      LOG(ERROR) << errorKindName(ErrorKind::PersistenceFailure)
                 << ": could not write record for " << record.scope << ": "
                 << ex.what();
    }
  }
}

void Store::scheduleSnapshot(shared_ptr<const AppState> snapshot) {
  if (!deps.snapshotStore) {
    return;
  }
  bool schedule;
  {
    lock_guard<mutex> guard(snapshotMutex);
    schedule = !pendingSnapshot;
    pendingSnapshot = snapshot;
  }
  if (!schedule) {
    return;
  }
  snapshotPool->enqueue([this] {
    shared_ptr<const AppState> latest;
    {
      lock_guard<mutex> guard(snapshotMutex);
      latest.swap(pendingSnapshot);
    }
    if (!latest) {
      return;
    }
    try {
      deps.snapshotStore->save(*latest);
    } catch (const std::exception &ex) {
      LOG(WARNING) << "Recovery snapshot not saved: " << ex.what();
    }
  });
}

void Store::runInBackground(std::function<void()> job) {
  {
    lock_guard<mutex> guard(queueMutex);
    backgroundJobs++;
  }
  backgroundPool->enqueue([this, job] {
    job();
    {
      lock_guard<mutex> guard(queueMutex);
      backgroundJobs--;
    }
    idleCv.notify_all();
  });
}

void Store::runEffect(const SpawnSessionEffect &effect) {
  auto registry = deps.registry;
  runInBackground([this, registry, effect] {
    try {
      registry->spawn(effect.worktree_id, effect.cwd, effect.cols,
                      effect.rows, [this, effect](const string &sessionId) {
                        post(TerminalSpawned{effect.worktree_id, sessionId});
                      });
    } catch (const std::exception &ex) {
      LOG(WARNING) << "Spawn failed for worktree " << effect.worktree_id
                   << ": " << ex.what();
      post(TerminalSpawnFailed{effect.worktree_id, ex.what()});
    }
  });
}

void Store::runEffect(const KillSessionEffect &effect) {
  deps.registry->kill(effect.session_id);
}

void Store::runEffect(const KillWorktreeSessionsEffect &effect) {
  deps.registry->killWorktree(effect.worktree_id);
}

void Store::runEffect(const ResizeSessionEffect &effect) {
  try {
    deps.registry->resize(effect.session_id, effect.cols, effect.rows);
  } catch (const std::runtime_error &ex) {
    LOG(WARNING) << "Resize of " << effect.session_id
                 << " failed: " << ex.what();
  }
}

void Store::runEffect(const WriteSessionEffect &effect) {
  try {
    deps.registry->write(effect.session_id, effect.data);
  } catch (const std::runtime_error &ex) {
    LOG(WARNING) << "Write to " << effect.session_id
                 << " failed: " << ex.what();
  }
}

void Store::runEffect(const StartCompletionEffect &effect) {
  CompletionRequest request;
  request.worktree_id = effect.worktree_id;
  request.message_id = effect.message_id;
  request.prompt = effect.prompt;
  request.cwd = effect.cwd;
  deps.scheduler->runChatCompletion(request);
}

void Store::runEffect(const CancelCompletionEffect &effect) {
  deps.scheduler->cancel(effect.worktree_id);
}

void Store::runEffect(const LoadDirectoryEffect &effect) {
  auto reader = deps.directoryReader;
  runInBackground([this, reader, effect] {
    try {
      auto entries = reader->readDirectory(effect.path);
      post(SetDirectoryCache{effect.worktree_id, effect.path, entries});
    } catch (const std::exception &ex) {
      LOG(WARNING) << "Could not read " << effect.path << ": " << ex.what();
      post(DirectoryLoadFailed{effect.worktree_id, effect.path, ex.what()});
    }
  });
}

void Store::runEffect(const QueryCommentsEffect &effect) {
  auto records = deps.recordStore;
  if (!records) {
    return;
  }
  runInBackground([this, records, effect] {
    try {
      vector<FileComment> comments;
      for (const auto &record :
           records->queryRecords(ProjectKey::fromHex(effect.project_key),
                                 RecordTable::FileComments, effect.path)) {
        FileComment comment;
        comment.id = record.id;
        comment.path = record.scope;
        comment.content = record.content;
        comment.author = record.author;
        comment.created_at = record.created_at;
        comments.push_back(comment);
      }
      post(SetFileComments{effect.worktree_id, effect.path, comments});
    } catch (const TetherException &ex) {
      LOG(ERROR) << "Could not load comments for " << effect.path << ": "
                 << ex.what();
    }
  });
}
}  // namespace tether
