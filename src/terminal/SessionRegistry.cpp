#include "SessionRegistry.hpp"

#include "OutputCoalescer.hpp"
#include "TetherException.hpp"

namespace tether {
struct SessionRegistry::Session {
  string id;
  string worktreeId;
  shared_ptr<PtyProcess> process;
  thread pumpThread;
  thread writerThread;
  atomic<bool> running;
  mutex creditMutex;
  condition_variable creditCv;
  int inFlight;

  mutex inputMutex;
  condition_variable inputCv;
  std::deque<string> pendingInput;
  // Includes the chunk the writer is busy with.
  size_t pendingInputBytes;

  Session() : running(true), inFlight(0), pendingInputBytes(0) {}

  bool queueInput(const string &data) {
    lock_guard<mutex> guard(inputMutex);
    if (pendingInputBytes > 0 &&
        pendingInputBytes + data.length() > MAX_PENDING_INPUT_BYTES) {
      return false;
    }
    pendingInput.push_back(data);
    pendingInputBytes += data.length();
    inputCv.notify_one();
    return true;
  }

  /**
   * Takes one in-flight slot, waiting up to `waitMs` for one to free up.
   * Fails once the session is stopping.
   */
  bool acquireCredit(int64_t waitMs) {
    unique_lock<mutex> guard(creditMutex);
    creditCv.wait_for(guard, std::chrono::milliseconds(waitMs), [this]() {
      return !running || inFlight < MAX_IN_FLIGHT_CHUNKS;
    });
    if (!running || inFlight >= MAX_IN_FLIGHT_CHUNKS) {
      return false;
    }
    inFlight++;
    return true;
  }

  void releaseCredit() {
    lock_guard<mutex> guard(creditMutex);
    inFlight--;
    creditCv.notify_all();
  }
};

#define READ_SIZE (16 * 1024)

SessionRegistry::SessionRegistry(PtyProcessFactory _factory,
                                 const string &_shell)
    : factory(_factory), shell(_shell.empty() ? defaultShell() : _shell) {}

SessionRegistry::~SessionRegistry() { killAll(); }

string SessionRegistry::defaultShell() {
  const char *envShell = ::getenv("SHELL");
  if (envShell != NULL && envShell[0] != '\0') {
    return string(envShell);
  }
  return "/bin/sh";
}

void SessionRegistry::setSinks(OutputSink _outputSink, ExitSink _exitSink) {
  lock_guard<mutex> guard(registryMutex);
  outputSink = _outputSink;
  exitSink = _exitSink;
}

string SessionRegistry::spawn(
    const string &worktreeId, const string &cwd, int cols, int rows,
    const std::function<void(const string &)> &onSpawned) {
  shared_ptr<PtyProcess> process(factory());
  process->start(cwd, shell, cols, rows);

  auto session = make_shared<Session>();
  session->id = sole::uuid4().str();
  session->worktreeId = worktreeId;
  session->process = process;

  lock_guard<mutex> guard(registryMutex);
  sessions[session->id] = session;
  if (onSpawned) {
    onSpawned(session->id);
  }
  session->pumpThread = thread(&SessionRegistry::pump, this, session);
  session->writerThread = thread(&SessionRegistry::writeInput, this, session);
  LOG(INFO) << "Spawned session " << session->id << " for worktree "
            << worktreeId << " in " << cwd;
  return session->id;
}

shared_ptr<SessionRegistry::Session> SessionRegistry::find(
    const string &sessionId) const {
  lock_guard<mutex> guard(registryMutex);
  auto it = sessions.find(sessionId);
  if (it == sessions.end()) {
    throw TetherException(ErrorKind::UnknownSession,
                          "Unknown session: " + sessionId);
  }
  return it->second;
}

void SessionRegistry::write(const string &sessionId, const string &data) {
  if (data.empty()) {
    return;
  }
  if (!find(sessionId)->queueInput(data)) {
    LOG(WARNING) << "Input backlog full for session " << sessionId;
    throw TetherException(ErrorKind::InvalidAction,
                          "Terminal input backlog is full for " + sessionId);
  }
}

void SessionRegistry::resize(const string &sessionId, int cols, int rows) {
  find(sessionId)->process->resize(cols, rows);
}

void SessionRegistry::kill(const string &sessionId) {
  shared_ptr<Session> session;
  {
    lock_guard<mutex> guard(registryMutex);
    auto it = sessions.find(sessionId);
    if (it == sessions.end()) {
      return;
    }
    session = it->second;
    sessions.erase(it);
  }
  stop(session);
}

void SessionRegistry::killWorktree(const string &worktreeId) {
  vector<shared_ptr<Session>> stopping;
  {
    lock_guard<mutex> guard(registryMutex);
    for (auto it = sessions.begin(); it != sessions.end();) {
      if (it->second->worktreeId == worktreeId) {
        stopping.push_back(it->second);
        it = sessions.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto &session : stopping) {
    stop(session);
  }
}

void SessionRegistry::killAll() {
  map<string, shared_ptr<Session>> stopping;
  {
    lock_guard<mutex> guard(registryMutex);
    stopping.swap(sessions);
  }
  for (auto &it : stopping) {
    stop(it.second);
  }
}

bool SessionRegistry::contains(const string &sessionId) const {
  lock_guard<mutex> guard(registryMutex);
  return sessions.find(sessionId) != sessions.end();
}

size_t SessionRegistry::size() const {
  lock_guard<mutex> guard(registryMutex);
  return sessions.size();
}

void SessionRegistry::stop(shared_ptr<Session> session) {
  session->running = false;
  {
    lock_guard<mutex> guard(session->creditMutex);
    session->creditCv.notify_all();
  }
  {
    lock_guard<mutex> guard(session->inputMutex);
    session->inputCv.notify_all();
  }
  session->process->terminate();
  for (thread *worker : {&session->pumpThread, &session->writerThread}) {
    if (!worker->joinable()) {
      continue;
    }
    if (worker->get_id() == std::this_thread::get_id()) {
      worker->detach();
    } else {
      worker->join();
    }
  }
  LOG(INFO) << "Stopped session " << session->id;
}

void SessionRegistry::writeInput(shared_ptr<Session> session) {
  while (true) {
    string data;
    {
      unique_lock<mutex> guard(session->inputMutex);
      session->inputCv.wait(guard, [&session] {
        return !session->running || !session->pendingInput.empty();
      });
      if (!session->running) {
        return;
      }
      data = std::move(session->pendingInput.front());
      session->pendingInput.pop_front();
    }
    try {
      session->process->write(data);
    } catch (const std::runtime_error &ex) {
      if (session->running) {
        LOG(WARNING) << "Write to session " << session->id
                     << " failed: " << ex.what();
      }
    }
    lock_guard<mutex> guard(session->inputMutex);
    session->pendingInputBytes -= data.length();
  }
}

void SessionRegistry::pump(shared_ptr<Session> session) {
  OutputCoalescer coalescer;
  char buf[READ_SIZE];
  bool open = true;
  while (session->running && (open || coalescer.hasPendingData())) {
    if (open && coalescer.canAcceptMore()) {
      int64_t timeoutMs = coalescer.hasPendingData()
                              ? OutputCoalescer::FLUSH_INTERVAL_MS / 4
                              : 50;
      int rc = session->process->readOutput(buf, sizeof(buf), timeoutMs);
      if (rc < 0) {
        open = false;
      } else if (rc > 0) {
        coalescer.append(string(buf, rc), nowMillis());
      }
    }

    int64_t now = nowMillis();
    if (!coalescer.shouldFlush(now) && open) {
      continue;
    }
    if (!coalescer.hasPendingData()) {
      continue;
    }
    // Without credit, only block when there is nothing else to do.
    bool mustWait = !open || !coalescer.canAcceptMore();
    if (!session->acquireCredit(mustWait ? OutputCoalescer::FLUSH_INTERVAL_MS
                                         : 0)) {
      continue;
    }
    string chunk = coalescer.take(now);

    OutputSink sink;
    {
      lock_guard<mutex> guard(registryMutex);
      sink = outputSink;
    }
    auto delivered = [session]() { session->releaseCredit(); };
    VLOG(2) << "Session " << session->id << " output " << chunk.length()
            << " bytes";
    if (sink) {
      sink(session->id, chunk, delivered);
    } else {
      delivered();
    }
  }

  session->process->reap();
  if (session->running) {
    LOG(INFO) << "Session " << session->id << " exited";
    ExitSink sink;
    {
      lock_guard<mutex> guard(registryMutex);
      sink = exitSink;
    }
    if (sink) {
      sink(session->id);
    }
  }
}
}  // namespace tether
