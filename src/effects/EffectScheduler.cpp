#include "EffectScheduler.hpp"

#include "TetherException.hpp"

namespace tether {
struct EffectScheduler::Task {
  CompletionRequest request;
  atomic<bool> cancelled;
  mutex streamMutex;
  unique_ptr<CompletionStream> stream;

  explicit Task(const CompletionRequest &_request)
      : request(_request), cancelled(false) {}

  void cancel() {
    cancelled = true;
    lock_guard<mutex> guard(streamMutex);
    if (stream) {
      stream->cancel();
    }
  }
};

EffectScheduler::EffectScheduler(shared_ptr<CompletionBackend> _backend,
                                 int maxConcurrent)
    : backend(_backend), pool(new ThreadPool(maxConcurrent)) {}

EffectScheduler::~EffectScheduler() { shutdown(); }

void EffectScheduler::setPoster(ActionPoster _poster) {
  lock_guard<mutex> guard(schedulerMutex);
  poster = _poster;
}

void EffectScheduler::runChatCompletion(const CompletionRequest &request) {
  auto task = make_shared<Task>(request);
  shared_ptr<Task> previous;
  {
    lock_guard<mutex> guard(schedulerMutex);
    if (!pool) {
      LOG(ERROR) << "Completion requested after shutdown";
      return;
    }
    auto it = tasks.find(request.worktree_id);
    if (it != tasks.end()) {
      previous = it->second;
    }
    tasks[request.worktree_id] = task;
    pool->enqueue([this, task]() { runTask(task); });
  }
  if (previous) {
    previous->cancel();
  }
}

void EffectScheduler::cancel(const string &worktreeId) {
  shared_ptr<Task> task;
  {
    lock_guard<mutex> guard(schedulerMutex);
    auto it = tasks.find(worktreeId);
    if (it == tasks.end()) {
      return;
    }
    task = it->second;
    tasks.erase(it);
  }
  LOG(INFO) << "Cancelling completion for worktree " << worktreeId;
  task->cancel();
}

void EffectScheduler::cancelAll() {
  map<string, shared_ptr<Task>> cancelling;
  {
    lock_guard<mutex> guard(schedulerMutex);
    cancelling.swap(tasks);
  }
  for (auto &it : cancelling) {
    it.second->cancel();
  }
}

void EffectScheduler::shutdown() {
  cancelAll();
  unique_ptr<ThreadPool> stopping;
  {
    lock_guard<mutex> guard(schedulerMutex);
    stopping.swap(pool);
  }
  // Joins the workers; queued tasks see that they were cancelled.
  stopping.reset();
}

size_t EffectScheduler::inFlight() const {
  lock_guard<mutex> guard(schedulerMutex);
  return tasks.size();
}

void EffectScheduler::post(const shared_ptr<Task> &task, Action action) {
  if (task->cancelled) {
    return;
  }
  ActionPoster localPoster;
  {
    lock_guard<mutex> guard(schedulerMutex);
    localPoster = poster;
  }
  if (localPoster) {
    localPoster(std::move(action), nullptr);
  }
}

void EffectScheduler::finish(const shared_ptr<Task> &task) {
  lock_guard<mutex> guard(schedulerMutex);
  auto it = tasks.find(task->request.worktree_id);
  if (it != tasks.end() && it->second == task) {
    tasks.erase(it);
  }
}

void EffectScheduler::runTask(shared_ptr<Task> task) {
  const CompletionRequest &request = task->request;
  if (task->cancelled) {
    finish(task);
    return;
  }

  unique_ptr<CompletionStream> stream;
  try {
    stream = backend->start(request);
  } catch (const TetherException &ex) {
    LOG(ERROR) << "Completion for " << request.message_id
               << " did not start: " << ex.what();
    post(task, FailChatMessage{request.worktree_id, request.message_id,
                               ex.what()});
    finish(task);
    return;
  }
  CompletionStream *rawStream = stream.get();
  {
    lock_guard<mutex> guard(task->streamMutex);
    task->stream = std::move(stream);
  }
  if (task->cancelled) {
    rawStream->cancel();
  }

  while (!task->cancelled) {
    CompletionEvent event = rawStream->next();
    if (task->cancelled) {
      break;
    }
    if (event.type == CompletionEvent::Type::Delta) {
      post(task, UpdateChatMessage{request.worktree_id, request.message_id,
                                   event.text});
      continue;
    }
    if (event.type == CompletionEvent::Type::Done) {
      VLOG(1) << "Completion for " << request.message_id << " finished";
      post(task,
           CompleteChatMessage{request.worktree_id, request.message_id});
    } else {
      LOG(ERROR) << "Completion for " << request.message_id
                 << " failed: " << event.text;
      post(task, FailChatMessage{request.worktree_id, request.message_id,
                                 event.text});
    }
    break;
  }
  finish(task);
}
}  // namespace tether
