#ifndef __TETHER_FAKE_COMPLETION_BACKEND__
#define __TETHER_FAKE_COMPLETION_BACKEND__

#include "CompletionBackend.hpp"
#include "TetherException.hpp"

namespace tether {
/**
 * @brief Replays scripted events.  With `holdOpen`, the stream blocks after
 * the script until it is cancelled, like a response that never finishes.
 */
class FakeCompletionStream : public CompletionStream {
 public:
  FakeCompletionStream(const vector<CompletionEvent> &_events, bool _holdOpen,
                       atomic<int> *_cancellations)
      : events(_events.begin(), _events.end()),
        holdOpen(_holdOpen),
        cancelled(false),
        cancellations(_cancellations) {}

  virtual CompletionEvent next() {
    unique_lock<mutex> guard(streamMutex);
    if (!events.empty()) {
      CompletionEvent event = events.front();
      events.pop_front();
      return event;
    }
    if (!holdOpen) {
      return CompletionEvent::done();
    }
    cv.wait(guard, [this] { return cancelled; });
    return CompletionEvent::error("cancelled");
  }

  virtual void cancel() {
    lock_guard<mutex> guard(streamMutex);
    if (!cancelled) {
      cancelled = true;
      (*cancellations)++;
    }
    cv.notify_all();
  }

 protected:
  mutex streamMutex;
  condition_variable cv;
  std::deque<CompletionEvent> events;
  bool holdOpen;
  bool cancelled;
  atomic<int> *cancellations;
};

class FakeCompletionBackend : public CompletionBackend {
 public:
  FakeCompletionBackend()
      : holdOpen(false), failStart(false), cancellations(0) {}

  virtual unique_ptr<CompletionStream> start(
      const CompletionRequest &request) {
    lock_guard<mutex> guard(backendMutex);
    requests.push_back(request);
    if (failStart) {
      throw TetherException(ErrorKind::CompletionFailure,
                            "completion cli not found");
    }
    return unique_ptr<CompletionStream>(
        new FakeCompletionStream(script, holdOpen, &cancellations));
  }

  void setScript(const vector<CompletionEvent> &_script, bool _holdOpen) {
    lock_guard<mutex> guard(backendMutex);
    script = _script;
    holdOpen = _holdOpen;
  }

  void setFailStart(bool _failStart) {
    lock_guard<mutex> guard(backendMutex);
    failStart = _failStart;
  }

  size_t started() {
    lock_guard<mutex> guard(backendMutex);
    return requests.size();
  }

  CompletionRequest lastRequest() {
    lock_guard<mutex> guard(backendMutex);
    return requests.back();
  }

  int cancelled() const { return cancellations; }

 protected:
  mutex backendMutex;
  vector<CompletionEvent> script;
  bool holdOpen;
  bool failStart;
  vector<CompletionRequest> requests;
  atomic<int> cancellations;
};
}  // namespace tether

#endif  // __TETHER_FAKE_COMPLETION_BACKEND__
