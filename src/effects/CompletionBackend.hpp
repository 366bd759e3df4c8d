#ifndef __TETHER_COMPLETION_BACKEND__
#define __TETHER_COMPLETION_BACKEND__

#include "Headers.hpp"

namespace tether {
/** @brief One chat completion to run. */
struct CompletionRequest {
  string worktree_id;
  // Assistant message that receives the response.
  string message_id;
  string prompt;
  string cwd;
};

struct CompletionEvent {
  enum class Type { Delta, Done, Error };

  Type type;
  // Text for deltas, message for errors.
  string text;

  static CompletionEvent delta(const string &text) {
    return CompletionEvent{Type::Delta, text};
  }
  static CompletionEvent done() { return CompletionEvent{Type::Done, ""}; }
  static CompletionEvent error(const string &message) {
    return CompletionEvent{Type::Error, message};
  }
};

/**
 * @brief A running completion.  `next()` blocks until the next event; after
 * Done or Error the stream is finished.  `cancel()` may be called from any
 * thread and makes a blocked `next()` return.
 */
class CompletionStream {
 public:
  virtual ~CompletionStream() {}
  virtual CompletionEvent next() = 0;
  virtual void cancel() = 0;
};

/**
 * @brief Starts completions.
 */
class CompletionBackend {
 public:
  virtual ~CompletionBackend() {}
  /** @throws TetherException(CompletionFailure) if it cannot start. */
  virtual unique_ptr<CompletionStream> start(
      const CompletionRequest &request) = 0;
};
}  // namespace tether

#endif  // __TETHER_COMPLETION_BACKEND__
