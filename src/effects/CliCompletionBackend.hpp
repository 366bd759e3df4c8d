#ifndef __TETHER_CLI_COMPLETION_BACKEND__
#define __TETHER_CLI_COMPLETION_BACKEND__

#include "ChildProcess.hpp"
#include "CompletionBackend.hpp"

namespace tether {
/**
 * @brief Runs a completion CLI that prints stream-json events, one per line:
 *
 *   claude -p --verbose --output-format stream-json <prompt>
 */
class CliCompletionBackend : public CompletionBackend {
 public:
  /** @brief Longest silence between two events. */
  static const int64_t EVENT_TIMEOUT_MS = 30 * 1000;
  /** @brief Longest a single request may run. */
  static const int64_t TOTAL_TIMEOUT_MS = 300 * 1000;

  explicit CliCompletionBackend(const string &_command = "claude",
                                int64_t _eventTimeoutMs = EVENT_TIMEOUT_MS);

  virtual unique_ptr<CompletionStream> start(const CompletionRequest &request);

  /** @brief Arguments passed before the prompt. */
  static vector<string> defaultArgs();

  /**
   * @brief Interprets one line of CLI output.
   * @return The event it carries, or nullopt for lines that carry nothing
   * of interest (system events, tool use, blank lines).
   */
  static optional<CompletionEvent> parseLine(const string &line);

 protected:
  string command;
  int64_t eventTimeoutMs;
};

/** @brief Stream over one running CLI process. */
class CliCompletionStream : public CompletionStream {
 public:
  CliCompletionStream(unique_ptr<ChildProcess> _process,
                      int64_t _eventTimeoutMs);
  virtual ~CliCompletionStream();

  virtual CompletionEvent next();
  virtual void cancel();

 protected:
  unique_ptr<ChildProcess> process;
  int64_t eventTimeoutMs;
  int64_t deadlineMs;
  atomic<bool> cancelled;
  bool finished;
};
}  // namespace tether

#endif  // __TETHER_CLI_COMPLETION_BACKEND__
