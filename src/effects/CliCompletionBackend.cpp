#include "CliCompletionBackend.hpp"

#include "JsonLib.hpp"
#include "TetherException.hpp"

namespace tether {
CliCompletionBackend::CliCompletionBackend(const string &_command,
                                           int64_t _eventTimeoutMs)
    : command(_command), eventTimeoutMs(_eventTimeoutMs) {}

vector<string> CliCompletionBackend::defaultArgs() {
  return {"-p", "--verbose", "--output-format", "stream-json"};
}

unique_ptr<CompletionStream> CliCompletionBackend::start(
    const CompletionRequest &request) {
  vector<string> args = defaultArgs();
  args.push_back(request.prompt);
  unique_ptr<ChildProcess> process(new ChildProcess());
  try {
    process->start(command, args, request.cwd);
  } catch (const std::runtime_error &ex) {
    throw TetherException(ErrorKind::CompletionFailure,
                          "Cannot start " + command + ": " + ex.what());
  }
  LOG(INFO) << "Started completion for message " << request.message_id;
  return unique_ptr<CompletionStream>(
      new CliCompletionStream(std::move(process), eventTimeoutMs));
}

optional<CompletionEvent> CliCompletionBackend::parseLine(const string &line) {
  if (line.find_first_not_of(" \t\r") == string::npos) {
    return nullopt;
  }
  json event;
  try {
    event = json::parse(line);
  } catch (const json::parse_error &ex) {
    return CompletionEvent::error(string("Unreadable completion output: ") +
                                  ex.what());
  }
  if (!event.is_object()) {
    return nullopt;
  }
  const string type = getOr<string>(event, "type", "");

  if (type == "content_block_delta") {
    auto delta = event.find("delta");
    if (delta != event.end() && delta->is_object() &&
        getOr<string>(*delta, "type", "") == "text_delta") {
      string text = getOr<string>(*delta, "text", "");
      if (!text.empty()) {
        return CompletionEvent::delta(text);
      }
    }
    return nullopt;
  }

  if (type == "assistant") {
    auto message = event.find("message");
    if (message == event.end() || !message->is_object()) {
      return nullopt;
    }
    auto content = message->find("content");
    if (content == message->end() || !content->is_array()) {
      return nullopt;
    }
    for (const auto &item : *content) {
      if (item.is_object() && getOr<string>(item, "type", "") == "text") {
        string text = getOr<string>(item, "text", "");
        if (!text.empty()) {
          return CompletionEvent::delta(text);
        }
      }
    }
    return nullopt;
  }

  if (type == "message_stop") {
    return CompletionEvent::done();
  }

  if (type == "result") {
    if (getOr<bool>(event, "is_error", false)) {
      string message = "Completion failed";
      auto result = event.find("result");
      if (result != event.end() && result->is_string()) {
        message = result->get<string>();
      }
      return CompletionEvent::error(message);
    }
    return CompletionEvent::done();
  }

  return nullopt;
}

CliCompletionStream::CliCompletionStream(unique_ptr<ChildProcess> _process,
                                         int64_t _eventTimeoutMs)
    : process(std::move(_process)),
      eventTimeoutMs(_eventTimeoutMs),
      deadlineMs(nowMillis() + CliCompletionBackend::TOTAL_TIMEOUT_MS),
      cancelled(false),
      finished(false) {}

CliCompletionStream::~CliCompletionStream() { process->terminate(); }

CompletionEvent CliCompletionStream::next() {
  if (finished) {
    return CompletionEvent::error("Completion stream already finished");
  }
  while (true) {
    if (cancelled) {
      finished = true;
      return CompletionEvent::error("Cancelled");
    }
    int64_t remaining = deadlineMs - nowMillis();
    if (remaining <= 0) {
      finished = true;
      process->terminate();
      return CompletionEvent::error("Completion took too long");
    }
    string line;
    auto status = process->readLine(&line, std::min(eventTimeoutMs, remaining));
    switch (status) {
      case ChildProcess::ReadStatus::Line: {
        VLOG(2) << "Completion event: " << line;
        optional<CompletionEvent> event = CliCompletionBackend::parseLine(line);
        if (!event) {
          continue;
        }
        if (event->type != CompletionEvent::Type::Delta) {
          finished = true;
          process->terminate();
        }
        return *event;
      }
      case ChildProcess::ReadStatus::Timeout:
        if (nowMillis() >= deadlineMs) {
          continue;
        }
        finished = true;
        process->terminate();
        return CompletionEvent::error(
            "No response from the completion backend for " +
            to_string(eventTimeoutMs / 1000) + " seconds");
      case ChildProcess::ReadStatus::End:
        finished = true;
        if (cancelled) {
          return CompletionEvent::error("Cancelled");
        }
        return CompletionEvent::error(
            "Completion backend ended unexpectedly; check its credentials");
    }
  }
}

void CliCompletionStream::cancel() {
  cancelled = true;
  process->terminate();
}
}  // namespace tether
