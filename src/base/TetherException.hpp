#ifndef __TETHER_EXCEPTION__
#define __TETHER_EXCEPTION__

#include "Headers.hpp"

namespace tether {
/** @brief Failure categories surfaced by the store and its collaborators. */
enum class ErrorKind {
  InvalidAction,
  UnknownSession,
  SpawnFailure,
  PersistenceFailure,
  CompletionFailure,
};

inline string errorKindName(ErrorKind kind) {
  switch (kind) {
    case ErrorKind::InvalidAction:
      return "InvalidAction";
    case ErrorKind::UnknownSession:
      return "UnknownSession";
    case ErrorKind::SpawnFailure:
      return "SpawnFailure";
    case ErrorKind::PersistenceFailure:
      return "PersistenceFailure";
    case ErrorKind::CompletionFailure:
      return "CompletionFailure";
  }
  return "Unknown";
}

/**
 * @brief Runtime error tagged with the category the caller should see.
 */
class TetherException : public std::runtime_error {
 public:
  TetherException(ErrorKind _kind, const string &message)
      : std::runtime_error(message), kind(_kind) {}

  ErrorKind getKind() const { return kind; }

 protected:
  ErrorKind kind;
};
}  // namespace tether

#endif  // __TETHER_EXCEPTION__
