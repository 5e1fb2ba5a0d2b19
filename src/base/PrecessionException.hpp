#ifndef __PRECESSION_EXCEPTION__
#define __PRECESSION_EXCEPTION__

#include "Headers.hpp"

namespace precession {

/**
 * @brief Base of every error that aborts a session start.  Carries a human
 * readable message that main prints before exiting.
 */
class PrecessionException : public std::exception {
 public:
  PrecessionException(const string& kind, const string& detail)
      : message(kind + ": " + detail), detailMessage(detail) {}
  const char* what() const noexcept override { return message.c_str(); }

  /** @brief The message without the leading error kind. */
  const string& detail() const { return detailMessage; }

 private:
  std::string message = " ";
  std::string detailMessage;
};

/**
 * @brief Thrown when a session definition cannot be decoded into a session
 * tree: invalid YAML, missing or mistyped fields, unknown layouts.
 */
class MalformedDefinition : public PrecessionException {
 public:
  explicit MalformedDefinition(const string& msg)
      : PrecessionException("Malformed session definition", msg) {}
};

/**
 * @brief Thrown when the definition file cannot be located or read.
 */
class DefinitionNotFound : public PrecessionException {
 public:
  explicit DefinitionNotFound(const string& msg)
      : PrecessionException("Session definition not found", msg) {}
};

/**
 * @brief Thrown when tmux rejects an operation or cannot be run at all.
 */
class ControlOperationFailed : public PrecessionException {
 public:
  explicit ControlOperationFailed(const string& msg)
      : PrecessionException("tmux operation failed", msg) {}
};

}  // namespace precession
#endif  // __PRECESSION_EXCEPTION__
