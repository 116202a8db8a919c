#pragma once

#include <stdexcept>
#include <string>

namespace pokertable::util {

/*
  Central error types.

  These get translated later to gRPC status codes.
*/

// Request rejected: out-of-turn, unknown seat, insufficient balance, bad action.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Raised by the rules engine for an action that is illegal in the current position.
class IllegalActionError : public ValidationError {
 public:
  explicit IllegalActionError(const std::string& msg) : ValidationError(msg) {
  }
};

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

class NoActiveHand : public InvalidState {
 public:
  NoActiveHand() : InvalidState("no active hand") {
  }
};

// Row lock, busy database or serialization conflict. Callers may retry.
class ConcurrencyError : public std::runtime_error {
 public:
  explicit ConcurrencyError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class PersistenceError : public std::runtime_error {
 public:
  explicit PersistenceError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Snapshot cannot be turned back into an engine.
class RestorationError : public std::runtime_error {
 public:
  explicit RestorationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace pokertable::util
