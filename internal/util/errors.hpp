#pragma once

#include <stdexcept>
#include <string>

namespace ledger::util {

/*
  Central error types.

  Every failure of a ledger operation surfaces as one of these. None of them
  leave the record table in a state that violates the budget invariant.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InsufficientBudget : public std::runtime_error {
 public:
  explicit InsufficientBudget(const std::string& msg) : std::runtime_error(msg) {
  }
};

// The id was tracked but its payload has been destroyed by its owner.
class Reclaimed : public std::runtime_error {
 public:
  explicit Reclaimed(const std::string& msg) : std::runtime_error(msg) {
  }
};

class LedgerTerminated : public std::runtime_error {
 public:
  explicit LedgerTerminated(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidArgument : public std::runtime_error {
 public:
  explicit InvalidArgument(const std::string& msg) : std::runtime_error(msg) {
  }
};

class TypeMismatch : public std::runtime_error {
 public:
  explicit TypeMismatch(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace ledger::util
