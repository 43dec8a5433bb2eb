#pragma once

#include <stdexcept>
#include <string>

namespace fieldsync::util {

/*
  Central error types.

  Repository Result codes are translated into these by the managers.
  Upload failures are NOT errors here; they are recorded as state.
*/

class NotFound : public std::runtime_error {
 public:
  explicit NotFound(const std::string& msg) : std::runtime_error(msg) {
  }
};

class AlreadyExists : public std::runtime_error {
 public:
  explicit AlreadyExists(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Unrecoverable local storage failure (open, schema, IO, corruption, full).
class StorageError : public std::runtime_error {
 public:
  explicit StorageError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A concurrent transaction committed first; the caller may retry.
class TransactionConflict : public std::runtime_error {
 public:
  explicit TransactionConflict(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace fieldsync::util
