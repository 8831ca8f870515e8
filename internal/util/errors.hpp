#pragma once

#include <stdexcept>
#include <string>

namespace todolist::util {

/*
  Central error types surfaced by the store.

  "Not found" is never an error here: Update/Delete report it as false.
*/

// Database cannot be opened, schema bootstrap failed, or a statement failed.
class ConnectionError : public std::runtime_error {
 public:
  explicit ConnectionError(const std::string& msg) : std::runtime_error(msg) {
  }
};

// Caller input rejected before any database access.
class ValidationError : public std::runtime_error {
 public:
  explicit ValidationError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InconsistentState : public std::runtime_error {
 public:
  explicit InconsistentState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace todolist::util
