#pragma once

#include <stdexcept>
#include <string>

namespace continuity {

// A mandatory collaborator is missing at construction time. Fatal.
class ConfigurationError : public std::runtime_error {
 public:
  explicit ConfigurationError(const std::string& what) : std::runtime_error(what) {}
};

// An operation was invoked without its precondition. Fatal, so that
// integration bugs surface instead of degrading quietly.
class InvariantViolation : public std::logic_error {
 public:
  explicit InvariantViolation(const std::string& what) : std::logic_error(what) {}
};

}  // namespace continuity
