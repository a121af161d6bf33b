#pragma once

#include <stdexcept>
#include <string>

namespace photosift::util {

/*
  Central error types.

  Stage runners let these escape so the stage transaction rolls back;
  the CLI reports them with the offending photo/group identifiers.
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

// A decision would break a pipeline guarantee (last survivor of a group,
// reject + separate on one photo, rewriting a hash).
class InvariantViolation : public std::runtime_error {
 public:
  explicit InvariantViolation(const std::string& msg) : std::runtime_error(msg) {
  }
};

// A rule predicate threw on an already-validated record. Never treated as
// "no match".
class RuleEvaluationError : public std::runtime_error {
 public:
  RuleEvaluationError(const std::string& rule_name, const std::string& photo_id, const std::string& cause)
      : std::runtime_error("rule " + rule_name + " failed on photo " + photo_id + ": " + cause), rule_name_(rule_name), photo_id_(photo_id) {
  }

  const std::string& rule_name() const {
    return rule_name_;
  }
  const std::string& photo_id() const {
    return photo_id_;
  }

 private:
  std::string rule_name_;
  std::string photo_id_;
};

} // namespace photosift::util
