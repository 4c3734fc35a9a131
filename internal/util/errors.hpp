#pragma once

#include <stdexcept>
#include <string>

namespace prepush::util {

/*
  Central error types.

  GateError is the only one that aborts a verification run after startup;
  everything else a check can do wrong is recorded as a status instead.
*/

class GateError : public std::runtime_error {
 public:
  explicit GateError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class ConfigError : public std::runtime_error {
 public:
  explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {
  }
};

class InvalidState : public std::runtime_error {
 public:
  explicit InvalidState(const std::string& msg) : std::runtime_error(msg) {
  }
};

} // namespace prepush::util
