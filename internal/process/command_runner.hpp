#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/util/time.hpp"

namespace prepush::process {

enum class Outcome {
  kSuccess,
  kFailure,
  kTimeout,
};

struct ProcessResult {
  Outcome        outcome   = Outcome::kFailure;
  int            exit_code = -1;
  std::string    output;
  util::Duration elapsed{0};

  bool ok() const {
    return outcome == Outcome::kSuccess;
  }
};

/*
  The single seam between the orchestrator and the operating system's process
  layer. Every check status is derived from what an implementation returns.

  Implementations never throw for anything the child does: launch errors,
  non-zero exits and timeouts all come back as a failed ProcessResult.
*/
class CommandRunner {
 public:
  virtual ~CommandRunner() = default;

  virtual ProcessResult Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) = 0;
};

// "TIMEOUT (10 min)"
std::string TimeoutMarker(std::chrono::seconds timeout);

std::string JoinCommand(const std::vector<std::string>& argv);

} // namespace prepush::process
