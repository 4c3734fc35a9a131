#pragma once

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "internal/util/time.hpp"

namespace prepush::model {

enum class CheckStatus : std::uint8_t {
  kPending = 0,
  kRunning = 1,
  kPassed  = 2,
  kFailed  = 3,
  kWarned  = 4,
  kSkipped = 5,
};

constexpr bool IsTerminal(CheckStatus status) {
  return status == CheckStatus::kPassed || status == CheckStatus::kFailed || status == CheckStatus::kWarned ||
         status == CheckStatus::kSkipped;
}

constexpr bool CanTransition(CheckStatus from, CheckStatus to) {
  if (IsTerminal(from)) {
    return false;
  }
  if (to == CheckStatus::kPending) {
    return false;
  }
  // only a check that never started can be skipped
  if (to == CheckStatus::kSkipped) {
    return from == CheckStatus::kPending;
  }
  if (to == CheckStatus::kRunning) {
    return from == CheckStatus::kPending;
  }
  return from == CheckStatus::kRunning;
}

const char* ToString(CheckStatus status);

/*
  One externally invoked validation unit.

  An empty command marks a pseudo-check whose lane runs it with custom logic.
*/
struct Check {
  Check() = default;
  Check(std::string name, std::vector<std::string> command) : name(std::move(name)), command(std::move(command)) {
  }

  std::string              name;
  std::vector<std::string> command;
  CheckStatus              status = CheckStatus::kPending;
  util::Duration           elapsed{0};
  std::string              output;

  // Throws util::InvalidState on an illegal transition.
  void Transition(CheckStatus to);
};

} // namespace prepush::model
