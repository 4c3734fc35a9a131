#include "check.hpp"

#include "internal/util/errors.hpp"

namespace prepush::model {

const char* ToString(CheckStatus status) {
  switch (status) {
    case CheckStatus::kPending:
      return "pending";
    case CheckStatus::kRunning:
      return "running";
    case CheckStatus::kPassed:
      return "passed";
    case CheckStatus::kFailed:
      return "failed";
    case CheckStatus::kWarned:
      return "warned";
    case CheckStatus::kSkipped:
      return "skipped";
  }
  return "unknown";
}

void Check::Transition(CheckStatus to) {
  if (!CanTransition(status, to)) {
    throw util::InvalidState("check '" + name + "': illegal transition " + ToString(status) + " -> " + ToString(to));
  }
  status = to;
}

} // namespace prepush::model
