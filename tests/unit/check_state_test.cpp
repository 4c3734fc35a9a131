#include "internal/model/check.hpp"

#include <cassert>
#include <cstring>
#include <iostream>

#include "internal/model/lane.hpp"
#include "internal/util/errors.hpp"

namespace {

using prepush::model::CanTransition;
using prepush::model::Check;
using prepush::model::CheckStatus;
using prepush::model::IsTerminal;
using prepush::model::Lane;

bool Throws(Check& check, CheckStatus to) {
  try {
    check.Transition(to);
  } catch (const prepush::util::InvalidState&) {
    return true;
  }
  return false;
}

void TestLegalLifecycle() {
  static_assert(CanTransition(CheckStatus::kPending, CheckStatus::kRunning));
  static_assert(CanTransition(CheckStatus::kPending, CheckStatus::kSkipped));
  static_assert(CanTransition(CheckStatus::kRunning, CheckStatus::kPassed));
  static_assert(CanTransition(CheckStatus::kRunning, CheckStatus::kFailed));
  static_assert(CanTransition(CheckStatus::kRunning, CheckStatus::kWarned));

  Check check("cargo test", {"cargo", "test"});
  assert(check.status == CheckStatus::kPending);

  check.Transition(CheckStatus::kRunning);
  check.Transition(CheckStatus::kWarned);
  assert(check.status == CheckStatus::kWarned);
  assert(IsTerminal(check.status));
}

void TestTerminalStatesAreFinal() {
  Check check("x", {"true"});
  check.Transition(CheckStatus::kRunning);
  check.Transition(CheckStatus::kPassed);

  assert(Throws(check, CheckStatus::kFailed));
  assert(Throws(check, CheckStatus::kRunning));
  assert(Throws(check, CheckStatus::kSkipped));
  assert(check.status == CheckStatus::kPassed);
}

void TestIllegalShortcuts() {
  Check pending("a", {"true"});
  assert(Throws(pending, CheckStatus::kPassed));
  assert(Throws(pending, CheckStatus::kPending));
  assert(pending.status == CheckStatus::kPending);

  Check running("b", {"true"});
  running.Transition(CheckStatus::kRunning);
  assert(Throws(running, CheckStatus::kSkipped));
  assert(Throws(running, CheckStatus::kRunning));
}

void TestSkipRemainingOnlyTouchesPending() {
  Lane lane;
  lane.name = "Native";
  lane.checks.emplace_back("x", std::vector<std::string>{"x"});
  lane.checks.emplace_back("y", std::vector<std::string>{"y"});
  lane.checks.emplace_back("z", std::vector<std::string>{"z"});

  lane.checks[0].Transition(CheckStatus::kRunning);
  lane.checks[0].Transition(CheckStatus::kPassed);
  lane.checks[1].Transition(CheckStatus::kRunning);
  lane.checks[1].Transition(CheckStatus::kFailed);

  lane.MarkFailed();
  lane.SkipRemaining();

  assert(lane.failed);
  assert(lane.checks[0].status == CheckStatus::kPassed);
  assert(lane.checks[1].status == CheckStatus::kFailed);
  assert(lane.checks[2].status == CheckStatus::kSkipped);
  assert(lane.Count(CheckStatus::kSkipped) == 1);
  assert(lane.Count(CheckStatus::kPending) == 0);
}

void TestStatusNames() {
  assert(std::strcmp(ToString(CheckStatus::kPassed), "passed") == 0);
  assert(std::strcmp(ToString(CheckStatus::kSkipped), "skipped") == 0);
}

} // namespace

int main() {
  TestLegalLifecycle();
  TestTerminalStatesAreFinal();
  TestIllegalShortcuts();
  TestSkipRemainingOnlyTouchesPending();
  TestStatusNames();

  std::cout << "prepush_unit_check_state: pass\n";
  return 0;
}
