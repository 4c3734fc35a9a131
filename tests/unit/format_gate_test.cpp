#include "internal/gate/format_gate.hpp"

#include <cassert>
#include <iostream>

#include "internal/config/config_loader.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using prepush::gate::FormatGate;
using prepush::gate::GateStatus;
using prepush::testing::Failed;
using prepush::testing::FakeCommandRunner;
using prepush::testing::Passed;

constexpr const char* kCheck = "cargo fmt -- --check";
constexpr const char* kFix   = "cargo fmt";

void TestCleanTreeRunsCheckOnce() {
  auto              config = prepush::config::ConfigLoader::Default();
  FakeCommandRunner runner;

  auto result = FormatGate(runner, config).Run();
  assert(result.status == GateStatus::kOk);
  assert(runner.Calls().size() == 1);
  assert(runner.CallCount(kCheck) == 1);
  assert(runner.CallCount(kFix) == 0);
}

void TestDirtyTreeIsAutoFixed() {
  auto              config = prepush::config::ConfigLoader::Default();
  FakeCommandRunner runner;
  runner.Script(kCheck, {Failed("Diff in src/lib.rs"), Passed()});

  auto result = FormatGate(runner, config).Run();
  assert(result.status == GateStatus::kAutoFixed);

  const auto calls = runner.Calls();
  assert(calls.size() == 3);
  assert(calls[0] == kCheck);
  assert(calls[1] == kFix);
  assert(calls[2] == kCheck);
}

void TestRecheckStillDirtyIsFatal() {
  auto              config = prepush::config::ConfigLoader::Default();
  FakeCommandRunner runner;
  runner.Script(kCheck, Failed("Diff in src/lib.rs"));

  bool threw = false;
  try {
    (void)FormatGate(runner, config).Run();
  } catch (const prepush::util::GateError& e) {
    threw = true;
    assert(prepush::testing::Contains(e.what(), "still fails after auto-fix"));
  }
  assert(threw);

  // exactly one fix attempt
  assert(runner.CallCount(kFix) == 1);
  assert(runner.CallCount(kCheck) == 2);
}

void TestFailingFixIsFatal() {
  auto              config = prepush::config::ConfigLoader::Default();
  FakeCommandRunner runner;
  runner.Script(kCheck, Failed("Diff in src/lib.rs"));
  runner.Script(kFix, Failed("error: couldn't parse src/lib.rs"));

  bool threw = false;
  try {
    (void)FormatGate(runner, config).Run();
  } catch (const prepush::util::GateError& e) {
    threw = true;
    assert(prepush::testing::Contains(e.what(), "cargo fmt failed"));
    assert(prepush::testing::Contains(e.what(), "couldn't parse"));
  }
  assert(threw);
  assert(runner.CallCount(kCheck) == 1);
}

void TestConfiguredCommandsAreUsed() {
  auto config = prepush::config::ConfigLoader::Default();
  config.mutable_format_gate()->clear_check_command();
  config.mutable_format_gate()->add_check_command("fmt-check");
  config.mutable_format_gate()->clear_fix_command();
  config.mutable_format_gate()->add_fix_command("fmt-fix");

  FakeCommandRunner runner;
  runner.Script("fmt-check", {Failed("dirty"), Passed()});

  auto result = FormatGate(runner, config).Run();
  assert(result.status == GateStatus::kAutoFixed);
  assert(runner.CallCount("fmt-fix") == 1);
  assert(std::string(ToString(result.status)) == "auto-fixed");
}

} // namespace

int main() {
  TestCleanTreeRunsCheckOnce();
  TestDirtyTreeIsAutoFixed();
  TestRecheckStillDirtyIsFatal();
  TestFailingFixIsFatal();
  TestConfiguredCommandsAreUsed();

  std::cout << "prepush_unit_format_gate: pass\n";
  return 0;
}
