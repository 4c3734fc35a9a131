#include "internal/runtime/verification.hpp"

#include <cassert>
#include <initializer_list>
#include <iostream>
#include <sstream>
#include <string>

#include "internal/bench/baseline_store.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/observability/logging.hpp"
#include "test_support.hpp"

namespace {

using prepush::factory::RunOptions;
using prepush::runtime::Verification;
using prepush::testing::Contains;
using prepush::testing::Failed;
using prepush::testing::FakeCommandRunner;
using prepush::testing::Passed;
using prepush::testing::WriteFile;

void AddLane(prepush::v1::RuntimeConfig* config, const std::string& name, prepush::v1::LaneKind kind,
             std::initializer_list<const char*> commands) {
  auto* lane = config->add_lanes();
  lane->set_name(name);
  lane->set_color("cyan");
  lane->set_kind(kind);
  for (const char* command : commands) {
    auto* check = lane->add_checks();
    check->set_name(command);
    check->add_command(command);
  }
}

prepush::v1::RuntimeConfig MakeConfig(const std::filesystem::path& root) {
  auto config = prepush::config::ConfigLoader::Default();
  config.mutable_project()->set_root(root.string());

  auto* gate = config.mutable_format_gate();
  gate->clear_check_command();
  gate->add_check_command("fmt-check");
  gate->clear_fix_command();
  gate->add_fix_command("fmt-fix");

  config.clear_lanes();
  return config;
}

struct RunResult {
  int         exit_code = -1;
  std::string output;
};

RunResult RunVerification(const prepush::v1::RuntimeConfig& config, RunOptions options, FakeCommandRunner& runner) {
  std::ostringstream out;
  Verification       verification(config, options, runner, out, prepush::report::Style(false));

  RunResult result;
  result.exit_code = verification.Run();
  result.output    = out.str();
  return result;
}

void TestFailingCheckBlocksPush() {
  const auto root   = prepush::testing::MakeTempDir("verification_fail");
  auto       config = MakeConfig(root);
  AddLane(&config, "A", prepush::v1::LANE_KIND_STANDARD, {"x", "y", "z"});
  AddLane(&config, "B", prepush::v1::LANE_KIND_STANDARD, {"p"});

  FakeCommandRunner runner;
  runner.Script("y", Failed("assertion failed: y\n"));

  const auto result = RunVerification(config, {}, runner);

  assert(result.exit_code == 1);
  assert(Contains(result.output, "Pre-Push Verification"));
  assert(Contains(result.output, "Format check"));
  assert(Contains(result.output, "Fix issues before pushing"));
  assert(Contains(result.output, "Failed: y"));
  assert(Contains(result.output, "assertion failed: y"));
  assert(runner.CallCount("z") == 0);
  assert(runner.CallCount("p") == 1);
}

void TestAutoFixedAndGreenIsReady() {
  const auto root   = prepush::testing::MakeTempDir("verification_green");
  auto       config = MakeConfig(root);
  AddLane(&config, "A", prepush::v1::LANE_KIND_STANDARD, {"x"});

  FakeCommandRunner runner;
  runner.Script("fmt-check", {Failed("dirty"), Passed()});

  const auto result = RunVerification(config, {}, runner);

  assert(result.exit_code == 0);
  assert(Contains(result.output, "(auto-fixed)"));
  assert(Contains(result.output, "Ready to push"));
  assert(runner.CallCount("fmt-fix") == 1);
}

void TestGateFailureStopsBeforeLanes() {
  const auto root   = prepush::testing::MakeTempDir("verification_gate");
  auto       config = MakeConfig(root);
  AddLane(&config, "A", prepush::v1::LANE_KIND_STANDARD, {"x"});

  FakeCommandRunner runner;
  runner.Script("fmt-check", Failed("dirty"));

  const auto result = RunVerification(config, {}, runner);

  assert(result.exit_code == 1);
  assert(Contains(result.output, "Format Gate Failed"));
  assert(Contains(result.output, "still fails after auto-fix"));
  assert(!Contains(result.output, "Pre-Push Verification"));
  assert(runner.CallCount("x") == 0);
}

void TestBenchOnlySkipsGateAndOtherLanes() {
  const auto root = prepush::testing::MakeTempDir("verification_bench_only");
  WriteFile(root / "Cargo.toml", "[package]\nversion = \"1.1.0\"\n");
  WriteFile(root / "target/criterion/snapshot/load/new/estimates.json", R"({"mean": {"point_estimate": 120.0}})");

  prepush::v1::BaselineEntry entry;
  entry.set_version("1.0.0");
  (*entry.mutable_benchmarks())["snapshot/load"] = 100.0;
  prepush::bench::BaselineStore(root / ".bench-baselines/history.json").Record(entry);

  auto config = MakeConfig(root);
  AddLane(&config, "A", prepush::v1::LANE_KIND_STANDARD, {"x"});
  AddLane(&config, "Bench", prepush::v1::LANE_KIND_BENCHMARK, {"bench"});

  RunOptions options;
  options.bench_only = true;

  FakeCommandRunner runner;
  const auto        result = RunVerification(config, options, runner);

  // a warning alone does not block the push
  assert(result.exit_code == 0);
  assert(runner.CallCount("fmt-check") == 0);
  assert(runner.CallCount("x") == 0);
  assert(runner.CallCount("bench") == 1);
  assert(!Contains(result.output, "Format check"));
  assert(Contains(result.output, "Bench: 1 warnings"));
  assert(Contains(result.output, "+20.0%"));
  assert(Contains(result.output, "Ready to push"));
}

void TestNothingToRun() {
  const auto root   = prepush::testing::MakeTempDir("verification_empty");
  auto       config = MakeConfig(root);
  AddLane(&config, "Bench", prepush::v1::LANE_KIND_BENCHMARK, {"bench"});

  RunOptions options;
  options.skip_bench = true;

  FakeCommandRunner runner;
  const auto        result = RunVerification(config, options, runner);

  assert(result.exit_code == 0);
  assert(Contains(result.output, "Nothing to run."));
  assert(runner.CallCount("bench") == 0);
}

} // namespace

int main() {
  prepush::observability::InitializeLogging(prepush::config::ConfigLoader::Default());

  TestFailingCheckBlocksPush();
  TestAutoFixedAndGreenIsReady();
  TestGateFailureStopsBeforeLanes();
  TestBenchOnlySkipsGateAndOtherLanes();
  TestNothingToRun();

  prepush::observability::ShutdownLogging();

  std::cout << "prepush_unit_verification: pass\n";
  return 0;
}
