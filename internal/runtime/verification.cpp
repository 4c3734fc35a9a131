#include "verification.hpp"

#include <chrono>
#include <memory>
#include <optional>
#include <vector>

#include "internal/gate/format_gate.hpp"
#include "internal/lane/lane_builder.hpp"
#include "internal/observability/logging.hpp"
#include "internal/report/summary_reporter.hpp"
#include "internal/scheduler/lane_scheduler.hpp"
#include "internal/scheduler/progress_channel.hpp"
#include "internal/scheduler/progress_renderer.hpp"
#include "internal/util/errors.hpp"

namespace prepush::runtime {

using prepush::observability::StringField;

Verification::Verification(const prepush::v1::RuntimeConfig& config, factory::RunOptions options, process::CommandRunner& runner,
                           std::ostream& out, report::Style style)
    : config_(config), options_(options), runner_(runner), out_(out), style_(style) {
}

int Verification::Run() {
  util::Stopwatch         total;
  report::SummaryReporter reporter(out_, style_);

  // ------------------------------------------------------------
  // Gate: format check
  // ------------------------------------------------------------

  std::optional<gate::GateResult> gate_result;
  if (!options_.bench_only) {
    try {
      gate_result = gate::FormatGate(runner_, config_).Run();
    } catch (const util::GateError& e) {
      PREPUSH_LOG_ERROR("format gate failed", {StringField("error", e.what())});
      reporter.PrintGateFailure(e.what());
      return 1;
    }
  }

  reporter.PrintHeader("Pre-Push Verification");
  reporter.PrintGate(gate_result);

  // ------------------------------------------------------------
  // Build lanes
  // ------------------------------------------------------------

  const auto root = factory::ResolveRoot(config_);

  lane::LaneSelection selection;
  selection.skip_bench = options_.skip_bench;
  selection.bench_only = options_.bench_only;

  auto lanes = lane::BuildLanes(config_, root, selection);
  if (lanes.empty()) {
    reporter.PrintNothingToRun();
    return 0;
  }

  // ------------------------------------------------------------
  // Execute
  // ------------------------------------------------------------

  std::vector<scheduler::LaneDisplay> displays;
  displays.reserve(lanes.size());
  for (const auto& lane : lanes) {
    displays.push_back({lane.name, lane.color, lane.checks.size(), 0});
  }

  auto channel = std::make_shared<scheduler::ProgressChannel>();

  scheduler::ProgressRenderer renderer(channel, std::move(displays), out_, style_);
  scheduler::LaneScheduler    lane_scheduler(runner_, factory::BuildExecutors(config_, root, options_),
                                             std::chrono::seconds(config_.timeout_seconds()));

  // the renderer's destructor stops it if RunAll throws
  renderer.Start();
  lane_scheduler.RunAll(lanes, *channel);
  renderer.Stop();

  // ------------------------------------------------------------
  // Summary
  // ------------------------------------------------------------

  return reporter.PrintSummary(lanes, total.Elapsed()) ? 0 : 1;
}

} // namespace prepush::runtime
