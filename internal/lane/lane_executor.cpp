#include "lane_executor.hpp"

#include "internal/observability/logging.hpp"

namespace prepush::lane {

using model::CheckStatus;
using prepush::observability::SecondsField;
using prepush::observability::StringField;
using scheduler::ProgressEvent;

void BeginCheck(model::Check& check, LaneContext& ctx) {
  check.Transition(CheckStatus::kRunning);

  ProgressEvent event;
  event.kind       = ProgressEvent::Kind::kCheckStarted;
  event.lane       = ctx.index;
  event.check_name = check.name;
  event.status     = CheckStatus::kRunning;
  ctx.progress.Publish(event);
}

void EndCheck(model::Check& check, CheckStatus status, LaneContext& ctx) {
  check.Transition(status);

  ProgressEvent event;
  event.kind       = ProgressEvent::Kind::kCheckFinished;
  event.lane       = ctx.index;
  event.check_name = check.name;
  event.status     = status;
  ctx.progress.Publish(event);
}

bool RunCheck(model::Check& check, LaneContext& ctx) {
  BeginCheck(check, ctx);

  auto result = ctx.runner.Run(check.command, ctx.timeout);

  check.elapsed = result.elapsed;
  check.output  = std::move(result.output);

  const auto status = result.ok() ? CheckStatus::kPassed : CheckStatus::kFailed;
  if (!result.ok()) {
    PREPUSH_LOG_INFO("check failed", {StringField("check", check.name), SecondsField("elapsed", util::ToSeconds(check.elapsed))});
  }
  EndCheck(check, status, ctx);
  return result.ok();
}

bool RunSequential(model::Lane& lane, LaneContext& ctx) {
  for (auto& check : lane.checks) {
    if (check.status != CheckStatus::kPending) continue;

    if (!RunCheck(check, ctx)) {
      lane.MarkFailed();
      lane.SkipRemaining();
      break;
    }
  }
  return !lane.failed;
}

void FinishLane(model::Lane& lane, const util::Stopwatch& watch, LaneContext& ctx) {
  lane.elapsed = watch.Elapsed();

  ProgressEvent event;
  event.kind        = ProgressEvent::Kind::kLaneFinished;
  event.lane        = ctx.index;
  event.lane_failed = lane.failed;
  ctx.progress.Publish(event);

  PREPUSH_LOG_INFO("lane finished", {StringField("lane", lane.name), StringField("result", lane.failed ? "failed" : "ok"),
                                     SecondsField("elapsed", util::ToSeconds(lane.elapsed))});
}

void StandardLaneExecutor::Execute(model::Lane& lane, LaneContext& ctx) {
  util::Stopwatch watch;
  RunSequential(lane, ctx);
  FinishLane(lane, watch, ctx);
}

} // namespace prepush::lane
