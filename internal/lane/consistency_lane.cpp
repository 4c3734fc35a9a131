#include "consistency_lane.hpp"

#include <string>
#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "manifest_version.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::lane {

namespace fs = std::filesystem;

using model::CheckStatus;
using prepush::observability::StringField;

ConsistencyLaneExecutor::ConsistencyLaneExecutor(const prepush::v1::RuntimeConfig& config, fs::path root)
    : root_(std::move(root)),
      primary_manifest_(root_ / config.project().primary_manifest()),
      secondary_manifest_(root_ / config.project().secondary_manifest()),
      parity_source_(root_ / config.parity().source()),
      parity_artifact_(root_ / config.parity().artifact()),
      compiler_(config.parity().compiler()) {
}

void ConsistencyLaneExecutor::Execute(model::Lane& lane, LaneContext& ctx) {
  util::Stopwatch watch;

  if (lane.checks.size() != 2) {
    throw util::InvalidState("consistency lane '" + lane.name + "' needs exactly two checks, got " +
                             std::to_string(lane.checks.size()));
  }

  if (!CheckVersions(lane.checks[0], ctx)) {
    lane.MarkFailed();
    lane.SkipRemaining();
    FinishLane(lane, watch, ctx);
    return;
  }

  CheckParity(lane, lane.checks[1], ctx);
  FinishLane(lane, watch, ctx);
}

bool ConsistencyLaneExecutor::CheckVersions(model::Check& check, LaneContext& ctx) {
  BeginCheck(check, ctx);
  util::Stopwatch watch;

  const auto primary   = ReadManifestVersion(primary_manifest_);
  const auto secondary = ReadManifestVersion(secondary_manifest_);

  check.elapsed = watch.Elapsed();

  if (primary == secondary) {
    check.name = "version consistency (" + primary + ")";
    EndCheck(check, CheckStatus::kPassed, ctx);
    return true;
  }

  check.name   = "version mismatch (" + primary + " vs " + secondary + ")";
  check.output = primary_manifest_.filename().string() + "=" + primary + "  " + secondary_manifest_.filename().string() + "=" +
                 secondary;
  EndCheck(check, CheckStatus::kFailed, ctx);
  return false;
}

void ConsistencyLaneExecutor::RefreshParityArtifact(LaneContext& ctx) {
  std::error_code ec;
  if (!fs::exists(parity_source_, ec)) return;

  bool stale = !fs::exists(parity_artifact_, ec);
  if (!stale) {
    const auto source_time   = fs::last_write_time(parity_source_, ec);
    const auto artifact_time = fs::last_write_time(parity_artifact_, ec);
    stale                    = ec || source_time > artifact_time;
  }
  if (!stale) return;

  fs::create_directories(parity_artifact_.parent_path(), ec);

  auto result = ctx.runner.Run({compiler_, parity_source_.string(), "-o", parity_artifact_.string()}, ctx.timeout);
  if (!result.ok()) {
    // no artifact means the check is reported as warned below
    PREPUSH_LOG_WARN("parity tool build failed", {StringField("compiler", compiler_), StringField("output", result.output)});
  }
}

void ConsistencyLaneExecutor::CheckParity(model::Lane& lane, model::Check& check, LaneContext& ctx) {
  BeginCheck(check, ctx);
  util::Stopwatch watch;

  RefreshParityArtifact(ctx);

  std::error_code ec;
  if (!fs::exists(parity_artifact_, ec)) {
    check.elapsed = watch.Elapsed();
    check.name += " (compiler unavailable)";
    EndCheck(check, CheckStatus::kWarned, ctx);
    return;
  }

  auto result   = ctx.runner.Run({parity_artifact_.string()}, ctx.timeout);
  check.elapsed = watch.Elapsed();
  check.output  = std::move(result.output);

  if (result.ok()) {
    EndCheck(check, CheckStatus::kPassed, ctx);
    return;
  }

  lane.MarkFailed();
  EndCheck(check, CheckStatus::kFailed, ctx);
}

} // namespace prepush::lane
