#include "benchmark_lane.hpp"

#include "internal/bench/regression_engine.hpp"
#include "manifest_version.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::lane {

BenchmarkLaneExecutor::BenchmarkLaneExecutor(const prepush::v1::RuntimeConfig& config, std::filesystem::path root,
                                             bool force_record)
    : config_(config), root_(std::move(root)), force_record_(force_record) {
}

void BenchmarkLaneExecutor::Execute(model::Lane& lane, LaneContext& ctx) {
  util::Stopwatch watch;

  if (RunSequential(lane, ctx)) {
    const auto version = ReadManifestVersion(root_ / config_.project().primary_manifest());

    bench::RegressionEngine engine(ctx.runner, config_, root_, version, force_record_);
    lane.bench = engine.Process();

    if (lane.bench->has_fail) {
      lane.MarkFailed();
    }
  }

  FinishLane(lane, watch, ctx);
}

} // namespace prepush::lane
