#pragma once

#include <filesystem>

#include "internal/scheduler/lane_scheduler.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::factory {

struct RunOptions {
  bool skip_bench      = false;
  bool bench_only      = false;
  bool update_baseline = false;
};

/*
  Composition root: the only place that knows which executor handles which
  lane kind.
*/
scheduler::LaneScheduler::ExecutorMap BuildExecutors(const prepush::v1::RuntimeConfig& config, const std::filesystem::path& root,
                                                     const RunOptions& options);

// config.project().root() made absolute.
std::filesystem::path ResolveRoot(const prepush::v1::RuntimeConfig& config);

} // namespace prepush::factory
