#include "factory.hpp"

#include <memory>
#include <system_error>

#include "internal/lane/benchmark_lane.hpp"
#include "internal/lane/consistency_lane.hpp"
#include "internal/lane/lane_executor.hpp"

namespace prepush::factory {

scheduler::LaneScheduler::ExecutorMap BuildExecutors(const prepush::v1::RuntimeConfig& config, const std::filesystem::path& root,
                                                     const RunOptions& options) {
  scheduler::LaneScheduler::ExecutorMap executors;
  executors[prepush::v1::LANE_KIND_STANDARD]    = std::make_shared<lane::StandardLaneExecutor>();
  executors[prepush::v1::LANE_KIND_CONSISTENCY] = std::make_shared<lane::ConsistencyLaneExecutor>(config, root);
  executors[prepush::v1::LANE_KIND_BENCHMARK] =
      std::make_shared<lane::BenchmarkLaneExecutor>(config, root, options.update_baseline);
  return executors;
}

std::filesystem::path ResolveRoot(const prepush::v1::RuntimeConfig& config) {
  std::error_code ec;
  auto            root = std::filesystem::absolute(config.project().root(), ec);
  if (ec) return config.project().root();

  auto canonical = std::filesystem::weakly_canonical(root, ec);
  return ec ? root : canonical;
}

} // namespace prepush::factory
