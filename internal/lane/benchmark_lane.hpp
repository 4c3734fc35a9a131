#pragma once

#include <filesystem>

#include "lane_executor.hpp"

namespace prepush::v1 {
class RuntimeConfig;
}

namespace prepush::lane {

/*
  Runs the benchmark commands like a standard lane, then, if they all
  passed, hands the results to the regression engine. A kFail comparison
  fails the lane; warnings do not.
*/
class BenchmarkLaneExecutor : public LaneExecutor {
 public:
  BenchmarkLaneExecutor(const prepush::v1::RuntimeConfig& config, std::filesystem::path root, bool force_record);

  void Execute(model::Lane& lane, LaneContext& ctx) override;

 private:
  const prepush::v1::RuntimeConfig& config_;
  std::filesystem::path             root_;
  bool                              force_record_;
};

} // namespace prepush::lane
