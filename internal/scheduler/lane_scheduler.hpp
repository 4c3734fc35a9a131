#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <vector>

#include "internal/lane/lane_executor.hpp"
#include "internal/model/lane.hpp"
#include "internal/process/command_runner.hpp"
#include "progress_event.hpp"

namespace prepush::scheduler {

/*
  Runs every lane on its own thread and blocks until all of them finish.

  Lanes share nothing mutable: each worker owns one Lane, the command runner
  and executors are stateless, and progress goes through the sink. A failing
  lane never cancels its siblings.
*/
class LaneScheduler {
 public:
  using ExecutorMap = std::map<prepush::v1::LaneKind, std::shared_ptr<lane::LaneExecutor>>;

  LaneScheduler(process::CommandRunner& runner, ExecutorMap executors, std::chrono::seconds timeout);

  // Rethrows the first exception raised inside a worker after all have joined.
  void RunAll(std::vector<model::Lane>& lanes, ProgressSink& progress);

 private:
  lane::LaneExecutor& ExecutorFor(prepush::v1::LaneKind kind);

  process::CommandRunner& runner_;
  ExecutorMap             executors_;
  std::chrono::seconds    timeout_;
};

} // namespace prepush::scheduler
