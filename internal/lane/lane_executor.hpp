#pragma once

#include <chrono>
#include <cstddef>

#include "internal/model/lane.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/scheduler/progress_event.hpp"
#include "internal/util/time.hpp"

namespace prepush::lane {

struct LaneContext {
  process::CommandRunner&  runner;
  scheduler::ProgressSink& progress;
  std::size_t              index;
  std::chrono::seconds     timeout;
};

/*
  Runs one lane to completion on the calling thread. An executor only
  mutates the lane it is given.
*/
class LaneExecutor {
 public:
  virtual ~LaneExecutor() = default;

  virtual void Execute(model::Lane& lane, LaneContext& ctx) = 0;
};

// Plain subprocess checks, stopping at the first failure.
class StandardLaneExecutor : public LaneExecutor {
 public:
  void Execute(model::Lane& lane, LaneContext& ctx) override;
};

// ------------------------------------------------------------
// Building blocks shared by the executors
// ------------------------------------------------------------

void BeginCheck(model::Check& check, LaneContext& ctx);
void EndCheck(model::Check& check, model::CheckStatus status, LaneContext& ctx);

// Runs check.command through the runner. Returns true if it passed.
bool RunCheck(model::Check& check, LaneContext& ctx);

/*
  Runs the lane's checks in order. On the first failure the lane is marked
  failed and every remaining pending check skipped. Returns !lane.failed.
*/
bool RunSequential(model::Lane& lane, LaneContext& ctx);

// Records elapsed time and reports the lane as done.
void FinishLane(model::Lane& lane, const util::Stopwatch& watch, LaneContext& ctx);

} // namespace prepush::lane
