#include "internal/scheduler/lane_scheduler.hpp"

#include <atomic>
#include <cassert>
#include <iostream>
#include <stdexcept>
#include <thread>

#include "internal/report/summary_reporter.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

using prepush::lane::LaneContext;
using prepush::lane::LaneExecutor;
using prepush::lane::StandardLaneExecutor;
using prepush::model::CheckStatus;
using prepush::model::Lane;
using prepush::scheduler::LaneScheduler;
using prepush::scheduler::ProgressEvent;
using prepush::testing::Failed;
using prepush::testing::FakeCommandRunner;
using prepush::testing::RecordingSink;

Lane MakeLane(const std::string& name, std::initializer_list<const char*> commands) {
  Lane lane;
  lane.name = name;
  for (const char* command : commands) {
    lane.checks.emplace_back(command, std::vector<std::string>{command});
  }
  return lane;
}

LaneScheduler::ExecutorMap StandardOnly() {
  LaneScheduler::ExecutorMap executors;
  executors[prepush::v1::LANE_KIND_STANDARD] = std::make_shared<StandardLaneExecutor>();
  return executors;
}

// Holds every lane until all of them have started.
class BarrierExecutor : public LaneExecutor {
 public:
  explicit BarrierExecutor(int lanes) : remaining_(lanes) {
  }

  void Execute(Lane& lane, LaneContext& ctx) override {
    --remaining_;
    while (remaining_.load() > 0) {
      std::this_thread::yield();
    }
    StandardLaneExecutor().Execute(lane, ctx);
  }

 private:
  std::atomic<int> remaining_;
};

class ThrowingExecutor : public LaneExecutor {
 public:
  void Execute(Lane&, LaneContext&) override {
    throw std::runtime_error("executor exploded");
  }
};

void TestFailingLaneDoesNotCancelSiblings() {
  FakeCommandRunner runner;
  runner.Script("y", Failed("y broke"));

  std::vector<Lane> lanes;
  lanes.push_back(MakeLane("A", {"x", "y", "z"}));
  lanes.push_back(MakeLane("B", {"p", "q"}));

  RecordingSink sink;
  LaneScheduler(runner, StandardOnly(), std::chrono::seconds(600)).RunAll(lanes, sink);

  assert(lanes[0].failed);
  assert(lanes[0].checks[2].status == CheckStatus::kSkipped);
  assert(!lanes[1].failed);
  assert(lanes[1].Count(CheckStatus::kPassed) == 2);
  assert(runner.CallCount("z") == 0);

  std::size_t finished = 0;
  for (const auto& event : sink.Events()) {
    if (event.kind == ProgressEvent::Kind::kLaneFinished) ++finished;
  }
  assert(finished == 2);

  const auto summary = prepush::report::Summarize(lanes);
  assert(!summary.ready);
  assert(summary.failed == 1);
  assert(summary.passed == 3);
  assert(summary.first_failure == &lanes[0].checks[1]);
}

void TestLanesRunConcurrently() {
  FakeCommandRunner runner;

  std::vector<Lane> lanes;
  lanes.push_back(MakeLane("A", {"a"}));
  lanes.push_back(MakeLane("B", {"b"}));
  lanes.push_back(MakeLane("C", {"c"}));

  LaneScheduler::ExecutorMap executors;
  executors[prepush::v1::LANE_KIND_STANDARD] = std::make_shared<BarrierExecutor>(3);

  RecordingSink sink;
  LaneScheduler(runner, executors, std::chrono::seconds(600)).RunAll(lanes, sink);

  for (const auto& lane : lanes) {
    assert(!lane.failed);
  }
  assert(runner.Calls().size() == 3);
}

void TestWorkerExceptionIsRethrownAfterJoin() {
  FakeCommandRunner runner;

  std::vector<Lane> lanes;
  lanes.push_back(MakeLane("A", {"a"}));
  lanes.push_back(MakeLane("Quick", {}));
  lanes[1].kind = prepush::v1::LANE_KIND_CONSISTENCY;

  auto executors                                = StandardOnly();
  executors[prepush::v1::LANE_KIND_CONSISTENCY] = std::make_shared<ThrowingExecutor>();

  RecordingSink sink;
  bool          threw = false;
  try {
    LaneScheduler(runner, executors, std::chrono::seconds(600)).RunAll(lanes, sink);
  } catch (const std::runtime_error& e) {
    threw = std::string(e.what()) == "executor exploded";
  }
  assert(threw);

  // the healthy lane still ran to completion
  assert(lanes[0].checks[0].status == CheckStatus::kPassed);
}

void TestMissingExecutorFailsBeforeRunning() {
  FakeCommandRunner runner;

  std::vector<Lane> lanes;
  lanes.push_back(MakeLane("A", {"a"}));
  lanes.push_back(MakeLane("Bench", {"bench"}));
  lanes[1].kind = prepush::v1::LANE_KIND_BENCHMARK;

  RecordingSink sink;
  bool          threw = false;
  try {
    LaneScheduler(runner, StandardOnly(), std::chrono::seconds(600)).RunAll(lanes, sink);
  } catch (const prepush::util::InvalidState&) {
    threw = true;
  }
  assert(threw);
  assert(runner.Calls().empty());
}

} // namespace

int main() {
  TestFailingLaneDoesNotCancelSiblings();
  TestLanesRunConcurrently();
  TestWorkerExceptionIsRethrownAfterJoin();
  TestMissingExecutorFailsBeforeRunning();

  std::cout << "prepush_unit_lane_scheduler: pass\n";
  return 0;
}
