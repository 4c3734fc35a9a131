#include "lane_scheduler.hpp"

#include <cstdint>
#include <exception>
#include <thread>

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"

namespace prepush::scheduler {

using prepush::observability::IntField;
using prepush::observability::StringField;

LaneScheduler::LaneScheduler(process::CommandRunner& runner, ExecutorMap executors, std::chrono::seconds timeout)
    : runner_(runner), executors_(std::move(executors)), timeout_(timeout) {
}

lane::LaneExecutor& LaneScheduler::ExecutorFor(prepush::v1::LaneKind kind) {
  auto it = executors_.find(kind);
  if (it == executors_.end() || !it->second) {
    throw util::InvalidState("no executor for lane kind " + std::to_string(static_cast<int>(kind)));
  }
  return *it->second;
}

void LaneScheduler::RunAll(std::vector<model::Lane>& lanes, ProgressSink& progress) {
  // resolve up front so a missing executor fails before anything runs
  std::vector<lane::LaneExecutor*> executors;
  executors.reserve(lanes.size());
  for (const auto& lane : lanes) {
    executors.push_back(&ExecutorFor(lane.kind));
  }

  std::vector<std::exception_ptr> errors(lanes.size());
  std::vector<std::thread>        workers;
  workers.reserve(lanes.size());

  PREPUSH_LOG_INFO("starting lanes", {IntField("count", static_cast<std::int64_t>(lanes.size()))});

  for (std::size_t i = 0; i < lanes.size(); ++i) {
    workers.emplace_back([this, i, &lanes, &executors, &errors, &progress] {
      lane::LaneContext ctx{runner_, progress, i, timeout_};
      try {
        executors[i]->Execute(lanes[i], ctx);
      } catch (const std::exception& e) {
        PREPUSH_LOG_ERROR("lane aborted", {StringField("lane", lanes[i].name), StringField("error", e.what())});
        errors[i] = std::current_exception();
      }
    });
  }

  for (auto& worker : workers) {
    worker.join();
  }

  for (const auto& error : errors) {
    if (error) std::rethrow_exception(error);
  }
}

} // namespace prepush::scheduler
