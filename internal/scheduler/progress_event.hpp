#pragma once

#include <cstddef>
#include <string>

#include "internal/model/check.hpp"

namespace prepush::scheduler {

struct ProgressEvent {
  enum class Kind {
    kCheckStarted,
    kCheckFinished,
    kLaneFinished,
  };

  Kind        kind = Kind::kCheckStarted;
  std::size_t lane = 0;
  std::string check_name;

  model::CheckStatus status      = model::CheckStatus::kPending;
  bool               lane_failed = false;
};

/*
  Where lane workers report progress. Implementations must accept calls from
  several worker threads at once.
*/
class ProgressSink {
 public:
  virtual ~ProgressSink() = default;

  virtual void Publish(const ProgressEvent& event) = 0;
};

} // namespace prepush::scheduler
