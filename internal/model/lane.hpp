#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "bench.hpp"
#include "check.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::model {

/*
  An ordered group of checks for one validation concern.

  Built completely before scheduling, then owned by exactly one worker until
  the scheduler joins. failed only ever goes false -> true.
*/
struct Lane {
  std::string           name;
  std::string           color;
  prepush::v1::LaneKind kind = prepush::v1::LANE_KIND_STANDARD;
  std::vector<Check>    checks;
  util::Duration        elapsed{0};
  bool                  failed = false;

  // Present only on a benchmark lane whose post-processing ran.
  std::optional<BenchOutcome> bench;

  void MarkFailed() {
    failed = true;
  }

  // Marks every still-pending check skipped.
  void SkipRemaining();

  std::size_t Count(CheckStatus status) const;
};

} // namespace prepush::model
