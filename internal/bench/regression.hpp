#pragma once

#include <vector>

#include "internal/model/bench.hpp"
#include "prepush/v1/bench.pb.h"

namespace prepush::bench {

// Fixed policy: drift above these percentages warns / fails.
struct Thresholds {
  static constexpr double kWarnPct = 15.0;
  static constexpr double kFailPct = 50.0;
};

// (current - base) / base * 100, or 0 for a non-positive base.
double DriftPercent(double current_ns, double base_ns);

model::BenchStatus Classify(double drift_pct);

/*
  Compares every current result against the chosen baseline entry. With no
  baseline (nullptr, or an entry without benchmarks) every result is kNew and
  the outcome carries no baseline version.
*/
model::BenchOutcome Compare(const std::vector<model::BenchResult>& current, const prepush::v1::BaselineEntry* baseline);

} // namespace prepush::bench
