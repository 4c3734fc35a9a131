#include "regression.hpp"

#include <cmath>

namespace prepush::bench {

double DriftPercent(double current_ns, double base_ns) {
  if (!(base_ns > 0.0)) return 0.0;
  // multiply first: 15 / 100 * 100 is not exactly 15 in binary floating point
  return (current_ns - base_ns) * 100.0 / base_ns;
}

model::BenchStatus Classify(double drift_pct) {
  if (drift_pct > Thresholds::kFailPct) return model::BenchStatus::kFail;
  if (drift_pct > Thresholds::kWarnPct) return model::BenchStatus::kWarn;
  return model::BenchStatus::kPass;
}

model::BenchOutcome Compare(const std::vector<model::BenchResult>& current, const prepush::v1::BaselineEntry* baseline) {
  model::BenchOutcome outcome;
  outcome.results = current;

  const bool usable = baseline != nullptr && baseline->benchmarks_size() > 0;
  if (usable) {
    outcome.baseline_version = baseline->version();
  }

  for (const auto& result : current) {
    model::BenchComparison comparison;
    comparison.name    = result.name;
    comparison.mean_ns = result.mean_ns;

    if (usable) {
      auto it = baseline->benchmarks().find(result.name);
      if (it != baseline->benchmarks().end()) {
        const double pct = DriftPercent(result.mean_ns, it->second);

        comparison.base_ns    = it->second;
        comparison.pct_change = std::round(pct * 10.0) / 10.0;
        comparison.status     = Classify(pct);

        outcome.has_warn |= comparison.status == model::BenchStatus::kWarn;
        outcome.has_fail |= comparison.status == model::BenchStatus::kFail;
      }
    }

    outcome.comparisons.push_back(std::move(comparison));
  }

  return outcome;
}

} // namespace prepush::bench
