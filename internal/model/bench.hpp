#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace prepush::model {

enum class BenchStatus : std::uint8_t {
  kNew  = 0,
  kPass = 1,
  kWarn = 2,
  kFail = 3,
};

const char* ToString(BenchStatus status);

struct BenchResult {
  std::string name;
  double      mean_ns = 0.0;
};

struct BenchComparison {
  std::string           name;
  double                mean_ns = 0.0;
  std::optional<double> base_ns;
  std::optional<double> pct_change;
  BenchStatus           status = BenchStatus::kNew;
};

/*
  What the benchmark lane learned after its subprocess checks passed.

  Without a usable baseline every comparison is kNew and baseline_version is
  unset; results always holds the raw measurements.
*/
struct BenchOutcome {
  std::vector<BenchResult>     results;
  std::vector<BenchComparison> comparisons;
  std::optional<std::string>   baseline_version;
  bool                         has_warn = false;
  bool                         has_fail = false;
  std::optional<std::string>   recorded_version;

  bool HasBaseline() const {
    return baseline_version.has_value();
  }
};

} // namespace prepush::model
