#include "lane_builder.hpp"

#include <system_error>

#include "internal/observability/logging.hpp"
#include "internal/process/subprocess_runner.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::lane {

using prepush::observability::StringField;

namespace {

bool IsApplicable(const prepush::v1::CheckConfig& check, const std::filesystem::path& root) {
  if (!check.when_tool().empty() && !process::FindExecutable(check.when_tool())) {
    PREPUSH_LOG_DEBUG("check dropped, tool missing", {StringField("check", check.name()), StringField("tool", check.when_tool())});
    return false;
  }
  if (!check.when_file().empty()) {
    std::error_code ec;
    if (!std::filesystem::exists(root / check.when_file(), ec)) {
      PREPUSH_LOG_DEBUG("check dropped, file missing", {StringField("check", check.name()), StringField("file", check.when_file())});
      return false;
    }
  }
  return true;
}

} // namespace

std::vector<model::Lane> BuildLanes(const prepush::v1::RuntimeConfig& config, const std::filesystem::path& root,
                                    const LaneSelection& selection) {
  std::vector<model::Lane> lanes;

  for (const auto& lane_config : config.lanes()) {
    const bool is_bench = lane_config.kind() == prepush::v1::LANE_KIND_BENCHMARK;
    if (is_bench && selection.skip_bench) continue;
    if (!is_bench && selection.bench_only) continue;

    model::Lane lane;
    lane.name  = lane_config.name();
    lane.color = lane_config.color();
    lane.kind  = lane_config.kind();

    for (const auto& check_config : lane_config.checks()) {
      if (!IsApplicable(check_config, root)) continue;
      lane.checks.emplace_back(check_config.name(),
                               std::vector<std::string>(check_config.command().begin(), check_config.command().end()));
    }

    lanes.push_back(std::move(lane));
  }

  return lanes;
}

} // namespace prepush::lane
