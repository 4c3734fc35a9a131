#pragma once

#include <filesystem>
#include <vector>

#include "internal/model/lane.hpp"

namespace prepush::v1 {
class RuntimeConfig;
}

namespace prepush::lane {

struct LaneSelection {
  bool skip_bench = false;
  bool bench_only = false;
};

/*
  Turns configured lanes into runnable ones, every check pending.

  Checks with when_tool / when_file are dropped when the tool is not on PATH
  or the file does not exist under root. --bench-only keeps only benchmark
  lanes, --skip-bench drops them.
*/
std::vector<model::Lane> BuildLanes(const prepush::v1::RuntimeConfig& config, const std::filesystem::path& root,
                                    const LaneSelection& selection);

} // namespace prepush::lane
