#pragma once

#include <filesystem>
#include <vector>

#include "internal/model/bench.hpp"

namespace prepush::bench {

/*
  Walks a benchmark tool's output tree:

    <root>/<group>/<bench>/new/estimates.json   ->  "group/bench"

  Anything under a "report" directory is an aggregate and is ignored. Files
  that do not parse, or have no mean.point_estimate, contribute nothing.
  Results are sorted by name; means are rounded to 0.1ns.
*/
std::vector<model::BenchResult> ExtractResults(const std::filesystem::path& root);

} // namespace prepush::bench
