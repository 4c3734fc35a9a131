#include "bench_extractor.hpp"

#include <google/protobuf/util/json_util.h>

#include <algorithm>
#include <cmath>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>

#include "internal/observability/logging.hpp"
#include "prepush/v1/bench.pb.h"

namespace prepush::bench {

namespace fs = std::filesystem;

using prepush::observability::StringField;

namespace {

std::optional<double> ReadMeanEstimate(const fs::path& file) {
  std::ifstream in(file);
  if (!in) return std::nullopt;

  std::stringstream buffer;
  buffer << in.rdbuf();

  prepush::v1::Estimates estimates;

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  auto status = google::protobuf::util::JsonStringToMessage(buffer.str(), &estimates, options);
  if (!status.ok()) {
    PREPUSH_LOG_DEBUG("skipping unreadable estimates", {StringField("file", file.string()), StringField("error", status.ToString())});
    return std::nullopt;
  }

  if (!estimates.has_mean() || !estimates.mean().has_point_estimate()) {
    return std::nullopt;
  }
  return estimates.mean().point_estimate();
}

} // namespace

std::vector<model::BenchResult> ExtractResults(const fs::path& root) {
  std::vector<model::BenchResult> results;

  std::error_code ec;
  if (!fs::is_directory(root, ec)) {
    return results;
  }

  for (auto it = fs::recursive_directory_iterator(root, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
    const auto& path = it->path();
    if (path.filename() != "estimates.json" || path.parent_path().filename() != "new") continue;
    if (!it->is_regular_file(ec)) continue;

    const auto bench_dir = path.parent_path().parent_path().lexically_relative(root);

    std::string name;
    bool        aggregate = false;
    for (const auto& part : bench_dir) {
      if (part == "report") {
        aggregate = true;
        break;
      }
      if (!name.empty()) name.push_back('/');
      name += part.string();
    }
    if (aggregate || name.empty() || name == ".") continue;

    auto mean = ReadMeanEstimate(path);
    if (!mean) continue;

    results.push_back({name, std::round(*mean * 10.0) / 10.0});
  }

  std::sort(results.begin(), results.end(), [](const auto& a, const auto& b) { return a.name < b.name; });
  return results;
}

} // namespace prepush::bench
