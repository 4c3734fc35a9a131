#include "regression_engine.hpp"

#include <cstdint>
#include <stdexcept>

#include "bench_extractor.hpp"
#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"
#include "prepush/v1/config.pb.h"
#include "regression.hpp"

namespace prepush::bench {

using prepush::observability::BoolField;
using prepush::observability::IntField;
using prepush::observability::StringField;

RegressionEngine::RegressionEngine(process::CommandRunner& runner, const prepush::v1::RuntimeConfig& config,
                                   std::filesystem::path root, std::string current_version, bool force_record)
    : runner_(runner),
      results_dir_(root / config.bench().results_dir()),
      store_(root / config.bench().baseline_file()),
      revision_command_(config.bench().revision_command().begin(), config.bench().revision_command().end()),
      timeout_(config.timeout_seconds()),
      current_version_(std::move(current_version)),
      force_record_(force_record) {
}

std::string RegressionEngine::ShortRevision() {
  if (revision_command_.empty()) return "unknown";

  auto result = runner_.Run(revision_command_, timeout_);
  if (!result.ok()) return "unknown";

  const auto first = result.output.find_first_not_of(" \t\r\n");
  if (first == std::string::npos) return "unknown";
  const auto last = result.output.find_last_not_of(" \t\r\n");
  return result.output.substr(first, last - first + 1);
}

model::BenchOutcome RegressionEngine::Process() {
  auto results = ExtractResults(results_dir_);

  const bool exists  = store_.Exists();
  const auto history = store_.Load();

  const prepush::v1::BaselineEntry* baseline = history ? SelectBaseline(*history, current_version_) : nullptr;

  auto outcome = Compare(results, baseline);

  PREPUSH_LOG_INFO("benchmarks compared", {IntField("results", static_cast<std::int64_t>(results.size())),
                                           StringField("baseline", outcome.baseline_version.value_or("none")),
                                           BoolField("has_warn", outcome.has_warn), BoolField("has_fail", outcome.has_fail)});
  for (const auto& comparison : outcome.comparisons) {
    PREPUSH_LOG_DEBUG("benchmark drift", {StringField("name", comparison.name), StringField("status", model::ToString(comparison.status))});
  }

  if (ShouldRecord(exists, history, current_version_, force_record_)) {
    prepush::v1::BaselineEntry entry;
    entry.set_version(current_version_);
    entry.set_timestamp(util::FormatUtc(util::Now()));
    entry.set_commit(ShortRevision());
    for (const auto& result : results) {
      (*entry.mutable_benchmarks())[result.name] = result.mean_ns;
    }

    try {
      store_.Record(entry);
      outcome.recorded_version = current_version_;
    } catch (const std::exception& e) {
      PREPUSH_LOG_WARN("baseline not recorded", {StringField("path", store_.path().string()), StringField("error", e.what())});
    }
  }

  return outcome;
}

} // namespace prepush::bench
