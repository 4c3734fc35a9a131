#include "summary_reporter.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace prepush::report {

using model::BenchStatus;
using model::CheckStatus;

namespace {

bool IsBlank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

std::string PadRight(std::string text, std::size_t width) {
  if (text.size() < width) text.resize(width, ' ');
  return text;
}

std::string PadLeft(const std::string& text, std::size_t width) {
  if (text.size() >= width) return text;
  return std::string(width - text.size(), ' ') + text;
}

std::string SignedPct(double pct) {
  return fmt::format("{:+.1f}%", pct);
}

const model::Lane* FindBenchLane(const std::vector<model::Lane>& lanes) {
  for (const auto& lane : lanes) {
    if (lane.kind == prepush::v1::LANE_KIND_BENCHMARK) return &lane;
  }
  return nullptr;
}

} // namespace

std::string TailOutput(const std::string& output, std::size_t max_bytes) {
  if (output.size() <= max_bytes) return output;

  std::size_t start = output.size() - max_bytes;
  while (start < output.size() && (static_cast<unsigned char>(output[start]) & 0xC0) == 0x80) {
    ++start;
  }
  return output.substr(start);
}

Summary Summarize(const std::vector<model::Lane>& lanes) {
  Summary summary;

  for (const auto& lane : lanes) {
    summary.passed += lane.Count(CheckStatus::kPassed);
    summary.failed += lane.Count(CheckStatus::kFailed);
    summary.warned += lane.Count(CheckStatus::kWarned);

    if (!summary.first_failure) {
      for (const auto& check : lane.checks) {
        if (check.status == CheckStatus::kFailed && !IsBlank(check.output)) {
          summary.first_failure = &check;
          break;
        }
      }
    }

    if (lane.kind != prepush::v1::LANE_KIND_BENCHMARK) continue;

    if (lane.bench) {
      for (const auto& comparison : lane.bench->comparisons) {
        if (comparison.status == BenchStatus::kFail) ++summary.bench_regressions;
        if (comparison.status == BenchStatus::kWarn) ++summary.bench_warnings;
      }
    }
    if (summary.bench_regressions > 0 || lane.failed) {
      summary.bench_ok = false;
    }
  }

  summary.ready = summary.failed == 0 && summary.bench_ok;
  return summary;
}

SummaryReporter::SummaryReporter(std::ostream& out, Style style) : out_(out), style_(style) {
}

void SummaryReporter::PrintHeader(const std::string& title) {
  out_ << "\n" << style_.Paint("  " + title, "bold") << "\n\n";
}

void SummaryReporter::PrintGate(const std::optional<gate::GateResult>& gate) {
  if (!gate) return;

  const auto elapsed = style_.Paint(FormatSecs(util::ToSeconds(gate->elapsed)), "dim");
  out_ << "  " << style_.Paint(kSymPass, "green") << " Format check ";
  if (gate->status == gate::GateStatus::kAutoFixed) {
    out_ << style_.Paint("(auto-fixed)", "yellow") << " ";
  }
  out_ << elapsed << "\n\n";
}

void SummaryReporter::PrintGateFailure(const std::string& message) {
  out_ << "\n" << style_.Paint("  Format Gate Failed", "red") << "\n";
  out_ << message << "\n";
}

void SummaryReporter::PrintNothingToRun() {
  out_ << "  Nothing to run.\n";
}

std::string SummaryReporter::StatusSymbol(CheckStatus status) const {
  switch (status) {
    case CheckStatus::kPassed:
      return style_.Paint(kSymPass, "green");
    case CheckStatus::kFailed:
      return style_.Paint(kSymFail, "red");
    case CheckStatus::kWarned:
      return style_.Paint(kSymWarn, "yellow");
    case CheckStatus::kSkipped:
      return style_.Paint(kSymSkip, "dim");
    default:
      return "?";
  }
}

void SummaryReporter::PrintLanePanel(const model::Lane& lane) {
  std::size_t width = 0;
  for (const auto& check : lane.checks) width = std::max(width, check.name.size());

  out_ << "  " << style_.Paint(lane.name, "bold") << " " << style_.Paint(lane.failed ? kSymFail : kSymPass, lane.failed ? "red" : "green")
       << " " << style_.Paint(FormatSecs(util::ToSeconds(lane.elapsed)), "dim") << "\n";

  for (const auto& check : lane.checks) {
    out_ << "    " << StatusSymbol(check.status) << " ";
    if (check.status == CheckStatus::kPending || check.status == CheckStatus::kSkipped) {
      out_ << check.name << "\n";
      continue;
    }
    out_ << PadRight(check.name, width) << "  " << style_.Paint(PadLeft(FormatSecs(util::ToSeconds(check.elapsed)), 8), "dim") << "\n";
  }
  out_ << "\n";
}

void SummaryReporter::PrintBenchPanel(const model::Lane& lane) {
  if (!lane.bench) return;
  const auto& outcome = *lane.bench;

  const auto subtitle = outcome.baseline_version ? "vs v" + *outcome.baseline_version : std::string("No baseline");
  const auto border   = lane.failed ? "red" : (outcome.has_warn ? "yellow" : "green");
  out_ << "  " << style_.Paint("Benchmarks", border) << " " << style_.Paint(subtitle, "dim") << "\n";

  std::size_t width = 0;
  for (const auto& comparison : outcome.comparisons) width = std::max(width, comparison.name.size());

  auto sorted = outcome.comparisons;
  std::sort(sorted.begin(), sorted.end(), [](const auto& a, const auto& b) { return a.name < b.name; });

  for (const auto& comparison : sorted) {
    const auto current = PadLeft(FormatNs(comparison.mean_ns), 10);

    if (!comparison.base_ns || !comparison.pct_change) {
      out_ << "    " << style_.Paint(kSymNew, "dim") << " " << PadRight(comparison.name, width) << "  " << current << "  "
           << style_.Paint("(new)", "dim") << "\n";
      continue;
    }

    std::string symbol;
    std::string pct = SignedPct(*comparison.pct_change);
    switch (comparison.status) {
      case BenchStatus::kFail:
        symbol = style_.Paint(kSymFail, "red");
        pct    = style_.Paint(pct, "red");
        break;
      case BenchStatus::kWarn:
        symbol = style_.Paint(kSymWarn, "yellow");
        pct    = style_.Paint(pct, "yellow");
        break;
      default:
        symbol = style_.Paint(kSymPass, "green");
        pct    = style_.Paint(pct, "dim");
        break;
    }

    out_ << "    " << symbol << " " << PadRight(comparison.name, width) << "  " << current << "  "
         << style_.Paint("(base " + PadRight(FormatNs(*comparison.base_ns), 8), "dim") << " " << pct << style_.Paint(")", "dim")
         << "\n";
  }

  if (outcome.recorded_version) {
    out_ << "    " << style_.Paint("Baseline updated for v" + *outcome.recorded_version + " (" + std::to_string(outcome.results.size()) +
                                       " benchmarks)",
                                   "dim")
         << "\n";
  }
  out_ << "\n";
}

void SummaryReporter::PrintStatusLine(const Summary& summary, util::Duration total_elapsed, const std::vector<model::Lane>& lanes) {
  out_ << "  Total: " << FormatSecs(util::ToSeconds(total_elapsed));

  out_ << "   Checks: ";
  if (summary.failed > 0) {
    out_ << style_.Paint(std::to_string(summary.failed) + " failed", "red") << "  ";
  }
  out_ << style_.Paint(std::to_string(summary.passed) + " passed", "green");
  if (summary.warned > 0) {
    out_ << "  " << style_.Paint(std::to_string(summary.warned) + " warnings", "yellow");
  }

  if (const auto* bench_lane = FindBenchLane(lanes)) {
    out_ << "   Bench: ";
    if (!bench_lane->bench || !bench_lane->bench->HasBaseline()) {
      out_ << style_.Paint("no baseline", "dim");
    } else if (summary.bench_regressions > 0) {
      out_ << style_.Paint(std::to_string(summary.bench_regressions) + " regressions", "red");
    } else if (summary.bench_warnings > 0) {
      out_ << style_.Paint(std::to_string(summary.bench_warnings) + " warnings", "yellow");
    } else {
      out_ << style_.Paint("ok", "green");
    }
  }
  out_ << "\n";
}

void SummaryReporter::PrintFailure(const model::Check& check) {
  out_ << "\n" << style_.Paint("  Failed: " + check.name, "red") << "\n";
  out_ << TailOutput(check.output, kMaxFailureOutput);
  if (!check.output.empty() && check.output.back() != '\n') out_ << "\n";
}

bool SummaryReporter::PrintSummary(const std::vector<model::Lane>& lanes, util::Duration total_elapsed) {
  out_ << "\n";

  for (const auto& lane : lanes) {
    PrintLanePanel(lane);
  }

  if (const auto* bench_lane = FindBenchLane(lanes)) {
    PrintBenchPanel(*bench_lane);
  }

  const auto summary = Summarize(lanes);
  PrintStatusLine(summary, total_elapsed, lanes);

  if (summary.ready) {
    out_ << style_.Paint(std::string("  ") + kSymPass + " Ready to push", "green") << "\n";
  } else {
    out_ << style_.Paint(std::string("  ") + kSymFail + " Fix issues before pushing", "red") << "\n";
    if (summary.first_failure) {
      PrintFailure(*summary.first_failure);
    }
  }

  out_ << "\n";
  out_.flush();
  return summary.ready;
}

} // namespace prepush::report
