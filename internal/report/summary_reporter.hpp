#pragma once

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

#include "internal/gate/format_gate.hpp"
#include "internal/model/lane.hpp"
#include "style.hpp"

namespace prepush::report {

struct Summary {
  std::size_t passed = 0;
  std::size_t failed = 0;
  std::size_t warned = 0;

  std::size_t bench_regressions = 0;
  std::size_t bench_warnings    = 0;
  bool        bench_ok          = true;

  bool ready = true;

  // First failed check with non-blank output, lane order then check order.
  const model::Check* first_failure = nullptr;
};

Summary Summarize(const std::vector<model::Lane>& lanes);

/*
  Human-readable report on stdout. Lane panels come out in execution order,
  the benchmark panel after them; only one failure's output is ever dumped.
*/
class SummaryReporter {
 public:
  static constexpr std::size_t kMaxFailureOutput = 2000;

  SummaryReporter(std::ostream& out, Style style);

  void PrintHeader(const std::string& title);
  void PrintGate(const std::optional<gate::GateResult>& gate);
  void PrintGateFailure(const std::string& message);
  void PrintNothingToRun();

  // Returns Summary::ready.
  bool PrintSummary(const std::vector<model::Lane>& lanes, util::Duration total_elapsed);

 private:
  void PrintLanePanel(const model::Lane& lane);
  void PrintBenchPanel(const model::Lane& lane);
  void PrintStatusLine(const Summary& summary, util::Duration total_elapsed, const std::vector<model::Lane>& lanes);
  void PrintFailure(const model::Check& check);

  std::string StatusSymbol(model::CheckStatus status) const;

  std::ostream& out_;
  Style         style_;
};

// Keeps at most max_bytes from the end, never starting inside a UTF-8 sequence.
std::string TailOutput(const std::string& output, std::size_t max_bytes);

} // namespace prepush::report
