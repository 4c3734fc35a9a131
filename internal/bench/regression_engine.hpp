#pragma once

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "baseline_store.hpp"
#include "internal/model/bench.hpp"
#include "internal/process/command_runner.hpp"

namespace prepush::v1 {
class RuntimeConfig;
}

namespace prepush::bench {

/*
  Benchmark post-processing for one run:

    extract -> load history -> pick baseline -> compare -> maybe record

  Only soft failures happen here; a baseline that cannot be written is logged
  and otherwise ignored.
*/
class RegressionEngine {
 public:
  RegressionEngine(process::CommandRunner& runner, const prepush::v1::RuntimeConfig& config, std::filesystem::path root,
                   std::string current_version, bool force_record);

  model::BenchOutcome Process();

  // `git rev-parse --short HEAD`, or "unknown".
  std::string ShortRevision();

 private:
  process::CommandRunner&  runner_;
  std::filesystem::path    results_dir_;
  BaselineStore            store_;
  std::vector<std::string> revision_command_;
  std::chrono::seconds     timeout_;
  std::string              current_version_;
  bool                     force_record_;
};

} // namespace prepush::bench
