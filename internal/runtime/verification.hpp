#pragma once

#include <ostream>

#include "internal/factory.hpp"
#include "internal/process/command_runner.hpp"
#include "internal/report/style.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::runtime {

/*
  One verification run, start to exit code:

    format gate -> build lanes -> schedule -> summarize

  The gate is skipped with --bench-only. A gate that cannot converge ends the
  run with exit code 1 before any lane is built.
*/
class Verification {
 public:
  Verification(const prepush::v1::RuntimeConfig& config, factory::RunOptions options, process::CommandRunner& runner,
               std::ostream& out, report::Style style);

  Verification(const Verification&)            = delete;
  Verification& operator=(const Verification&) = delete;

  // 0 when ready, 1 otherwise.
  int Run();

 private:
  const prepush::v1::RuntimeConfig& config_;
  factory::RunOptions               options_;
  process::CommandRunner&           runner_;
  std::ostream&                     out_;
  report::Style                     style_;
};

} // namespace prepush::runtime
