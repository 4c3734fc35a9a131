#pragma once

#include <chrono>
#include <string>
#include <vector>

#include "internal/process/command_runner.hpp"
#include "internal/util/time.hpp"

namespace prepush::v1 {
class RuntimeConfig;
}

namespace prepush::gate {

enum class GateStatus {
  kOk,
  kAutoFixed,
};

const char* ToString(GateStatus status);

struct GateResult {
  GateStatus     status = GateStatus::kOk;
  util::Duration elapsed{0};
};

/*
  Formatting precondition, run once before any lane exists.

    check  -> clean:  kOk
           -> dirty:  fix -> re-check -> clean: kAutoFixed

  A failing fix or a re-check that is still dirty throws util::GateError.
  There is exactly one fix attempt.
*/
class FormatGate {
 public:
  FormatGate(process::CommandRunner& runner, const prepush::v1::RuntimeConfig& config);

  GateResult Run();

 private:
  process::CommandRunner&  runner_;
  std::vector<std::string> check_command_;
  std::vector<std::string> fix_command_;
  std::chrono::seconds     timeout_;
};

} // namespace prepush::gate
