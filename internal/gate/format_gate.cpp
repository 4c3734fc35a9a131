#include "format_gate.hpp"

#include "internal/observability/logging.hpp"
#include "internal/util/errors.hpp"
#include "prepush/v1/config.pb.h"

namespace prepush::gate {

using prepush::observability::SecondsField;
using prepush::observability::StringField;

const char* ToString(GateStatus status) {
  switch (status) {
    case GateStatus::kOk:
      return "ok";
    case GateStatus::kAutoFixed:
      return "auto-fixed";
  }
  return "unknown";
}

FormatGate::FormatGate(process::CommandRunner& runner, const prepush::v1::RuntimeConfig& config)
    : runner_(runner),
      check_command_(config.format_gate().check_command().begin(), config.format_gate().check_command().end()),
      fix_command_(config.format_gate().fix_command().begin(), config.format_gate().fix_command().end()),
      timeout_(config.timeout_seconds()) {
}

GateResult FormatGate::Run() {
  util::Stopwatch watch;
  GateResult      result;

  const auto check = runner_.Run(check_command_, timeout_);
  if (check.ok()) {
    result.status  = GateStatus::kOk;
    result.elapsed = watch.Elapsed();
    PREPUSH_LOG_INFO("format gate clean", {SecondsField("elapsed", util::ToSeconds(result.elapsed))});
    return result;
  }

  PREPUSH_LOG_INFO("format gate dirty, running fix", {StringField("command", process::JoinCommand(fix_command_))});

  const auto fix = runner_.Run(fix_command_, timeout_);
  if (!fix.ok()) {
    throw util::GateError(process::JoinCommand(fix_command_) + " failed:\n" + fix.output);
  }

  const auto recheck = runner_.Run(check_command_, timeout_);
  if (!recheck.ok()) {
    throw util::GateError(process::JoinCommand(check_command_) + " still fails after auto-fix");
  }

  result.status  = GateStatus::kAutoFixed;
  result.elapsed = watch.Elapsed();
  PREPUSH_LOG_INFO("format gate auto-fixed", {SecondsField("elapsed", util::ToSeconds(result.elapsed))});
  return result;
}

} // namespace prepush::gate
