#include "command_runner.hpp"

namespace prepush::process {

std::string TimeoutMarker(std::chrono::seconds timeout) {
  const auto seconds = timeout.count();
  if (seconds > 0 && seconds % 60 == 0) {
    return "TIMEOUT (" + std::to_string(seconds / 60) + " min)";
  }
  return "TIMEOUT (" + std::to_string(seconds) + "s)";
}

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string joined;
  for (const auto& arg : argv) {
    if (!joined.empty()) joined.push_back(' ');
    joined += arg;
  }
  return joined;
}

} // namespace prepush::process
