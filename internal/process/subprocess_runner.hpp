#pragma once

#include <filesystem>
#include <optional>
#include <string>

#include "command_runner.hpp"

namespace prepush::process {

/*
  fork/exec runner.

  The child runs in its own process group with the working directory fixed to
  the project root; stdout and stderr share one pipe so output keeps its
  interleaving. On timeout the whole group is killed.
*/
class SubprocessRunner : public CommandRunner {
 public:
  explicit SubprocessRunner(std::filesystem::path working_dir);

  ProcessResult Run(const std::vector<std::string>& argv, std::chrono::seconds timeout) override;

 private:
  std::filesystem::path working_dir_;
};

// Resolves an executable name against PATH (names containing '/' are checked as-is).
std::optional<std::filesystem::path> FindExecutable(const std::string& name);

} // namespace prepush::process
