#include <unistd.h>

#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

#include "internal/config/config_loader.hpp"
#include "internal/factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/process/subprocess_runner.hpp"
#include "internal/runtime/verification.hpp"
#include "internal/util/errors.hpp"

static void Usage(std::ostream& out) {
  out << "Usage: prepush [OPTIONS]\n"
      << "\n"
      << "Runs the format gate, then every verification lane in parallel.\n"
      << "\n"
      << "Options:\n"
      << "  --skip-bench        Skip benchmark lane\n"
      << "  --bench-only        Only run benchmarks (no format gate)\n"
      << "  --update-baseline   Force-record current benchmark results\n"
      << "  --config <file>     Load configuration from YAML (default: <root>/prepush.yaml if present)\n"
      << "  --root <dir>        Project root (default: current directory)\n"
      << "  -h, --help          Show this help\n";
}

int main(int argc, char** argv) {
  prepush::factory::RunOptions options;
  std::optional<std::string>   config_path;
  std::optional<std::string>   root;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--skip-bench") {
      options.skip_bench = true;
    } else if (arg == "--bench-only") {
      options.bench_only = true;
    } else if (arg == "--update-baseline") {
      options.update_baseline = true;
    } else if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--root" && i + 1 < argc) {
      root = argv[++i];
    } else if (arg == "-h" || arg == "--help") {
      Usage(std::cout);
      return 0;
    } else {
      std::cerr << "unknown argument: " << arg << "\n";
      Usage(std::cerr);
      return 2;
    }
  }

  // ------------------------------------------------------------
  // Load configuration
  // ------------------------------------------------------------

  prepush::v1::RuntimeConfig config;
  try {
    if (!config_path) {
      config_path = prepush::config::ConfigLoader::FindProjectConfig(root.value_or("."));
    }

    config = config_path ? prepush::config::ConfigLoader::LoadFromYaml(*config_path) : prepush::config::ConfigLoader::Default();
    if (root) {
      config.mutable_project()->set_root(*root);
    }
  } catch (const prepush::util::ConfigError& e) {
    std::cerr << e.what() << "\n";
    return 2;
  }

  prepush::observability::InitializeLogging(config);

  // ------------------------------------------------------------
  // Run
  // ------------------------------------------------------------

  const bool color = ::isatty(STDOUT_FILENO) == 1 && std::getenv("NO_COLOR") == nullptr;

  const auto project_root = prepush::factory::ResolveRoot(config);

  int exit_code = 1;
  try {
    prepush::process::SubprocessRunner runner(project_root);
    prepush::runtime::Verification     verification(config, options, runner, std::cout, prepush::report::Style(color));

    exit_code = verification.Run();
  } catch (const std::exception& e) {
    PREPUSH_LOG_ERROR("Fatal error", {prepush::observability::StringField("error", e.what())});
    exit_code = 2;
  }

  prepush::observability::ShutdownLogging();
  return exit_code;
}
