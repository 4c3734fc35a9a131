#include "config_loader.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>
#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <initializer_list>
#include <set>
#include <stdexcept>
#include <system_error>

#include "internal/util/errors.hpp"

namespace prepush::config {

using prepush::util::ConfigError;
using prepush::v1::CheckConfig;
using prepush::v1::LaneConfig;
using prepush::v1::LaneKind;
using prepush::v1::RuntimeConfig;

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value);

static void SetScalarValue(const YAML::Node& node, google::protobuf::Value* value) {
  std::string scalar_value = node.Scalar();

  // quoted scalars are always strings ("5" in a command line stays "5")
  if (node.Tag() == "!") {
    value->set_string_value(scalar_value);
    return;
  }

  // detect numeric / bool
  if (scalar_value == "true" || scalar_value == "false") {
    value->set_bool_value(scalar_value == "true");
    return;
  }

  char*        endptr        = nullptr;
  const double numeric_value = strtod(scalar_value.c_str(), &endptr);
  if (!scalar_value.empty() && endptr && *endptr == '\0') {
    value->set_number_value(numeric_value);
    return;
  }

  value->set_string_value(scalar_value);
}

static void YamlToProtoValue(const YAML::Node& node, google::protobuf::Value* value) {
  switch (node.Type()) {
    case YAML::NodeType::Null:
      value->set_null_value(google::protobuf::NullValue::NULL_VALUE);
      break;

    case YAML::NodeType::Scalar:
      SetScalarValue(node, value);
      break;

    case YAML::NodeType::Sequence: {
      auto* list_value = value->mutable_list_value();
      for (size_t i = 0; i < node.size(); ++i) {
        YamlToProtoValue(node[i], list_value->add_values());
      }
      break;
    }

    case YAML::NodeType::Map: {
      auto* struct_value = value->mutable_struct_value();
      for (auto it : node) {
        YamlToProtoValue(it.second, &(*struct_value->mutable_fields())[it.first.Scalar()]);
      }
      break;
    }

    default:
      throw ConfigError("Unsupported YAML node");
  }
}

// ------------------------------------------------------------
// Defaults
// ------------------------------------------------------------

namespace {

void SetCommand(google::protobuf::RepeatedPtrField<std::string>* field, std::initializer_list<const char*> args) {
  field->Clear();
  for (const char* arg : args) {
    field->Add(arg);
  }
}

CheckConfig* AddCheck(LaneConfig* lane, const std::string& name, std::initializer_list<const char*> command) {
  auto* check = lane->add_checks();
  check->set_name(name);
  SetCommand(check->mutable_command(), command);
  return check;
}

LaneConfig* AddLane(RuntimeConfig* config, const std::string& name, const std::string& color, LaneKind kind) {
  auto* lane = config->add_lanes();
  lane->set_name(name);
  lane->set_color(color);
  lane->set_kind(kind);
  return lane;
}

void AddDefaultLanes(RuntimeConfig* config) {
  auto* native = AddLane(config, "Native", "cyan", prepush::v1::LANE_KIND_STANDARD);
  AddCheck(native, "cargo check (default)", {"cargo", "check"});
  AddCheck(native, "cargo check (simulation)", {"cargo", "check", "--features", "simulation"});
  AddCheck(native, "cargo check (ffi+meshing)", {"cargo", "check", "--features", "ffi,meshing"});
  AddCheck(native, "cargo check (ffi+simulation)", {"cargo", "check", "--features", "ffi,simulation"});
  AddCheck(native, "cargo check (python+simulation)", {"cargo", "check", "--features", "python,simulation"});
  AddCheck(native, "cargo check (python+meshing)", {"cargo", "check", "--features", "python,meshing"});
  AddCheck(native, "cargo test (default)", {"cargo", "test"});
  AddCheck(native, "cargo test (simulation)", {"cargo", "test", "--features", "simulation"});
  AddCheck(native, "cargo test (insign IO)", {"cargo", "test", "--lib", "--features", "simulation", "typed_executor::insign_io"});
  AddCheck(native, "maturin build", {"maturin", "build", "--features", "python,simulation"})->set_when_tool("maturin");

  auto* wasm = AddLane(config, "WASM", "magenta", prepush::v1::LANE_KIND_STANDARD);
  AddCheck(wasm, "cargo check (wasm+simulation)", {"cargo", "check", "--target", "wasm32-unknown-unknown", "--features", "wasm,simulation"});
  AddCheck(wasm, "build-wasm.sh", {"./build-wasm.sh"})->set_when_file("build-wasm.sh");
  AddCheck(wasm, "node WASM tests", {"node", "tests/node_wasm_test.js"})->set_when_file("tests/node_wasm_test.js");

  auto* quick = AddLane(config, "Quick", "yellow", prepush::v1::LANE_KIND_CONSISTENCY);
  AddCheck(quick, "version consistency", {});
  AddCheck(quick, "API parity", {});

  auto* bench = AddLane(config, "Bench", "blue", prepush::v1::LANE_KIND_BENCHMARK);
  AddCheck(bench, "cargo bench (snapshot)", {"cargo", "bench", "--bench", "snapshot_bench"});
  AddCheck(bench, "cargo bench (region)", {"cargo", "bench", "--bench", "region_bench"});
}

} // namespace

RuntimeConfig ConfigLoader::Default() {
  RuntimeConfig config;
  ApplyDefaults(&config);
  return config;
}

void ConfigLoader::ApplyDefaults(RuntimeConfig* config) {
  auto* project = config->mutable_project();
  if (project->root().empty()) project->set_root(".");
  if (project->primary_manifest().empty()) project->set_primary_manifest("Cargo.toml");
  if (project->secondary_manifest().empty()) project->set_secondary_manifest("pyproject.toml");

  auto* gate = config->mutable_format_gate();
  if (gate->check_command().empty()) SetCommand(gate->mutable_check_command(), {"cargo", "fmt", "--", "--check"});
  if (gate->fix_command().empty()) SetCommand(gate->mutable_fix_command(), {"cargo", "fmt"});

  if (config->timeout_seconds() == 0) config->set_timeout_seconds(600);

  if (config->lanes().empty()) AddDefaultLanes(config);

  for (auto& lane : *config->mutable_lanes()) {
    if (lane.color().empty()) lane.set_color("white");
    if (lane.kind() == prepush::v1::LANE_KIND_CONSISTENCY && lane.checks().empty()) {
      AddCheck(&lane, "version consistency", {});
      AddCheck(&lane, "API parity", {});
    }
  }

  auto* parity = config->mutable_parity();
  if (parity->source().empty()) parity->set_source("tools/check_api_parity.rs");
  if (parity->artifact().empty()) parity->set_artifact("target/check_api_parity");
  if (parity->compiler().empty()) parity->set_compiler("rustc");

  auto* bench = config->mutable_bench();
  if (bench->results_dir().empty()) bench->set_results_dir("target/criterion");
  if (bench->baseline_file().empty()) bench->set_baseline_file(".bench-baselines/history.json");
  if (bench->revision_command().empty()) SetCommand(bench->mutable_revision_command(), {"git", "rev-parse", "--short", "HEAD"});
}

void ConfigLoader::Validate(const RuntimeConfig& config) {
  std::set<std::string> names;
  int                   bench_lanes = 0;

  for (const auto& lane : config.lanes()) {
    if (lane.name().empty()) {
      throw ConfigError("Invalid configuration: lane without a name");
    }
    if (!names.insert(lane.name()).second) {
      throw ConfigError("Invalid configuration: duplicate lane '" + lane.name() + "'");
    }

    if (lane.kind() == prepush::v1::LANE_KIND_CONSISTENCY) {
      if (lane.checks_size() != 2) {
        throw ConfigError("Invalid configuration: consistency lane '" + lane.name() + "' needs exactly two checks");
      }
      for (const auto& check : lane.checks()) {
        if (!check.when_tool().empty() || !check.when_file().empty()) {
          throw ConfigError("Invalid configuration: consistency lane '" + lane.name() + "' checks cannot be conditional");
        }
      }
      continue;
    }

    if (lane.kind() == prepush::v1::LANE_KIND_BENCHMARK && ++bench_lanes > 1) {
      throw ConfigError("Invalid configuration: more than one benchmark lane");
    }

    for (const auto& check : lane.checks()) {
      if (check.name().empty()) {
        throw ConfigError("Invalid configuration: unnamed check in lane '" + lane.name() + "'");
      }
      if (check.command().empty()) {
        throw ConfigError("Invalid configuration: check '" + check.name() + "' has no command");
      }
    }
  }

  if (config.format_gate().check_command().empty() || config.format_gate().fix_command().empty()) {
    throw ConfigError("Invalid configuration: format gate commands must not be empty");
  }
}

// ------------------------------------------------------------
// Public loader
// ------------------------------------------------------------

std::optional<std::string> ConfigLoader::FindProjectConfig(const std::filesystem::path& root) {
  const auto      candidate = root / "prepush.yaml";
  std::error_code ec;
  if (!std::filesystem::is_regular_file(candidate, ec)) {
    return std::nullopt;
  }
  return candidate.string();
}

RuntimeConfig ConfigLoader::LoadFromYaml(const std::string& path) {
  YAML::Node yaml;
  try {
    yaml = YAML::LoadFile(path);
  } catch (const std::exception& e) {
    throw ConfigError("Failed to load YAML config: " + std::string(e.what()));
  }

  google::protobuf::Value json_value;
  YamlToProtoValue(yaml, &json_value);

  RuntimeConfig config;

  // an empty file is an empty document
  if (json_value.kind_case() != google::protobuf::Value::kNullValue) {
    std::string json;
    auto        to_json_status = google::protobuf::util::MessageToJsonString(json_value, &json);
    if (!to_json_status.ok()) {
      throw ConfigError("Failed to serialize YAML to JSON: " + to_json_status.ToString());
    }

    google::protobuf::util::JsonParseOptions options;
    options.ignore_unknown_fields = false;

    auto status = google::protobuf::util::JsonStringToMessage(json, &config, options);

    if (!status.ok()) {
      throw ConfigError("Invalid configuration: " + status.ToString());
    }
  }

  ApplyDefaults(&config);
  Validate(config);
  return config;
}

} // namespace prepush::config
