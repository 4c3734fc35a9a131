#include "baseline_store.hpp"

#include <google/protobuf/struct.pb.h>
#include <google/protobuf/util/json_util.h>

#include <cstdint>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <system_error>

#include "internal/observability/logging.hpp"

namespace prepush::bench {

namespace fs = std::filesystem;

using prepush::observability::IntField;
using prepush::observability::StringField;
using prepush::v1::BaselineEntry;

namespace {

std::optional<std::string> ReadFile(const fs::path& path) {
  std::ifstream in(path);
  if (!in) return std::nullopt;

  std::stringstream buffer;
  buffer << in.rdbuf();
  if (in.bad()) return std::nullopt;
  return buffer.str();
}

std::string IndentLines(const std::string& text, const std::string& indent) {
  std::string out;
  out.reserve(text.size() + 32);
  bool at_line_start = true;
  for (char c : text) {
    if (at_line_start && c != '\n') out += indent;
    out.push_back(c);
    at_line_start = c == '\n';
  }
  return out;
}

} // namespace

BaselineStore::BaselineStore(fs::path path) : path_(std::move(path)) {
}

bool BaselineStore::Exists() const {
  std::error_code ec;
  return fs::exists(path_, ec);
}

std::optional<BaselineHistory> BaselineStore::Load() const {
  auto text = ReadFile(path_);
  if (!text) return std::nullopt;

  google::protobuf::ListValue list;
  auto                        status = google::protobuf::util::JsonStringToMessage(*text, &list);
  if (!status.ok()) {
    PREPUSH_LOG_WARN("baseline history unreadable", {StringField("path", path_.string()), StringField("error", status.ToString())});
    return std::nullopt;
  }

  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = true;

  BaselineHistory history;
  for (const auto& value : list.values()) {
    if (value.kind_case() != google::protobuf::Value::kStructValue) {
      PREPUSH_LOG_WARN("baseline history entry is not an object", {StringField("path", path_.string())});
      return std::nullopt;
    }

    std::string json;
    if (!google::protobuf::util::MessageToJsonString(value.struct_value(), &json).ok()) return std::nullopt;

    BaselineEntry entry;
    status = google::protobuf::util::JsonStringToMessage(json, &entry, options);
    if (!status.ok()) {
      PREPUSH_LOG_WARN("baseline history entry malformed", {StringField("path", path_.string()), StringField("error", status.ToString())});
      return std::nullopt;
    }
    history.push_back(std::move(entry));
  }
  return history;
}

void BaselineStore::Save(const BaselineHistory& history) const {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string out = "[";
  for (std::size_t i = 0; i < history.size(); ++i) {
    std::string json;
    auto        status = google::protobuf::util::MessageToJsonString(history[i], &json, options);
    if (!status.ok()) {
      throw std::runtime_error("failed to serialize baseline entry: " + status.ToString());
    }
    while (!json.empty() && json.back() == '\n') json.pop_back();

    out += i == 0 ? "\n" : ",\n";
    out += IndentLines(json, "  ");
  }
  out += history.empty() ? "]\n" : "\n]\n";

  std::error_code ec;
  if (path_.has_parent_path()) {
    fs::create_directories(path_.parent_path(), ec);
    if (ec) {
      throw std::runtime_error("cannot create " + path_.parent_path().string() + ": " + ec.message());
    }
  }

  auto tmp = path_;
  tmp += ".tmp";
  {
    std::ofstream file(tmp, std::ios::trunc);
    file << out;
    file.close();
    if (!file) {
      throw std::runtime_error("cannot write " + tmp.string());
    }
  }

  fs::rename(tmp, path_, ec);
  if (ec) {
    throw std::runtime_error("cannot replace " + path_.string() + ": " + ec.message());
  }
}

BaselineHistory BaselineStore::Record(const BaselineEntry& entry) const {
  auto history = Load().value_or(BaselineHistory{});
  UpsertEntry(&history, entry);
  Save(history);

  PREPUSH_LOG_INFO("baseline recorded", {StringField("version", entry.version()), IntField("benchmarks", entry.benchmarks_size()),
                                         IntField("entries", static_cast<std::int64_t>(history.size()))});
  return history;
}

void UpsertEntry(BaselineHistory* history, const BaselineEntry& entry) {
  for (auto& existing : *history) {
    if (existing.version() == entry.version()) {
      existing = entry;
      return;
    }
  }
  history->push_back(entry);
}

const BaselineEntry* SelectBaseline(const BaselineHistory& history, const std::string& current_version) {
  if (history.empty()) return nullptr;

  const auto& newest = history.back();
  if (newest.version() == current_version && history.size() > 1) {
    return &history[history.size() - 2];
  }
  return &newest;
}

bool ShouldRecord(bool file_exists, const std::optional<BaselineHistory>& history, const std::string& current_version,
                  bool force) {
  if (force || !file_exists) return true;
  if (!history || history->empty()) return true;
  return history->back().version() != current_version;
}

} // namespace prepush::bench
