#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "prepush/v1/bench.pb.h"

namespace prepush::bench {

using BaselineHistory = std::vector<prepush::v1::BaselineEntry>;

/*
  The baseline history file: a JSON array of entries, oldest first.

    [
      {
        "version": "0.9.1",
        "timestamp": "2024-05-01T12:30:00Z",
        "commit": "a1b2c3d",
        "benchmarks": {"snapshot/load": 1234.5}
      }
    ]

  Reads never throw: a missing, unreadable or malformed file is "no history".
  Writes replace the file atomically and throw std::runtime_error on failure.
*/
class BaselineStore {
 public:
  explicit BaselineStore(std::filesystem::path path);

  bool Exists() const;

  // nullopt when the file is absent or cannot be parsed.
  std::optional<BaselineHistory> Load() const;

  void Save(const BaselineHistory& history) const;

  // Load (treating unreadable as empty), upsert by version, Save.
  BaselineHistory Record(const prepush::v1::BaselineEntry& entry) const;

  const std::filesystem::path& path() const {
    return path_;
  }

 private:
  std::filesystem::path path_;
};

// Replaces the entry with the same version in place, or appends.
void UpsertEntry(BaselineHistory* history, const prepush::v1::BaselineEntry& entry);

// Newest entry, or the one before it when the newest already belongs to
// current_version. nullptr for an empty history.
const prepush::v1::BaselineEntry* SelectBaseline(const BaselineHistory& history, const std::string& current_version);

/*
  Whether this run records a baseline entry: always when forced, when the
  file does not exist yet, and when its newest entry is for another version
  (an unreadable or empty history counts as "another version").
*/
bool ShouldRecord(bool file_exists, const std::optional<BaselineHistory>& history, const std::string& current_version,
                  bool force);

} // namespace prepush::bench
