#pragma once

#include <filesystem>
#include <string>

#include "lane_executor.hpp"

namespace prepush::v1 {
class RuntimeConfig;
}

namespace prepush::lane {

/*
  The quick lane: two pseudo-checks with no command of their own.

    [0] version consistency  primary and secondary manifests agree
    [1] API parity           compile the parity tool when stale, then run it

  A parity tool that cannot be built (no compiler) is warned, not failed.
*/
class ConsistencyLaneExecutor : public LaneExecutor {
 public:
  ConsistencyLaneExecutor(const prepush::v1::RuntimeConfig& config, std::filesystem::path root);

  void Execute(model::Lane& lane, LaneContext& ctx) override;

 private:
  bool CheckVersions(model::Check& check, LaneContext& ctx);
  void CheckParity(model::Lane& lane, model::Check& check, LaneContext& ctx);

  // Rebuilds the parity artifact when its source is newer.
  void RefreshParityArtifact(LaneContext& ctx);

  std::filesystem::path root_;
  std::filesystem::path primary_manifest_;
  std::filesystem::path secondary_manifest_;
  std::filesystem::path parity_source_;
  std::filesystem::path parity_artifact_;
  std::string           compiler_;
};

} // namespace prepush::lane
