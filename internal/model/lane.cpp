#include "lane.hpp"

#include <algorithm>

namespace prepush::model {

void Lane::SkipRemaining() {
  for (auto& check : checks) {
    if (check.status == CheckStatus::kPending) {
      check.Transition(CheckStatus::kSkipped);
    }
  }
}

std::size_t Lane::Count(CheckStatus status) const {
  return static_cast<std::size_t>(
      std::count_if(checks.begin(), checks.end(), [status](const Check& check) { return check.status == status; }));
}

} // namespace prepush::model
