#include "bench.hpp"

namespace prepush::model {

const char* ToString(BenchStatus status) {
  switch (status) {
    case BenchStatus::kNew:
      return "new";
    case BenchStatus::kPass:
      return "pass";
    case BenchStatus::kWarn:
      return "warn";
    case BenchStatus::kFail:
      return "fail";
  }
  return "unknown";
}

} // namespace prepush::model
