#include "progress_renderer.hpp"

#include <algorithm>

namespace prepush::scheduler {

ProgressRenderer::ProgressRenderer(std::shared_ptr<ProgressChannel> channel, std::vector<LaneDisplay> lanes,
                                   std::ostream& out, report::Style style)
    : channel_(std::move(channel)), lanes_(std::move(lanes)), out_(out), style_(style) {
  for (const auto& lane : lanes_) {
    name_width_ = std::max(name_width_, lane.name.size());
  }
}

ProgressRenderer::~ProgressRenderer() {
  Stop();
}

void ProgressRenderer::Start() {
  thread_ = std::thread(&ProgressRenderer::Run, this);
}

void ProgressRenderer::Stop() {
  channel_->Close();
  if (thread_.joinable()) thread_.join();
}

void ProgressRenderer::Run() {
  while (auto event = channel_->Receive()) {
    if (event->lane >= lanes_.size()) continue;
    Render(*event);
  }
  out_.flush();
}

void ProgressRenderer::Render(const ProgressEvent& event) {
  auto& lane = lanes_[event.lane];

  std::string description;
  switch (event.kind) {
    case ProgressEvent::Kind::kCheckStarted:
      description = style_.Paint(event.check_name, "dim");
      break;
    case ProgressEvent::Kind::kCheckFinished:
      lane.done = std::min(lane.done + 1, lane.total);
      description = event.check_name + " " + model::ToString(event.status);
      break;
    case ProgressEvent::Kind::kLaneFinished:
      description = event.lane_failed ? style_.Paint(std::string(report::kSymFail) + " Failed", "red")
                                      : style_.Paint(std::string(report::kSymPass) + " Done", "green");
      break;
  }

  std::string name = lane.name;
  name.resize(name_width_, ' ');

  out_ << "  " << style_.Paint(name, lane.color) << "  [" << lane.done << "/" << lane.total << "] " << description << "\n";
}

} // namespace prepush::scheduler
