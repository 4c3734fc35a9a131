#include "internal/scheduler/progress_channel.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>
#include <memory>
#include <set>
#include <sstream>
#include <string>
#include <thread>
#include <utility>
#include <vector>

#include "internal/scheduler/progress_renderer.hpp"
#include "test_support.hpp"

namespace {

using prepush::model::CheckStatus;
using prepush::scheduler::LaneDisplay;
using prepush::scheduler::ProgressChannel;
using prepush::scheduler::ProgressEvent;
using prepush::scheduler::ProgressRenderer;

ProgressEvent Finished(std::size_t lane, const std::string& check, CheckStatus status) {
  ProgressEvent event;
  event.kind       = ProgressEvent::Kind::kCheckFinished;
  event.lane       = lane;
  event.check_name = check;
  event.status     = status;
  return event;
}

void TestConcurrentPublishersAllDelivered() {
  ProgressChannel channel;

  constexpr int kThreads = 4;
  constexpr int kEvents  = 250;

  std::vector<std::thread> publishers;
  for (int t = 0; t < kThreads; ++t) {
    publishers.emplace_back([&channel, t] {
      for (int i = 0; i < kEvents; ++i) {
        channel.Publish(Finished(static_cast<std::size_t>(t), std::to_string(i), CheckStatus::kPassed));
      }
    });
  }
  for (auto& publisher : publishers) {
    publisher.join();
  }
  channel.Close();

  std::set<std::pair<std::size_t, std::string>> seen;
  while (auto event = channel.Receive()) {
    seen.emplace(event->lane, event->check_name);
  }
  assert(seen.size() == static_cast<std::size_t>(kThreads * kEvents));
}

void TestClosedChannelDropsAndDrains() {
  ProgressChannel channel;
  channel.Publish(Finished(0, "a", CheckStatus::kPassed));
  channel.Close();
  channel.Publish(Finished(0, "late", CheckStatus::kPassed));

  auto first = channel.Receive();
  assert(first.has_value());
  assert(first->check_name == "a");
  assert(!channel.Receive().has_value());
}

void TestRendererWritesOneLinePerEvent() {
  auto               channel = std::make_shared<ProgressChannel>();
  std::ostringstream out;

  std::vector<LaneDisplay> lanes = {{"Native", "cyan", 2, 0}, {"WASM", "magenta", 1, 0}};

  {
    ProgressRenderer renderer(channel, lanes, out, prepush::report::Style(false));
    renderer.Start();

    ProgressEvent started;
    started.kind       = ProgressEvent::Kind::kCheckStarted;
    started.lane       = 0;
    started.check_name = "cargo check";
    channel->Publish(started);
    channel->Publish(Finished(0, "cargo check", CheckStatus::kPassed));

    ProgressEvent done;
    done.kind        = ProgressEvent::Kind::kLaneFinished;
    done.lane        = 1;
    done.lane_failed = true;
    channel->Publish(done);

    // out of range lanes are ignored
    channel->Publish(Finished(7, "ghost", CheckStatus::kPassed));

    renderer.Stop();
  }

  const auto text = out.str();
  assert(std::count(text.begin(), text.end(), '\n') == 3);
  assert(prepush::testing::Contains(text, "Native  [0/2] cargo check\n"));
  assert(prepush::testing::Contains(text, "Native  [1/2] cargo check passed\n"));
  assert(prepush::testing::Contains(text, "WASM    [0/1] ✗ Failed\n"));
  assert(!prepush::testing::Contains(text, "ghost"));
}

} // namespace

int main() {
  TestConcurrentPublishersAllDelivered();
  TestClosedChannelDropsAndDrains();
  TestRendererWritesOneLinePerEvent();

  std::cout << "prepush_unit_progress_channel: pass\n";
  return 0;
}
