#pragma once

#include <condition_variable>
#include <mutex>
#include <optional>
#include <queue>

#include "progress_event.hpp"

namespace prepush::scheduler {

/*
  Thread-safe blocking queue from lane workers to the renderer.
*/
class ProgressChannel : public ProgressSink {
 public:
  void Publish(const ProgressEvent& event) override;

  // blocking wait; nullopt once closed and drained
  std::optional<ProgressEvent> Receive();

  void Close();

 private:
  std::mutex                mutex_;
  std::condition_variable   cv_;
  std::queue<ProgressEvent> queue_;
  bool                      closed_ = false;
};

} // namespace prepush::scheduler
