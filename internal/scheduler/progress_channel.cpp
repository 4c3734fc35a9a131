#include "progress_channel.hpp"

namespace prepush::scheduler {

void ProgressChannel::Publish(const ProgressEvent& event) {
  {
    std::lock_guard lock(mutex_);
    if (closed_) return;
    queue_.push(event);
  }
  cv_.notify_one();
}

std::optional<ProgressEvent> ProgressChannel::Receive() {
  std::unique_lock lock(mutex_);

  cv_.wait(lock, [&] { return closed_ || !queue_.empty(); });

  if (closed_ && queue_.empty()) return std::nullopt;

  ProgressEvent event = queue_.front();
  queue_.pop();
  return event;
}

void ProgressChannel::Close() {
  {
    std::lock_guard lock(mutex_);
    closed_ = true;
  }
  cv_.notify_all();
}

} // namespace prepush::scheduler
