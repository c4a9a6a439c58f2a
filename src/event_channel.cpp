/**
 * @file event_channel.cpp
 * @brief Bounded event channel implementation
 */

#include "caption_suite/event_channel.hpp"

#include <algorithm>

namespace caption_suite {

EventChannel::EventChannel(std::size_t capacity)
    : capacity_(std::max<std::size_t>(1, capacity)) {}

bool EventChannel::push(WorkerEvent event) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_full_.wait(lock,
                   [this] { return events_.size() < capacity_ || closed_; });
    if (closed_)
      return false;
    events_.push_back(std::move(event));
  }
  not_empty_.notify_one();
  return true;
}

bool EventChannel::pop(WorkerEvent &event) {
  {
    std::unique_lock<std::mutex> lock(mutex_);
    not_empty_.wait(lock, [this] { return !events_.empty() || closed_; });

    if (events_.empty()) {
      return false;
    }

    event = std::move(events_.front());
    events_.pop_front();
  }
  not_full_.notify_one();
  return true;
}

void EventChannel::close() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    closed_ = true;
  }
  not_empty_.notify_all();
  not_full_.notify_all();
}

std::size_t EventChannel::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

} // namespace caption_suite
