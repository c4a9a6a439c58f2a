/**
 * @file work_queue.cpp
 * @brief Thread-safe task pool implementation
 */

#include "caption_suite/work_queue.hpp"

#include "caption_suite/logging.hpp"

namespace caption_suite {

bool WorkQueue::enqueue(const std::vector<MediaFile> &videos) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (filled_) {
    LOG_WARN("Work queue already filled, ignoring {} tasks", videos.size());
    return false;
  }
  filled_ = true;

  tasks_.reserve(videos.size());
  for (const auto &video : videos) {
    Task task;
    task.index = tasks_.size();
    task.video_name = video.name;
    task.path = video.path;
    pending_.push_back(task.index);
    tasks_.push_back(std::move(task));
  }
  return true;
}

bool WorkQueue::pull(WorkerId worker, Task &task) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (pending_.empty())
    return false;

  std::size_t index = pending_.front();
  pending_.pop_front();

  Task &slot = tasks_[index];
  slot.status = TaskStatus::Assigned;
  slot.assigned_worker = worker;
  task = slot;
  return true;
}

void WorkQueue::finish(std::size_t index, TaskStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  Task &slot = tasks_.at(index);
  slot.status = status;
  slot.assigned_worker.reset();
}

void WorkQueue::release(std::size_t index) {
  std::lock_guard<std::mutex> lock(mutex_);
  Task &slot = tasks_.at(index);
  slot.status = TaskStatus::Queued;
  slot.assigned_worker.reset();
}

std::size_t WorkQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.size();
}

std::size_t WorkQueue::pending() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return pending_.size();
}

Task WorkQueue::task(std::size_t index) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_.at(index);
}

std::vector<Task> WorkQueue::tasks() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_;
}

} // namespace caption_suite
