/**
 * @file work_queue.hpp
 * @brief Thread-safe pool of pending tasks for one job
 *
 * @details Provides:
 *          - Task: one video's assignment record
 *
 *          - WorkQueue: FIFO pool that workers pull from dynamically
 */

#ifndef CAPTION_SUITE_WORK_QUEUE_HPP
#define CAPTION_SUITE_WORK_QUEUE_HPP

#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace caption_suite {

/**
 * @struct Task
 * @brief Assignment record for one video inside a job.
 */
struct Task {
  std::size_t index = 0;                   //< Position in the requested list
  std::string video_name;                  //< Unique key within the job
  std::string path;                        //< Absolute media path
  TaskStatus status = TaskStatus::Queued;  //< Queued, Assigned, Done or Failed
  std::optional<WorkerId> assigned_worker; //< Lookup only
};

/**
 * @class WorkQueue
 * @brief Thread-safe pool of pending tasks for dynamic load balancing.
 *
 * @attention DESIGN:
 *
 * - Workers pull tasks from one shared pool, no static partitioning
 *
 * - If one worker gets a long video, the others keep pulling
 *
 * - Assignment is FIFO by input order; completion order is not constrained
 *
 * @note pull() pops and marks the task Assigned under the same lock, so no
 *       task is ever handed to two workers.
 */
class WorkQueue {
  mutable std::mutex mutex_;
  std::vector<Task> tasks_;
  std::deque<std::size_t> pending_;
  bool filled_ = false;

public:
  /**
   * @brief Load the job's ordered task list.
   * @note Accepted once; later calls are ignored and return false.
   */
  bool enqueue(const std::vector<MediaFile> &videos);

  /**
   * @brief Pop the next queued task and mark it Assigned to worker.
   * @param worker Worker taking the task
   * @param task Output: copy of the assigned task
   * @return true if a task was assigned, false if the pool is empty
   */
  bool pull(WorkerId worker, Task &task);

  /**
   * @brief Record the final status of an assigned task.
   * @note Done and Failed are final; the task is never handed out again.
   */
  void finish(std::size_t index, TaskStatus status);

  /**
   * @brief Return an abandoned task to Queued without re-offering it.
   * @note Used when a stop interrupts a task; it stays unprocessed.
   */
  void release(std::size_t index);

  std::size_t size() const;
  std::size_t pending() const;
  Task task(std::size_t index) const;
  std::vector<Task> tasks() const;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_WORK_QUEUE_HPP
