/**
 * @file progress_aggregator.hpp
 * @brief Job state machine fed by worker events
 *
 * @details The aggregator is the single writer of job, task and worker state:
 *
 *          - A consumer thread drains the EventChannel and applies each event
 *            under one mutex
 *
 *          - Every applied event recomputes the ProgressSnapshot and hands it
 *            to the Broadcaster (terminal stages are pushed immediately)
 *
 *          - snapshot() and results() copy under the same mutex, so readers
 *            never observe a half-applied event
 *
 * @attention STAGES:
 *
 *   Idle/terminal -> LoadingModel (begin_job)
 *   LoadingModel  -> Processing   (every device prepared)
 *   any active    -> Complete / Error / Stopped (RunFinished, after every
 *                    worker exited and devices were shut down)
 */

#ifndef CAPTION_SUITE_PROGRESS_AGGREGATOR_HPP
#define CAPTION_SUITE_PROGRESS_AGGREGATOR_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "broadcaster.hpp"
#include "event_channel.hpp"
#include "job.hpp"
#include "types.hpp"

namespace caption_suite {

class ProgressAggregator {
public:
  /**
   * @brief Start the consumer thread on channel.
   * @param channel Event source; closed by the destructor
   * @param broadcaster Receiver of every recomputed snapshot
   */
  ProgressAggregator(EventChannel &channel, Broadcaster &broadcaster);

  /**
   * @brief Close the channel, drain it and join the consumer thread.
   */
  ~ProgressAggregator();

  ProgressAggregator(const ProgressAggregator &) = delete;
  ProgressAggregator &operator=(const ProgressAggregator &) = delete;

  /**
   * @brief Reset all state for job and enter LoadingModel.
   * @param job Accepted job
   * @param devices One entry per worker, in worker id order
   */
  void begin_job(const Job &job, const std::vector<std::string> &devices);

  /// Apply one event (the consumer thread calls this for every pop)
  void apply(const WorkerEvent &event);

  ProgressSnapshot snapshot() const;
  JobStage stage() const;

  /**
   * @brief Block until the current job reaches a terminal stage.
   * @return The terminal snapshot
   */
  ProgressSnapshot wait_terminal() const;

  /// Per-task records of the current (or last) job, in request order
  std::vector<TaskResult> results() const;

private:
  void run();

  void set_substage(WorkerState &worker, TaskResult &task, Substage substage);
  void finish_run();
  ProgressSnapshot build_snapshot() const;
  void publish_locked(bool immediate);

  EventChannel &channel_;
  Broadcaster &broadcaster_;

  mutable std::mutex mutex_;
  mutable std::condition_variable terminal_cv_;

  JobStage stage_ = JobStage::Idle;
  std::string job_id_;
  int batch_size_ = 0;
  std::vector<WorkerState> workers_;
  std::vector<int64_t> inflight_tokens_;  //< Tokens of each worker's task
  std::vector<TaskResult> tasks_;
  int completed_ = 0;
  int failed_ = 0;
  int devices_prepared_ = 0;
  int64_t tokens_committed_ = 0;
  double overall_ = 0;  //< High-water mark of overall progress
  std::optional<std::string> error_message_;

  std::chrono::steady_clock::time_point started_at_;
  std::chrono::steady_clock::time_point processing_at_;
  std::optional<std::chrono::steady_clock::time_point> finished_at_;

  std::thread thread_;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_PROGRESS_AGGREGATOR_HPP
