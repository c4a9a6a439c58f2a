/**
 * @file worker.hpp
 * @brief Per-device task loop
 *
 * @details A Worker is bound to one DeviceBackend and pulls tasks from the
 *          job's WorkQueue until the queue is empty or a stop is requested:
 *
 *          - Every substage change and progress increment becomes a
 *            WorkerEvent on the channel
 *
 *          - Decode, generation and write errors fail only the current task
 *
 *          - A DeviceError sets the shared cancel flag and reports JobFatal
 *
 *          - A stop mid-pipeline returns the task to Queued (abandoned)
 */

#ifndef CAPTION_SUITE_WORKER_HPP
#define CAPTION_SUITE_WORKER_HPP

#include <atomic>
#include <optional>
#include <string>

#include "caption_writer.hpp"
#include "device_backend.hpp"
#include "event_channel.hpp"
#include "job.hpp"

namespace caption_suite {

class Worker : public PipelineListener {
public:
  /**
   * @param id Worker id (index into the job's device list)
   * @param backend Prepared backend of this worker's device
   * @param job Job whose queue is drained
   * @param events Progress sink
   * @param writer Caption persistence
   * @param cancel Shared stop flag; set by stop() or by a job-fatal error
   */
  Worker(WorkerId id, DeviceBackend &backend, Job &job, EventChannel &events,
         CaptionWriter &writer, std::atomic<bool> &cancel);

  /**
   * @brief Process tasks until the queue is empty or a stop is requested.
   * @note Always reports WorkerExited before returning.
   */
  void run();

  void on_substage(Substage substage, double progress,
                   int64_t tokens) override;
  bool should_stop() const override;

private:
  void process(const Task &task);
  void fail(const Task &task, const std::string &message, double elapsed);
  void emit(WorkerEvent event);

  WorkerId id_;
  DeviceBackend &backend_;
  Job &job_;
  EventChannel &events_;
  CaptionWriter &writer_;
  std::atomic<bool> &cancel_;

  /// Task in flight and the last progress reported for it
  std::optional<Task> current_;
  Substage last_substage_ = Substage::Idle;
  double last_progress_ = -1;
  int64_t last_tokens_ = -1;

  int tasks_done_ = 0;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_WORKER_HPP
