/**
 * @file processing_manager.hpp
 * @brief Job orchestration across devices
 *
 * @details The ProcessingManager owns one run slot, the Broadcaster, the
 *          event channel and the ProgressAggregator. An accepted start:
 *
 *          - Resolves the requested videos and builds a Job (and its queue)
 *
 *          - Enters LoadingModel and launches a supervisor thread
 *
 *          - The supervisor prepares one backend per device in turn, starts
 *            one Worker thread per device, joins them, shuts the backends
 *            down and reports RunFinished
 *
 * @attention THREAD MODEL:
 *
 *   - start(), stop() and the destructor serialize on one mutex
 *
 *   - snapshot(), results(), subscribe() and unsubscribe() may be called
 *     from any thread at any time
 */

#ifndef CAPTION_SUITE_PROCESSING_MANAGER_HPP
#define CAPTION_SUITE_PROCESSING_MANAGER_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "broadcaster.hpp"
#include "caption_writer.hpp"
#include "device_backend.hpp"
#include "event_channel.hpp"
#include "job.hpp"
#include "payload.hpp"
#include "progress_aggregator.hpp"

namespace caption_suite {

/**
 * @struct ManagerOptions
 * @brief Construction parameters; from_config() reads the environment.
 */
struct ManagerOptions {
  std::string working_dir = ".";
  GenerationSettings defaults;
  std::string device_list;           //< Explicit devices, overrides batch_size
  bool traverse_subfolders = false;
  std::chrono::milliseconds broadcast_interval{100};
  std::size_t event_capacity = 1024;

  static ManagerOptions from_config(const std::string &working_dir);
};

class ProcessingManager {
public:
  /**
   * @param options Working directory, defaults and tuning
   * @param factory Creates the backend of each selected device
   * @param writer Caption persistence shared by all workers
   */
  ProcessingManager(ManagerOptions options, BackendFactory factory,
                    std::shared_ptr<CaptionWriter> writer);

  /**
   * @brief Stop a running job (if any) and join every thread.
   */
  ~ProcessingManager();

  ProcessingManager(const ProcessingManager &) = delete;
  ProcessingManager &operator=(const ProcessingManager &) = delete;

  /**
   * @brief Start a job over the requested videos.
   * @note Rejected while a job is active, when no video matches, or when
   *       the settings override is invalid; nothing changes in that case.
   */
  StartResponse start(const StartRequest &request);

  /**
   * @brief Request a stop and wait until the job reaches a terminal stage.
   * @note Rejected when no job is active.
   */
  StopResponse stop();

  /// Current snapshot (copy)
  ProgressSnapshot snapshot() const;

  /**
   * @brief Block until the current job is terminal.
   * @return Terminal snapshot, or the current one if no job ever started
   */
  ProgressSnapshot wait() const;

  /// Per-task records of the current or last job
  std::vector<TaskResult> results() const;

  uint64_t subscribe(std::shared_ptr<ProgressObserver> observer);
  void unsubscribe(uint64_t id);

private:
  void supervise(std::shared_ptr<Job> job, std::vector<std::string> devices);
  void report(WorkerEvent event);

  ManagerOptions options_;
  BackendFactory factory_;
  std::shared_ptr<CaptionWriter> writer_;

  /// Declaration order is teardown order in reverse: aggregator first
  Broadcaster broadcaster_;
  EventChannel events_;
  ProgressAggregator aggregator_;

  std::mutex run_mutex_;
  std::shared_ptr<Job> job_;
  std::atomic<bool> cancel_{false};
  std::thread supervisor_;
};

/**
 * @brief Process exit status for a finished job.
 * @return Failed video count clamped to 255; at least 1 when the job ended in
 *         Error
 */
int exit_status(const ProgressSnapshot &final_state);

} // namespace caption_suite

#endif // CAPTION_SUITE_PROCESSING_MANAGER_HPP
