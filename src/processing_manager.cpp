/**
 * @file processing_manager.cpp
 * @brief Start / stop handling and the per-job supervisor
 */

#include "caption_suite/processing_manager.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "caption_suite/config.hpp"
#include "caption_suite/errors.hpp"
#include "caption_suite/logging.hpp"
#include "caption_suite/media_files.hpp"
#include "caption_suite/worker.hpp"

namespace caption_suite {

ManagerOptions ManagerOptions::from_config(const std::string &working_dir) {
  ManagerOptions options;
  options.working_dir = working_dir;
  options.defaults = Config::default_settings();
  options.device_list = Config::devices();
  options.traverse_subfolders = Config::traverse_subfolders();
  options.broadcast_interval =
      std::chrono::milliseconds(std::max(0, Config::broadcast_interval_ms()));
  options.event_capacity =
      static_cast<std::size_t>(std::max(1, Config::event_queue_capacity()));
  return options;
}

ProcessingManager::ProcessingManager(ManagerOptions options,
                                     BackendFactory factory,
                                     std::shared_ptr<CaptionWriter> writer)
    : options_(std::move(options)), factory_(std::move(factory)),
      writer_(std::move(writer)), broadcaster_(options_.broadcast_interval),
      events_(options_.event_capacity), aggregator_(events_, broadcaster_) {}

ProcessingManager::~ProcessingManager() {
  std::lock_guard<std::mutex> lock(run_mutex_);
  if (is_active(aggregator_.stage())) {
    LOG_WARN("[Manager] Shutting down, stopping job {}",
             job_ ? job_->id() : std::string("?"));
    cancel_.store(true);
    aggregator_.wait_terminal();
  }
  if (supervisor_.joinable())
    supervisor_.join();
}

void ProcessingManager::report(WorkerEvent event) {
  if (!events_.push(std::move(event))) {
    LOG_WARN("[Manager] Event channel closed, event dropped");
  }
}

// **---- START / STOP ----**

StartResponse ProcessingManager::start(const StartRequest &request) {
  std::lock_guard<std::mutex> lock(run_mutex_);
  StartResponse response;

  if (is_active(aggregator_.stage())) {
    response.message = "Processing already in progress";
    LOG_WARN("[Manager] Start rejected: {}", response.message);
    return response;
  }

  /// Override first, then the explicit prompt
  GenerationSettings settings = options_.defaults;
  try {
    apply_settings_override(settings, request.settings_override);
    if (request.prompt)
      settings.prompt = *request.prompt;
    Config::validate_settings(settings);
  } catch (const SettingsError &e) {
    response.message = fmt::format("Invalid settings: {}", e.what());
    LOG_WARN("[Manager] Start rejected: {}", response.message);
    return response;
  }

  std::vector<MediaFile> videos;
  try {
    videos = select_videos(
        find_media_files(options_.working_dir, options_.traverse_subfolders),
        request.video_names);
  } catch (const std::filesystem::filesystem_error &e) {
    response.message =
        fmt::format("Cannot read working directory: {}", e.what());
    LOG_ERROR("[Manager] Start rejected: {}", response.message);
    return response;
  }

  if (videos.empty()) {
    response.message = "No videos to process";
    LOG_WARN("[Manager] Start rejected: {}", response.message);
    return response;
  }

  /// The previous supervisor already reported RunFinished
  if (supervisor_.joinable())
    supervisor_.join();

  auto job = std::make_shared<Job>(Job::generate_id(), videos, settings);
  std::vector<std::string> devices =
      select_devices(settings.device, settings.batch_size, job->total(),
                     options_.device_list);

  cancel_.store(false);
  job_ = job;
  TimingCollector::clear();
  aggregator_.begin_job(*job, devices);

  try {
    supervisor_ = std::thread(&ProcessingManager::supervise, this, job, devices);
  } catch (const std::system_error &e) {
    LOG_ERROR("[Job {}] Could not start supervisor: {}", job->id(), e.what());
    WorkerEvent fatal;
    fatal.kind = EventKind::JobFatal;
    fatal.message = fmt::format("Could not start supervisor: {}", e.what());
    report(std::move(fatal));
    WorkerEvent finished;
    finished.kind = EventKind::RunFinished;
    report(std::move(finished));
  }

  response.accepted = true;
  response.total_videos = job->total();
  response.job_id = job->id();
  response.message = fmt::format("Started processing {} videos", job->total());
  LOG_INFO("[Manager] {} (job {}, {} device(s))", response.message, job->id(),
           devices.size());
  return response;
}

StopResponse ProcessingManager::stop() {
  std::lock_guard<std::mutex> lock(run_mutex_);
  StopResponse response;

  if (!is_active(aggregator_.stage())) {
    LOG_WARN("[Manager] Stop rejected: not processing");
    return response;
  }

  LOG_WARN("[Job {}] Stop requested", job_->id());
  cancel_.store(true);

  ProgressSnapshot final_state = aggregator_.wait_terminal();
  if (supervisor_.joinable())
    supervisor_.join();

  response.accepted = true;
  response.videos_completed = final_state.completed_videos;
  response.videos_failed = final_state.failed_videos;
  response.videos_remaining = final_state.remaining_videos;
  return response;
}

// **---- QUERIES ----**

ProgressSnapshot ProcessingManager::snapshot() const {
  return aggregator_.snapshot();
}

ProgressSnapshot ProcessingManager::wait() const {
  if (aggregator_.stage() == JobStage::Idle)
    return aggregator_.snapshot();
  return aggregator_.wait_terminal();
}

std::vector<TaskResult> ProcessingManager::results() const {
  return aggregator_.results();
}

uint64_t
ProcessingManager::subscribe(std::shared_ptr<ProgressObserver> observer) {
  return broadcaster_.subscribe(std::move(observer));
}

void ProcessingManager::unsubscribe(uint64_t id) {
  broadcaster_.unsubscribe(id);
}

// **---- SUPERVISOR ----**

void ProcessingManager::supervise(std::shared_ptr<Job> job,
                                  std::vector<std::string> devices) {
  const int device_count = static_cast<int>(devices.size());
  std::vector<std::unique_ptr<DeviceBackend>> backends;
  bool ready = true;

  /// Devices load one at a time
  for (int i = 0; i < device_count; ++i) {
    if (cancel_.load()) {
      ready = false;
      break;
    }

    LOG_INFO("[Job {}] Preparing {} ({}/{})", job->id(), devices[i], i + 1,
             device_count);
    try {
      std::unique_ptr<DeviceBackend> backend = factory_(devices[i]);
      if (!backend)
        throw DeviceError("no backend available");
      backends.push_back(std::move(backend));
      backends.back()->prepare();
    } catch (const std::exception &e) {
      cancel_.store(true);
      WorkerEvent fatal;
      fatal.kind = EventKind::JobFatal;
      fatal.message =
          fmt::format("Failed to prepare {}: {}", devices[i], e.what());
      report(std::move(fatal));
      ready = false;
      break;
    }

    WorkerEvent prepared;
    prepared.kind = EventKind::DevicePrepared;
    prepared.worker = i;
    prepared.progress = static_cast<double>(i + 1) / device_count;
    report(std::move(prepared));
  }

  if (ready) {
    std::vector<std::unique_ptr<Worker>> workers;
    for (int i = 0; i < device_count; ++i) {
      workers.push_back(std::make_unique<Worker>(i, *backends[i], *job, events_,
                                                 *writer_, cancel_));
    }

    std::vector<std::thread> threads;
    for (int i = 0; i < device_count; ++i) {
      try {
        threads.emplace_back(&Worker::run, workers[i].get());
      } catch (const std::system_error &e) {
        cancel_.store(true);
        WorkerEvent fatal;
        fatal.kind = EventKind::JobFatal;
        fatal.message =
            fmt::format("Could not start worker {}: {}", i, e.what());
        report(std::move(fatal));

        /// Workers that never ran still have to leave the pool
        for (int j = i; j < device_count; ++j) {
          WorkerEvent exited;
          exited.kind = EventKind::WorkerExited;
          exited.worker = j;
          report(std::move(exited));
        }
        break;
      }
    }

    for (auto &t : threads)
      t.join();
  }

  for (auto &backend : backends) {
    try {
      backend->shutdown();
    } catch (const std::exception &e) {
      LOG_WARN("[Job {}] Shutdown of {} failed: {}", job->id(),
               backend->device(), e.what());
    }
  }

  WorkerEvent finished;
  finished.kind = EventKind::RunFinished;
  report(std::move(finished));
}

int exit_status(const ProgressSnapshot &final_state) {
  int status = std::min(final_state.failed_videos, 255);
  if (final_state.stage == JobStage::Error)
    return std::max(1, status);
  return status;
}

} // namespace caption_suite
