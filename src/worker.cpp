/**
 * @file worker.cpp
 * @brief Worker loop implementation
 */

#include "caption_suite/worker.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>

#include "caption_suite/errors.hpp"
#include "caption_suite/logging.hpp"

namespace caption_suite {

namespace fs = std::filesystem;

namespace {

/// Smallest progress change worth an event
constexpr double PROGRESS_STEP = 0.01;

double seconds_since(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() -
                                       start)
      .count();
}

} // anonymous namespace

Worker::Worker(WorkerId id, DeviceBackend &backend, Job &job,
               EventChannel &events, CaptionWriter &writer,
               std::atomic<bool> &cancel)
    : id_(id), backend_(backend), job_(job), events_(events), writer_(writer),
      cancel_(cancel) {}

bool Worker::should_stop() const { return cancel_.load(); }

void Worker::emit(WorkerEvent event) {
  event.worker = id_;
  if (!events_.push(std::move(event))) {
    LOG_WARN("[Worker {}] Event channel closed, progress dropped", id_);
  }
}

void Worker::run() {
  LOG_INFO("[Worker {}] Started on {}", id_, backend_.device());

  Task task;
  while (!should_stop() && job_.queue().pull(id_, task)) {
    process(task);
  }

  if (should_stop()) {
    LOG_WARN("[Worker {}] Stop requested, leaving after {} task(s)", id_,
             tasks_done_);
  } else {
    LOG_INFO("[Worker {}] Finished (no more tasks, {} processed)", id_,
             tasks_done_);
  }

  WorkerEvent exited;
  exited.kind = EventKind::WorkerExited;
  emit(std::move(exited));
}

void Worker::on_substage(Substage substage, double progress, int64_t tokens) {
  if (!current_)
    return;

  /// Frame and token callbacks fire far more often than progress moves
  bool changed = substage != last_substage_ || tokens != last_tokens_ ||
                 std::fabs(progress - last_progress_) >= PROGRESS_STEP ||
                 (progress >= 1.0 && last_progress_ < 1.0);
  if (!changed)
    return;

  last_substage_ = substage;
  last_progress_ = progress;
  last_tokens_ = tokens;

  WorkerEvent event;
  event.kind = EventKind::Substage;
  event.task_index = current_->index;
  event.video_name = current_->video_name;
  event.substage = substage;
  event.progress = progress;
  event.tokens = tokens;
  emit(std::move(event));
}

void Worker::fail(const Task &task, const std::string &message,
                  double elapsed) {
  job_.queue().finish(task.index, TaskStatus::Failed);

  WorkerEvent event;
  event.kind = EventKind::TaskFailed;
  event.task_index = task.index;
  event.video_name = task.video_name;
  event.tokens = std::max<int64_t>(0, last_tokens_);
  event.elapsed = elapsed;
  event.message = message;
  emit(std::move(event));

  LOG_ERROR("[Worker {}] Failed: {} ({})", id_, task.video_name, message);
}

void Worker::process(const Task &task) {
  current_ = task;
  last_substage_ = Substage::Idle;
  last_progress_ = -1;
  last_tokens_ = -1;

  {
    WorkerEvent started;
    started.kind = EventKind::TaskStarted;
    started.task_index = task.index;
    started.video_name = task.video_name;
    emit(std::move(started));
  }

  LOG_PHASE("[Worker {}] ----------------------------------------", id_);
  LOG_INFO("[Worker {}] Processing: {}", id_, task.video_name);

  auto start_time = std::chrono::steady_clock::now();
  PipelineResult result;

  try {
    result = backend_.run_pipeline(task, job_.settings(), *this);
  } catch (const StoppedError &) {
    job_.queue().release(task.index);

    WorkerEvent abandoned;
    abandoned.kind = EventKind::TaskAbandoned;
    abandoned.task_index = task.index;
    abandoned.video_name = task.video_name;
    emit(std::move(abandoned));

    LOG_WARN("[Worker {}] Abandoned: {}", id_, task.video_name);
    current_.reset();
    return;
  } catch (const DeviceError &e) {
    /// Device lost: this task stays unprocessed and the whole pool stops
    job_.queue().release(task.index);
    cancel_.store(true);

    WorkerEvent abandoned;
    abandoned.kind = EventKind::TaskAbandoned;
    abandoned.task_index = task.index;
    abandoned.video_name = task.video_name;
    emit(std::move(abandoned));

    WorkerEvent fatal;
    fatal.kind = EventKind::JobFatal;
    fatal.message = fmt::format("{}: {}", backend_.device(), e.what());
    emit(std::move(fatal));

    LOG_ERROR("[Worker {}] Device error on {}: {}", id_, backend_.device(),
              e.what());
    current_.reset();
    return;
  } catch (const std::exception &e) {
    fail(task, e.what(), seconds_since(start_time));
    current_.reset();
    return;
  }

  /// Generation returned: the caption is kept even if a stop arrived
  CaptionMetadata meta;
  meta.device = backend_.device();
  meta.frames = result.metadata.frames_extracted;
  meta.tokens = result.tokens;
  meta.tokens_per_sec = result.generation_seconds > 0
                            ? result.tokens / result.generation_seconds
                            : 0.0;

  std::string output_path;
  try {
    TIMER_START(write_caption);
    output_path =
        writer_.persist(MediaFile{task.video_name, task.path}, result.text,
                        meta, job_.settings().include_metadata);
    TIMER_END(write_caption);
  } catch (const std::exception &e) {
    last_tokens_ = result.tokens;
    fail(task, e.what(), seconds_since(start_time));
    current_.reset();
    return;
  }

  job_.queue().finish(task.index, TaskStatus::Done);
  double elapsed = seconds_since(start_time);

  WorkerEvent done;
  done.kind = EventKind::TaskDone;
  done.task_index = task.index;
  done.video_name = task.video_name;
  done.tokens = result.tokens;
  done.elapsed = elapsed;
  done.message = output_path;
  emit(std::move(done));

  tasks_done_++;
  current_.reset();

  LOG_SUCCESS("[Worker {}] Completed: {} ({:.1f}s, {} tokens) -> {}", id_,
              task.video_name, elapsed, result.tokens,
              fs::path(output_path).filename().string());
}

} // namespace caption_suite
