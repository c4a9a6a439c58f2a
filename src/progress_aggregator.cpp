/**
 * @file progress_aggregator.cpp
 * @brief Event application, stage transitions and snapshot computation
 */

#include "caption_suite/progress_aggregator.hpp"

#include <algorithm>

#include "caption_suite/logging.hpp"

namespace caption_suite {

using Clock = std::chrono::steady_clock;

namespace {

double seconds_between(Clock::time_point from, Clock::time_point to) {
  return std::chrono::duration<double>(to - from).count();
}

void clear_worker(WorkerState &worker) {
  worker.current_video.reset();
  worker.substage = Substage::Idle;
  worker.substage_progress = 0;
}

TaskStatus status_for(Substage substage) {
  switch (substage) {
  case Substage::ExtractingFrames:
    return TaskStatus::Extracting;
  case Substage::Encoding:
    return TaskStatus::Encoding;
  case Substage::Generating:
    return TaskStatus::Generating;
  case Substage::Idle:
    break;
  }
  return TaskStatus::Assigned;
}

} // anonymous namespace

ProgressAggregator::ProgressAggregator(EventChannel &channel,
                                       Broadcaster &broadcaster)
    : channel_(channel), broadcaster_(broadcaster) {
  thread_ = std::thread(&ProgressAggregator::run, this);
}

ProgressAggregator::~ProgressAggregator() {
  channel_.close();
  if (thread_.joinable())
    thread_.join();
}

void ProgressAggregator::run() {
  WorkerEvent event;
  while (channel_.pop(event)) {
    apply(event);
  }
}

void ProgressAggregator::begin_job(const Job &job,
                                   const std::vector<std::string> &devices) {
  std::lock_guard<std::mutex> lock(mutex_);

  stage_ = JobStage::LoadingModel;
  job_id_ = job.id();
  batch_size_ = static_cast<int>(devices.size());

  workers_.clear();
  for (std::size_t i = 0; i < devices.size(); ++i) {
    WorkerState worker;
    worker.worker_id = static_cast<WorkerId>(i);
    worker.device = devices[i];
    workers_.push_back(std::move(worker));
  }
  inflight_tokens_.assign(devices.size(), 0);

  tasks_.clear();
  for (const auto &video : job.videos()) {
    TaskResult task;
    task.video_name = video.name;
    tasks_.push_back(std::move(task));
  }

  completed_ = 0;
  failed_ = 0;
  devices_prepared_ = 0;
  tokens_committed_ = 0;
  overall_ = 0;
  error_message_.reset();
  started_at_ = Clock::now();
  processing_at_ = started_at_;
  finished_at_.reset();

  LOG_PHASE("[Job {}] Loading model on {} device(s) for {} video(s)", job_id_,
            devices.size(), tasks_.size());
  publish_locked(false);
}

void ProgressAggregator::set_substage(WorkerState &worker, TaskResult &task,
                                      Substage substage) {
  worker.substage = substage;
  task.status = status_for(substage);
}

void ProgressAggregator::apply(const WorkerEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);

  /// Events that outlive their job are dropped
  if (!is_active(stage_))
    return;

  WorkerState *worker = nullptr;
  if (event.worker >= 0 &&
      static_cast<std::size_t>(event.worker) < workers_.size()) {
    worker = &workers_[event.worker];
  }
  TaskResult *task = event.task_index < tasks_.size()
                         ? &tasks_[event.task_index]
                         : nullptr;

  switch (event.kind) {
  case EventKind::DevicePrepared:
    if (worker)
      worker->substage_progress = 1.0;
    devices_prepared_++;
    if (stage_ == JobStage::LoadingModel &&
        devices_prepared_ >= static_cast<int>(workers_.size())) {
      stage_ = JobStage::Processing;
      processing_at_ = Clock::now();
      for (auto &w : workers_) {
        clear_worker(w);
        w.active = true;
      }
      LOG_PHASE("[Job {}] Processing with {} worker(s)", job_id_,
                workers_.size());
    }
    break;

  case EventKind::TaskStarted:
    if (worker && task) {
      clear_worker(*worker);
      worker->current_video = task->video_name;
      inflight_tokens_[event.worker] = 0;
      task->status = TaskStatus::Assigned;
      task->worker = event.worker;
    }
    break;

  case EventKind::Substage:
    if (worker && task) {
      set_substage(*worker, *task, event.substage);
      worker->substage_progress = std::min(1.0, std::max(0.0, event.progress));
      inflight_tokens_[event.worker] = event.tokens;
    }
    break;

  case EventKind::TaskDone:
    if (task && task->status != TaskStatus::Done &&
        task->status != TaskStatus::Failed) {
      completed_++;
      task->status = TaskStatus::Done;
      task->output_path = event.message;
      task->tokens_generated = event.tokens;
      task->elapsed_seconds = event.elapsed;
      tokens_committed_ += event.tokens;
    }
    if (worker) {
      clear_worker(*worker);
      inflight_tokens_[event.worker] = 0;
    }
    break;

  case EventKind::TaskFailed:
    if (task && task->status != TaskStatus::Done &&
        task->status != TaskStatus::Failed) {
      failed_++;
      task->status = TaskStatus::Failed;
      task->error = event.message;
      task->tokens_generated = event.tokens;
      task->elapsed_seconds = event.elapsed;
      tokens_committed_ += event.tokens;
    }
    if (worker) {
      clear_worker(*worker);
      inflight_tokens_[event.worker] = 0;
    }
    break;

  case EventKind::TaskAbandoned:
    if (task) {
      task->status = TaskStatus::Queued;
      task->worker.reset();
    }
    if (worker) {
      clear_worker(*worker);
      inflight_tokens_[event.worker] = 0;
    }
    break;

  case EventKind::WorkerExited:
    if (worker) {
      clear_worker(*worker);
      worker->active = false;
      inflight_tokens_[event.worker] = 0;
    }
    break;

  case EventKind::JobFatal:
    if (!error_message_) {
      error_message_ = event.message;
      LOG_ERROR("[Job {}] Fatal: {}", job_id_, event.message);
    }
    break;

  case EventKind::RunFinished:
    finish_run();
    break;
  }

  bool terminal = is_terminal(stage_);
  publish_locked(terminal);
  if (terminal)
    terminal_cv_.notify_all();
}

void ProgressAggregator::finish_run() {
  int total = static_cast<int>(tasks_.size());
  if (error_message_) {
    stage_ = JobStage::Error;
  } else if (completed_ + failed_ == total) {
    stage_ = JobStage::Complete;
  } else {
    stage_ = JobStage::Stopped;
  }
  finished_at_ = Clock::now();

  for (auto &w : workers_) {
    clear_worker(w);
    w.active = false;
  }
  std::fill(inflight_tokens_.begin(), inflight_tokens_.end(), 0);

  LOG_PHASE("[Job {}] {}: {} completed, {} failed, {} remaining", job_id_,
            to_string(stage_), completed_, failed_,
            total - completed_ - failed_);
}

void ProgressAggregator::publish_locked(bool immediate) {
  /// Finished tasks are the floor; active substages add their fraction
  if (!tasks_.empty()) {
    double total = static_cast<double>(tasks_.size());
    double sum = 0;
    for (const auto &w : workers_) {
      if (w.current_video)
        sum += w.substage_progress;
    }
    double computed = (completed_ + failed_) / total + sum / total;
    computed = std::min(1.0, std::max(0.0, computed));
    overall_ = std::max(overall_, computed);
  }
  broadcaster_.publish(build_snapshot(), immediate);
}

ProgressSnapshot ProgressAggregator::build_snapshot() const {
  ProgressSnapshot s;
  s.stage = stage_;
  s.job_id = job_id_;
  s.total_videos = static_cast<int>(tasks_.size());
  s.completed_videos = completed_;
  s.failed_videos = failed_;
  s.remaining_videos = s.total_videos - completed_ - failed_;
  s.overall_progress = overall_;
  s.batch_size = batch_size_;
  s.workers = workers_;
  s.error_message = error_message_;

  s.tokens_generated = tokens_committed_;
  for (auto tokens : inflight_tokens_)
    s.tokens_generated += tokens;

  if (stage_ != JobStage::Idle) {
    auto end = finished_at_ ? *finished_at_ : Clock::now();
    s.elapsed_seconds = seconds_between(started_at_, end);
    double generating = seconds_between(processing_at_, end);
    if (generating > 0)
      s.tokens_per_sec = s.tokens_generated / generating;
  }
  return s;
}

ProgressSnapshot ProgressAggregator::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return build_snapshot();
}

JobStage ProgressAggregator::stage() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return stage_;
}

ProgressSnapshot ProgressAggregator::wait_terminal() const {
  std::unique_lock<std::mutex> lock(mutex_);
  terminal_cv_.wait(lock, [this] { return is_terminal(stage_); });
  return build_snapshot();
}

std::vector<TaskResult> ProgressAggregator::results() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return tasks_;
}

} // namespace caption_suite
