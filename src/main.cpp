/**
 * @file main.cpp
 * @brief Entry point for the Caption Suite batch captioner
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Wiring the libav extractor and the command generator into one
 *            backend per device
 *
 *          - Console and JSON-lines progress observers
 *
 *          - Clean stop on SIGINT / SIGTERM
 *
 * @note Exit code is the number of videos that failed (1 on a start error).
 *       Set CAPTION_BATCH_SIZE or CAPTION_DEVICES to run several devices.
 */

#include <pthread.h>
#include <signal.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

#include "caption_suite/command_generator.hpp"
#include "caption_suite/config.hpp"
#include "caption_suite/ffmpeg_frame_extractor.hpp"
#include "caption_suite/logging.hpp"
#include "caption_suite/media_files.hpp"
#include "caption_suite/payload.hpp"
#include "caption_suite/processing_manager.hpp"

using namespace caption_suite;

namespace {

// **---- OBSERVERS ----**

/**
 * @class ConsoleObserver
 * @brief Prints a progress line when counts or stage change, or every 2s.
 */
class ConsoleObserver : public ProgressObserver {
  JobStage last_stage_ = JobStage::Idle;
  int last_finished_ = -1;
  std::chrono::steady_clock::time_point last_print_;

public:
  bool deliver(const ProgressSnapshot &s) override {
    auto now = std::chrono::steady_clock::now();
    int finished = s.completed_videos + s.failed_videos;
    bool changed = s.stage != last_stage_ || finished != last_finished_;
    if (!changed && now - last_print_ < std::chrono::seconds(2))
      return true;

    last_stage_ = s.stage;
    last_finished_ = finished;
    last_print_ = now;

    if (s.stage == JobStage::Idle)
      return true;

    LOG_INFO("[Progress] {:<13} {}/{} done, {} failed | {:5.1f}% | {} tokens "
             "({:.1f} tok/s) | {}",
             to_string(s.stage), s.completed_videos, s.total_videos,
             s.failed_videos, s.overall_progress * 100.0, s.tokens_generated,
             s.tokens_per_sec, format_time(s.elapsed_seconds));
    return true;
  }
};

/**
 * @class JsonLinesObserver
 * @brief Appends every pushed snapshot as one JSON line.
 */
class JsonLinesObserver : public ProgressObserver {
  std::ofstream out_;

public:
  explicit JsonLinesObserver(const std::string &path)
      : out_(path, std::ios::app) {}

  bool is_open() const { return out_.is_open(); }

  bool deliver(const ProgressSnapshot &s) override {
    out_ << json(s).dump() << '\n';
    out_.flush();
    return static_cast<bool>(out_);
  }
};

// **---- SUMMARY ----**

void print_batch_summary(const ProgressSnapshot &s,
                         const std::vector<TaskResult> &results) {
  double sum_time_sec = 0;
  int timed = 0;
  for (const auto &r : results) {
    if (r.status == TaskStatus::Done || r.status == TaskStatus::Failed) {
      sum_time_sec += r.elapsed_seconds;
      timed++;
    }
  }
  double speedup =
      (s.elapsed_seconds > 0) ? sum_time_sec / s.elapsed_seconds : 1.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== CAPTIONING SUMMARY ==============\n");
  fmt::print("{:<25} {:>22}\n", "Job:", s.job_id);
  fmt::print("{:<25} {:>22}\n", "Final stage:", to_string(s.stage));
  fmt::print("{:<25} {:>22}\n", "Total videos:", s.total_videos);
  fmt::print("{:<25} {:>22}\n", "Completed:", s.completed_videos);
  fmt::print("{:<25} {:>22}\n", "Failed:", s.failed_videos);
  fmt::print("{:<25} {:>22}\n", "Remaining:", s.remaining_videos);
  fmt::print("{:<25} {:>22}\n", "Devices:", s.batch_size);
  fmt::print("{:<25} {:>22}\n", "Tokens generated:", s.tokens_generated);
  fmt::print("{:<25} {:>22.1f}\n", "Tokens/sec:", s.tokens_per_sec);
  fmt::print("{:<25} {:>21.1f}s\n", "Wall-clock time:", s.elapsed_seconds);
  fmt::print("{:<25} {:>21.1f}s\n", "Sum of video times:", sum_time_sec);
  fmt::print("{:<25} {:>21.2f}x\n", "Speedup:", speedup);
  if (timed > 0) {
    fmt::print("{:<25} {:>21.1f}s\n", "Average time per video:",
               sum_time_sec / timed);
  }
  fmt::print(fg(fmt::color::cyan),
             "================================================\n");

  if (s.error_message) {
    fmt::print(fg(fmt::color::red), "\nJob error: {}\n", *s.error_message);
  }

  if (s.failed_videos > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed videos:\n");
    for (const auto &r : results) {
      if (r.status == TaskStatus::Failed) {
        fmt::print(fg(fmt::color::red), "  - {}: {}\n", r.video_name,
                   r.error.value_or("unknown error"));
      }
    }
  }
  std::fflush(stdout);
}

// **---- BACKENDS ----**

BackendFactory make_backend_factory(const GenerationSettings &defaults) {
  std::string model_id = defaults.model_id;
  return [model_id](const std::string &device) {
    CommandOptions options;
    options.command_template = Config::generator_cmd();
    options.image_arg = Config::image_arg();
    options.model_path = Config::model_path();
    options.mmproj_path = Config::mmproj_path();
    options.model_id = model_id;
    options.device = device;
    return std::make_unique<LocalPipelineBackend>(
        device, std::make_unique<FFmpegFrameExtractor>(),
        std::make_unique<CommandCaptionGenerator>(std::move(options)));
  };
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    LOG_WARN("Usage: ./caption_suite <video_dir> [video_name...]");
    return 1;
  }

  namespace fs = std::filesystem;
  std::string working_dir = argv[1];
  if (!fs::is_directory(working_dir)) {
    LOG_ERROR("Not a directory: {}", working_dir);
    return 1;
  }

  /// Signals are taken by a dedicated thread; block them everywhere else
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  sigaddset(&signals, SIGUSR1);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  ManagerOptions options;
  try {
    options = ManagerOptions::from_config(working_dir);
    Config::validate_settings(options.defaults);
  } catch (const std::exception &e) {
    LOG_ERROR("Invalid configuration: {}", e.what());
    return 1;
  }

  LOG_INFO("Caption Suite - Batch Mode");
  LOG_INFO("Working directory: {}", working_dir);
  LOG_INFO("Model: {} on {}", options.defaults.model_id,
           options.device_list.empty() ? options.defaults.device
                                       : options.device_list);

  auto writer = std::make_shared<FileCaptionWriter>(Config::output_extension(),
                                                    Config::output_dir());
  ProcessingManager manager(options, make_backend_factory(options.defaults),
                            writer);

  manager.subscribe(std::make_shared<ConsoleObserver>());
  if (!Config::progress_json().empty()) {
    auto jsonl = std::make_shared<JsonLinesObserver>(Config::progress_json());
    if (jsonl->is_open()) {
      manager.subscribe(jsonl);
      LOG_INFO("Writing progress to {}", Config::progress_json());
    } else {
      LOG_ERROR("Cannot open progress file {}", Config::progress_json());
    }
  }

  StartRequest request;
  if (argc > 2)
    request.video_names = std::vector<std::string>(argv + 2, argv + argc);

  StartResponse started = manager.start(request);
  if (!started.accepted) {
    LOG_ERROR("Start rejected: {}", started.message);
    return 1;
  }

  // **---- SIGNAL THREAD ----**

  std::thread signal_thread([&manager, &signals]() {
    int sig = 0;
    if (sigwait(&signals, &sig) != 0 || sig == SIGUSR1)
      return;
    LOG_WARN("Received {}, stopping...", sig == SIGINT ? "SIGINT" : "SIGTERM");
    StopResponse stopped = manager.stop();
    if (stopped.accepted) {
      LOG_WARN("Stopped: {} completed, {} failed, {} remaining",
               stopped.videos_completed, stopped.videos_failed,
               stopped.videos_remaining);
    }
  });

  ProgressSnapshot final_state = manager.wait();

  /// Release the signal thread if no signal arrived
  pthread_kill(signal_thread.native_handle(), SIGUSR1);
  signal_thread.join();

  print_batch_summary(final_state, manager.results());
  TimingCollector::print_summary();

  return exit_status(final_state);
}
