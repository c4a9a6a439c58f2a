/**
 * @file fakes.hpp
 * @brief Scripted collaborators shared by the unit tests
 */

#ifndef CAPTION_SUITE_TESTS_FAKES_HPP
#define CAPTION_SUITE_TESTS_FAKES_HPP

#include <unistd.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <limits>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <fmt/core.h>

#include "caption_suite/broadcaster.hpp"
#include "caption_suite/caption_writer.hpp"
#include "caption_suite/device_backend.hpp"
#include "caption_suite/errors.hpp"

namespace caption_suite {
namespace test_support {

/**
 * @class TempDir
 * @brief Scratch directory removed on destruction.
 */
class TempDir {
public:
  TempDir() {
    static std::atomic<int> counter{0};
    path_ = std::filesystem::temp_directory_path() /
            fmt::format("caption_suite_test_{}_{}", getpid(),
                        counter.fetch_add(1));
    std::filesystem::remove_all(path_);
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir &) = delete;
  TempDir &operator=(const TempDir &) = delete;

  const std::filesystem::path &path() const { return path_; }
  std::string str() const { return path_.string(); }

  /// Create a file (and its parents) with optional content
  std::filesystem::path touch(const std::string &name,
                              const std::string &content = "") const {
    auto file = path_ / name;
    std::filesystem::create_directories(file.parent_path());
    std::ofstream(file) << content;
    return file;
  }

private:
  std::filesystem::path path_;
};

inline std::string read_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  return std::string(std::istreambuf_iterator<char>(in),
                     std::istreambuf_iterator<char>());
}

/// Settings that pass Config::validate_settings
inline GenerationSettings test_settings(int batch_size = 1) {
  GenerationSettings s;
  s.model_id = "test/vlm";
  s.device = "cpu";
  s.max_frames = 4;
  s.frame_size = 336;
  s.max_tokens = 64;
  s.temperature = 0.0;
  s.batch_size = batch_size;
  s.include_metadata = false;
  s.prompt = "Describe the clip.";
  return s;
}

inline std::vector<MediaFile> media(const std::vector<std::string> &names) {
  std::vector<MediaFile> files;
  for (const auto &name : names)
    files.push_back(MediaFile{name, "/videos/" + name});
  return files;
}

/// Wait until pred holds or timeout expires
inline bool eventually(const std::function<bool()> &pred,
                       std::chrono::milliseconds timeout =
                           std::chrono::milliseconds(5000)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline)
      return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }
  return true;
}

// **---- BACKEND ----**

/**
 * @struct FakeScript
 * @brief Per-video behavior of FakeBackend. Read-only once a job starts.
 */
struct FakeScript {
  std::set<std::string> decode_failures;
  std::set<std::string> generation_failures;
  std::set<std::string> device_failures;
  std::set<std::string> unprepared_devices; //< prepare() throws DeviceError
  std::set<std::string> stopped_videos;     //< run_pipeline throws StoppedError
  std::function<void(const Task &)> after_generation; //< Runs before return
  std::size_t block_from_index = std::numeric_limits<std::size_t>::max();
  int64_t tokens = 12;
  std::chrono::milliseconds work{1};
};

/**
 * @class FakeBackend
 * @brief DeviceBackend that follows a FakeScript instead of running a model.
 */
class FakeBackend : public DeviceBackend {
public:
  FakeBackend(std::string device, std::shared_ptr<const FakeScript> script)
      : device_(std::move(device)), script_(std::move(script)) {}

  const std::string &device() const override { return device_; }

  void prepare() override {
    if (script_->unprepared_devices.count(device_))
      throw DeviceError(fmt::format("{} unavailable", device_));
    prepared_ = true;
  }

  PipelineResult run_pipeline(const Task &task,
                              const GenerationSettings &settings,
                              PipelineListener &listener) override {
    listener.on_substage(Substage::ExtractingFrames, 0.0, 0);
    if (script_->decode_failures.count(task.video_name))
      throw DecodeError(fmt::format("Cannot open {}", task.video_name));
    listener.on_substage(Substage::ExtractingFrames, 1.0, 0);

    listener.on_substage(Substage::Encoding, 0.0, 0);
    if (task.index >= script_->block_from_index) {
      while (!listener.should_stop())
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
      throw StoppedError();
    }
    if (script_->device_failures.count(task.video_name))
      throw DeviceError("device lost");
    if (script_->stopped_videos.count(task.video_name))
      throw StoppedError();

    listener.on_substage(Substage::Generating, 0.5, script_->tokens / 2);
    if (script_->generation_failures.count(task.video_name))
      throw GenerationError("model returned nothing");
    std::this_thread::sleep_for(script_->work);
    listener.on_substage(Substage::Generating, 1.0, script_->tokens);
    if (script_->after_generation)
      script_->after_generation(task);

    PipelineResult result;
    result.text = settings.prompt + " | " + task.video_name;
    result.tokens = script_->tokens;
    result.metadata.frames_extracted = settings.max_frames;
    result.generation_seconds = 0.5;
    return result;
  }

  void shutdown() override { prepared_ = false; }

  bool prepared() const { return prepared_; }

private:
  std::string device_;
  std::shared_ptr<const FakeScript> script_;
  bool prepared_ = false;
};

inline BackendFactory fake_factory(std::shared_ptr<const FakeScript> script) {
  return [script](const std::string &device) {
    return std::make_unique<FakeBackend>(device, script);
  };
}

// **---- WRITER ----**

/**
 * @class FakeWriter
 * @brief In-memory CaptionWriter.
 */
class FakeWriter : public CaptionWriter {
public:
  std::set<std::string> failures;

  std::string persist(const MediaFile &video, const std::string &text,
                      const CaptionMetadata &metadata,
                      bool include_metadata) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failures.count(video.name))
      throw PersistError(fmt::format("disk full writing {}", video.name));
    captions_[video.name] = text;
    metadata_[video.name] = metadata;
    (void)include_metadata;
    return "/captions/" + video.name + ".txt";
  }

  std::map<std::string, std::string> captions() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return captions_;
  }

  std::map<std::string, CaptionMetadata> metadata() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return metadata_;
  }

private:
  mutable std::mutex mutex_;
  std::map<std::string, std::string> captions_;
  std::map<std::string, CaptionMetadata> metadata_;
};

// **---- OBSERVER ----**

/**
 * @class RecordingObserver
 * @brief Keeps every delivered snapshot.
 */
class RecordingObserver : public ProgressObserver {
public:
  bool deliver(const ProgressSnapshot &snapshot) override {
    {
      std::lock_guard<std::mutex> lock(mutex_);
      received_.push_back(snapshot);
    }
    cv_.notify_all();
    return true;
  }

  std::vector<ProgressSnapshot> received() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_;
  }

  std::size_t count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return received_.size();
  }

  bool wait_for(const std::function<bool(const std::vector<ProgressSnapshot> &)>
                    &pred,
                std::chrono::milliseconds timeout =
                    std::chrono::milliseconds(5000)) {
    std::unique_lock<std::mutex> lock(mutex_);
    return cv_.wait_for(lock, timeout, [&] { return pred(received_); });
  }

  bool wait_for_count(std::size_t n, std::chrono::milliseconds timeout =
                                         std::chrono::milliseconds(5000)) {
    return wait_for([n](const std::vector<ProgressSnapshot> &r) {
      return r.size() >= n;
    }, timeout);
  }

  bool wait_for_terminal(std::chrono::milliseconds timeout =
                             std::chrono::milliseconds(5000)) {
    return wait_for([](const std::vector<ProgressSnapshot> &r) {
      return !r.empty() && is_terminal(r.back().stage);
    }, timeout);
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::vector<ProgressSnapshot> received_;
};

} // namespace test_support
} // namespace caption_suite

#endif // CAPTION_SUITE_TESTS_FAKES_HPP
