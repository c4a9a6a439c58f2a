/**
 * @file device_backend.hpp
 * @brief Per-device pipeline capability
 *
 * @details A DeviceBackend is created for each selected device by the
 *          BackendFactory. The job supervisor calls prepare() on every
 *          backend in turn, the worker bound to the device calls
 *          run_pipeline() once per task, and shutdown() runs after the
 *          worker has exited.
 */

#ifndef CAPTION_SUITE_DEVICE_BACKEND_HPP
#define CAPTION_SUITE_DEVICE_BACKEND_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <string>

#include "caption_generator.hpp"
#include "frame_extractor.hpp"
#include "types.hpp"
#include "work_queue.hpp"

namespace caption_suite {

/**
 * @class PipelineListener
 * @brief Receives substage progress from a running pipeline.
 */
class PipelineListener {
public:
  virtual ~PipelineListener() = default;

  /**
   * @brief Report the current substage.
   * @param substage Phase being executed
   * @param progress Fraction of the phase done, in [0, 1]
   * @param tokens Tokens generated so far (Generating only)
   */
  virtual void on_substage(Substage substage, double progress,
                           int64_t tokens) = 0;

  /// True once a stop was requested; pipelines poll it
  virtual bool should_stop() const = 0;
};

/**
 * @struct PipelineResult
 * @brief Output of one successful pipeline run.
 */
struct PipelineResult {
  std::string text;
  int64_t tokens = 0;
  VideoMetadata metadata;
  double generation_seconds = 0;
};

class DeviceBackend {
public:
  virtual ~DeviceBackend() = default;

  virtual const std::string &device() const = 0;

  /**
   * @brief Make the device ready (load the model).
   * @throws DeviceError if the device or model is unavailable
   */
  virtual void prepare() = 0;

  /**
   * @brief Extract, encode and generate for one task.
   * @throws DecodeError, GenerationError on task-level failures
   * @throws DeviceError if the device was lost
   * @throws StoppedError if listener.should_stop() turned true mid-way
   */
  virtual PipelineResult run_pipeline(const Task &task,
                                      const GenerationSettings &settings,
                                      PipelineListener &listener) = 0;

  /// Release the device; safe after a failed prepare()
  virtual void shutdown() = 0;
};

/// Creates the backend for one device string ("cuda:0", "cpu", ...)
using BackendFactory =
    std::function<std::unique_ptr<DeviceBackend>(const std::string &device)>;

/**
 * @class LocalPipelineBackend
 * @brief Runs a FrameExtractor and a CaptionGenerator in-process.
 */
class LocalPipelineBackend : public DeviceBackend {
public:
  LocalPipelineBackend(std::string device,
                       std::unique_ptr<FrameExtractor> extractor,
                       std::unique_ptr<CaptionGenerator> generator);

  const std::string &device() const override { return device_; }
  void prepare() override;
  PipelineResult run_pipeline(const Task &task,
                              const GenerationSettings &settings,
                              PipelineListener &listener) override;
  void shutdown() override;

private:
  std::string device_;
  std::unique_ptr<FrameExtractor> extractor_;
  std::unique_ptr<CaptionGenerator> generator_;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_DEVICE_BACKEND_HPP
