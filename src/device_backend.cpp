/**
 * @file device_backend.cpp
 * @brief In-process extraction + generation pipeline
 */

#include "caption_suite/device_backend.hpp"

#include <algorithm>
#include <chrono>

#include "caption_suite/errors.hpp"
#include "caption_suite/logging.hpp"

namespace caption_suite {

LocalPipelineBackend::LocalPipelineBackend(
    std::string device, std::unique_ptr<FrameExtractor> extractor,
    std::unique_ptr<CaptionGenerator> generator)
    : device_(std::move(device)), extractor_(std::move(extractor)),
      generator_(std::move(generator)) {}

void LocalPipelineBackend::prepare() {
  TIMER_START(load_model);
  generator_->load();
  TIMER_END(load_model);
}

void LocalPipelineBackend::shutdown() { generator_->unload(); }

PipelineResult
LocalPipelineBackend::run_pipeline(const Task &task,
                                   const GenerationSettings &settings,
                                   PipelineListener &listener) {
  PipelineResult result;

  // **---- EXTRACT FRAMES ----**

  listener.on_substage(Substage::ExtractingFrames, 0.0, 0);

  ExtractionLimits limits;
  limits.max_frames = settings.max_frames;
  limits.frame_size = settings.frame_size;

  TIMER_START(extract_frames);
  std::vector<Frame> frames = extractor_->extract(
      task.path, limits, result.metadata, [&](int extracted, int target) {
        double progress =
            target > 0 ? static_cast<double>(extracted) / target : 0.0;
        listener.on_substage(Substage::ExtractingFrames, progress, 0);
        return !listener.should_stop();
      });
  TIMER_END(extract_frames);

  if (listener.should_stop())
    throw StoppedError();

  // **---- ENCODE + GENERATE ----**

  listener.on_substage(Substage::Encoding, 0.0, 0);

  GenerationRequest request;
  request.prompt = settings.prompt;
  request.max_tokens = settings.max_tokens;
  request.temperature = settings.temperature;

  const double budget = std::max(1, settings.max_tokens);
  GenerationHooks hooks;
  hooks.on_encoded = [&]() {
    listener.on_substage(Substage::Generating, 0.0, 0);
  };
  hooks.on_token = [&](int64_t tokens) {
    listener.on_substage(Substage::Generating, std::min(1.0, tokens / budget),
                         tokens);
  };
  hooks.stop_requested = [&]() { return listener.should_stop(); };

  auto gen_start = std::chrono::steady_clock::now();
  TIMER_START(generate_caption);
  Caption caption = generator_->generate(frames, request, hooks);
  TIMER_END(generate_caption);
  result.generation_seconds = std::chrono::duration<double>(
                                  std::chrono::steady_clock::now() - gen_start)
                                  .count();

  result.text = std::move(caption.text);
  result.tokens = caption.tokens;
  return result;
}

} // namespace caption_suite
