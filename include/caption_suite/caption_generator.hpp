/**
 * @file caption_generator.hpp
 * @brief Caption generation interface
 *
 * @details The vision-language model is a black box behind this interface:
 *          frames and a prompt go in, caption text and a token count come
 *          out. Implementations report when the inputs have been encoded and
 *          then once per generated token.
 */

#ifndef CAPTION_SUITE_CAPTION_GENERATOR_HPP
#define CAPTION_SUITE_CAPTION_GENERATOR_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

namespace caption_suite {

/**
 * @struct Caption
 * @brief Generation result for one video.
 */
struct Caption {
  std::string text;
  int64_t tokens = 0;
};

/**
 * @struct GenerationRequest
 * @brief Inputs of one generate() call.
 */
struct GenerationRequest {
  std::string prompt;
  int max_tokens = 512;
  double temperature = 0.3;
};

/**
 * @struct GenerationHooks
 * @brief Progress and cancellation callbacks for generate().
 */
struct GenerationHooks {
  /// Frames and prompt consumed, first token pending
  std::function<void()> on_encoded;

  /// Called with the running token count after each new token
  std::function<void(int64_t tokens)> on_token;

  /// Polled between tokens and while waiting; true abandons the call
  std::function<bool()> stop_requested;
};

class CaptionGenerator {
public:
  virtual ~CaptionGenerator() = default;

  /**
   * @brief Load the model onto the device.
   * @throws DeviceError if the model or device is unavailable
   */
  virtual void load() = 0;

  /**
   * @brief Caption one video from its sampled frames.
   * @throws GenerationError if the model fails on this input
   * @throws DeviceError if the device was lost
   * @throws StoppedError if stop_requested returned true
   */
  virtual Caption generate(const std::vector<Frame> &frames,
                           const GenerationRequest &request,
                           const GenerationHooks &hooks) = 0;

  /// Release the model; safe to call more than once
  virtual void unload() = 0;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_CAPTION_GENERATOR_HPP
