/**
 * @file config.cpp
 * @brief Settings defaults and range validation
 */

#include "caption_suite/config.hpp"

#include <fmt/core.h>

#include "caption_suite/errors.hpp"

namespace caption_suite {
namespace Config {

const char *const DEFAULT_PROMPT =
    "Describe this video in detail. Include:\n"
    "- The main subject and their actions\n"
    "- The setting and environment\n"
    "- Any notable objects or elements\n"
    "- The overall mood or atmosphere\n"
    "- Any text visible in the video";

GenerationSettings default_settings() {
  GenerationSettings s;
  s.model_id = model_id();
  s.device = device();
  s.max_frames = max_frames();
  s.frame_size = frame_size();
  s.max_tokens = max_tokens();
  s.temperature = temperature();
  s.batch_size = batch_size();
  s.include_metadata = include_metadata();
  s.prompt = prompt();
  return s;
}

namespace {

template <typename T>
void check_range(const char *field, T value, T lo, T hi) {
  if (value < lo || value > hi) {
    throw SettingsError(
        fmt::format("{} must be in [{}, {}], got {}", field, lo, hi, value));
  }
}

} // anonymous namespace

void validate_settings(const GenerationSettings &settings) {
  if (settings.model_id.empty())
    throw SettingsError("model_id must not be empty");
  if (settings.device != "cuda" && settings.device != "cpu")
    throw SettingsError(fmt::format(
        "device must be \"cuda\" or \"cpu\", got \"{}\"", settings.device));
  check_range("max_frames", settings.max_frames, 1, 128);
  check_range("frame_size", settings.frame_size, 224, 672);
  check_range("max_tokens", settings.max_tokens, 64, 2048);
  check_range("temperature", settings.temperature, 0.0, 2.0);
  check_range("batch_size", settings.batch_size, 1, 8);
  if (settings.prompt.empty())
    throw SettingsError("prompt must not be empty");
}

} // namespace Config
} // namespace caption_suite
