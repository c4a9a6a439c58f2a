/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables.
 *          Generation defaults mirror the settings schema served to the
 *          dashboard; default_settings() bundles them into a snapshot and
 *          validate_settings() enforces the accepted ranges.
 *
 */

#ifndef CAPTION_SUITE_CONFIG_HPP
#define CAPTION_SUITE_CONFIG_HPP

#include <cstdint>
#include <cstdlib>
#include <string>

#include "types.hpp"

namespace caption_suite {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Raw value or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/// Prompt used when neither the request nor CAPTION_PROMPT supplies one
extern const char *const DEFAULT_PROMPT;

// **---- MODEL ----**

/// Model identifier reported in metadata and passed to the generator command
inline std::string model_id() {
  static std::string val =
      get_env_string("CAPTION_MODEL_ID", "Qwen/Qwen3-VL-8B-Instruct");
  return val;
}

/// Device family: "cuda" or "cpu"
inline std::string device() {
  static std::string val = get_env_string("CAPTION_DEVICE", "cuda");
  return val;
}

/**
 * @brief Explicit comma-separated device list (e.g. "cuda:0,cuda:2")
 * @note When set, overrides device() and batch_size() for worker placement.
 */
inline std::string devices() {
  static std::string val = get_env_string("CAPTION_DEVICES", "");
  return val;
}

/// Path to model weights, substituted into the generator command
inline std::string model_path() {
  static std::string val = get_env_string("CAPTION_MODEL_PATH", "");
  return val;
}

/// Path to the multimodal projector, substituted into the generator command
inline std::string mmproj_path() {
  static std::string val = get_env_string("CAPTION_MMPROJ_PATH", "");
  return val;
}

/**
 * @brief Command template used by the external caption generator.
 * @note Placeholders: {model} {mmproj} {images} {prompt} {max_tokens}
 *       {temperature} {device} {device_index}
 */
inline std::string generator_cmd() {
  static std::string val = get_env_string(
      "CAPTION_GENERATOR_CMD",
      "llama-mtmd-cli -m {model} --mmproj {mmproj} {images} -p {prompt} "
      "-n {max_tokens} --temp {temperature} --main-gpu {device_index} "
      "--no-warmup 2>/dev/null");
  return val;
}

/**
 * @brief Flag written before each frame path in {images}
 * @note "none" expands {images} to bare space-separated paths.
 */
inline std::string image_arg() {
  static std::string val = get_env_string("CAPTION_IMAGE_ARG", "--image");
  return val;
}

// **---- INFERENCE ----**

/// Maximum frames sampled from each video
inline int max_frames() {
  static int val = get_env_int("CAPTION_MAX_FRAMES", 16);
  return val;
}

/// Longest frame side in pixels after resizing
inline int frame_size() {
  static int val = get_env_int("CAPTION_FRAME_SIZE", 336);
  return val;
}

/// Token budget per caption
inline int max_tokens() {
  static int val = get_env_int("CAPTION_MAX_TOKENS", 512);
  return val;
}

/// Sampling temperature (0 = deterministic)
inline double temperature() {
  static double val = get_env_double("CAPTION_TEMPERATURE", 0.3);
  return val;
}

/**
 * @brief Number of devices to run in parallel
 * @note The effective worker count is min(batch_size, videos in the job).
 */
inline int batch_size() {
  static int val = get_env_int("CAPTION_BATCH_SIZE", 1);
  return val;
}

/// Prompt sent with every video
inline std::string prompt() {
  static std::string val = get_env_string("CAPTION_PROMPT", DEFAULT_PROMPT);
  return val;
}

// **---- OUTPUT ----**

/// Append a metadata trailer to every caption file
inline bool include_metadata() {
  static bool val = (get_env_int("CAPTION_INCLUDE_METADATA", 0) != 0);
  return val;
}

/// Caption file extension
inline std::string output_extension() {
  static std::string val = get_env_string("CAPTION_OUTPUT_EXTENSION", ".txt");
  return val;
}

/// Caption directory (empty = next to each video)
inline std::string output_dir() {
  static std::string val = get_env_string("CAPTION_OUTPUT_DIR", "");
  return val;
}

/// Recurse into subdirectories when discovering media
inline bool traverse_subfolders() {
  static bool val = (get_env_int("CAPTION_TRAVERSE_SUBFOLDERS", 0) != 0);
  return val;
}

// **---- PROGRESS ----**

/// Minimum interval between two pushes to the same observer
inline int broadcast_interval_ms() {
  static int val = get_env_int("CAPTION_BROADCAST_INTERVAL_MS", 100);
  return val;
}

/// Capacity of the worker -> aggregator event channel
inline int event_queue_capacity() {
  static int val = get_env_int("CAPTION_EVENT_QUEUE_CAPACITY", 1024);
  return val;
}

/// Optional JSON-lines file receiving every broadcast snapshot
inline std::string progress_json() {
  static std::string val = get_env_string("CAPTION_PROGRESS_JSON", "");
  return val;
}

/**
 * @brief Build a settings snapshot from the environment.
 */
GenerationSettings default_settings();

/**
 * @brief Check every field against its accepted range.
 * @throws SettingsError naming the first offending field
 */
void validate_settings(const GenerationSettings &settings);

} // namespace Config
} // namespace caption_suite

#endif // CAPTION_SUITE_CONFIG_HPP
