/**
 * @file command_generator.hpp
 * @brief Caption generation through an external VLM command line
 *
 * @details Runs a multimodal CLI (llama.cpp's llama-mtmd-cli by default) once
 *          per video:
 *
 *          - Sampled frames are written as PPM files to a per-worker scratch
 *            directory
 *
 *          - The command is built from a template and run through /bin/sh
 *
 *          - stdout is streamed; every whitespace-delimited word counts as one
 *            generated token
 *
 *          - A stop request terminates the child process
 */

#ifndef CAPTION_SUITE_COMMAND_GENERATOR_HPP
#define CAPTION_SUITE_COMMAND_GENERATOR_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "caption_generator.hpp"

namespace caption_suite {

/**
 * @struct CommandOptions
 * @brief Static inputs substituted into the command template.
 */
struct CommandOptions {
  std::string command_template; //< See Config::generator_cmd()
  std::string image_arg;        //< Flag before each frame ("none" = bare)
  std::string model_path;
  std::string mmproj_path;
  std::string model_id;
  std::string device;           //< "cuda:N" or "cpu"
};

/**
 * @brief Quote a value for /bin/sh (single quotes, embedded quotes escaped).
 */
std::string shell_quote(const std::string &value);

/**
 * @brief Parse the ordinal of a device string ("cuda:2" -> 2, "cpu" -> 0).
 */
int device_index(const std::string &device);

class CommandCaptionGenerator : public CaptionGenerator {
public:
  explicit CommandCaptionGenerator(CommandOptions options);
  ~CommandCaptionGenerator() override;

  /**
   * @brief Check model files and the template, create the scratch directory.
   * @throws DeviceError if a referenced model file is missing or the
   *         template does not format
   */
  void load() override;

  Caption generate(const std::vector<Frame> &frames,
                   const GenerationRequest &request,
                   const GenerationHooks &hooks) override;

  void unload() override;

  /**
   * @brief Expand the template for one call.
   * @param images Frame file paths
   */
  std::string build_command(const std::vector<std::string> &images,
                            const GenerationRequest &request) const;

private:
  std::vector<std::string> write_frames(const std::vector<Frame> &frames);

  CommandOptions options_;
  std::filesystem::path scratch_dir_;
  bool loaded_ = false;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_COMMAND_GENERATOR_HPP
