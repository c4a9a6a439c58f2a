/**
 * @file payload.hpp
 * @brief Request / response payloads and their JSON form
 *
 * @details The manager API speaks these structs; transports (the CLI's
 *          JSON-lines writer, a future HTTP layer) convert them with the
 *          nlohmann::json adapters declared here. Enum values are written
 *          with their wire names ("loading_model", "extracting_frames").
 */

#ifndef CAPTION_SUITE_PAYLOAD_HPP
#define CAPTION_SUITE_PAYLOAD_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace caption_suite {

using json = nlohmann::json;

/**
 * @struct StartRequest
 * @brief Parameters of a start call.
 */
struct StartRequest {
  std::optional<std::vector<std::string>> video_names; //< Absent = all videos
  std::optional<std::string> prompt;                   //< Wins over override
  json settings_override;                              //< Object or null
};

struct StartResponse {
  bool accepted = false;
  int total_videos = 0;
  std::optional<std::string> job_id;
  std::string message;
};

struct StopResponse {
  bool accepted = false;
  int videos_completed = 0;
  int videos_failed = 0;
  int videos_remaining = 0;
};

// **---- JSON ADAPTERS ----**

void to_json(json &j, const WorkerState &worker);
void to_json(json &j, const ProgressSnapshot &snapshot);
void to_json(json &j, const TaskResult &result);
void to_json(json &j, const StartResponse &response);
void to_json(json &j, const StopResponse &response);

/**
 * @brief Parse a start request body.
 * @note A null body is an empty request (every video, default settings).
 * @throws RequestError if a field has the wrong type
 */
StartRequest parse_start_request(const json &body);

/**
 * @brief Overlay the fields present in override onto settings.
 * @throws SettingsError on an unknown key, a wrong type or a value out of
 *         range; settings is left unchanged in that case
 */
void apply_settings_override(GenerationSettings &settings,
                             const json &override_json);

} // namespace caption_suite

#endif // CAPTION_SUITE_PAYLOAD_HPP
