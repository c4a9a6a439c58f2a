/**
 * @file payload.cpp
 * @brief JSON conversion of payloads and settings overrides
 */

#include "caption_suite/payload.hpp"

#include <fmt/core.h>

#include "caption_suite/config.hpp"
#include "caption_suite/errors.hpp"

namespace caption_suite {

namespace {

template <typename T> json optional_json(const std::optional<T> &value) {
  return value ? json(*value) : json(nullptr);
}

int require_int(const json &value, const char *key) {
  if (!value.is_number_integer())
    throw SettingsError(fmt::format("{} must be an integer", key));
  return value.get<int>();
}

double require_number(const json &value, const char *key) {
  if (!value.is_number())
    throw SettingsError(fmt::format("{} must be a number", key));
  return value.get<double>();
}

std::string require_string(const json &value, const char *key) {
  if (!value.is_string())
    throw SettingsError(fmt::format("{} must be a string", key));
  return value.get<std::string>();
}

bool require_bool(const json &value, const char *key) {
  if (!value.is_boolean())
    throw SettingsError(fmt::format("{} must be a boolean", key));
  return value.get<bool>();
}

} // anonymous namespace

// **---- JSON ADAPTERS ----**

void to_json(json &j, const WorkerState &worker) {
  j = json{{"worker_id", worker.worker_id},
           {"device", worker.device},
           {"current_video", optional_json(worker.current_video)},
           {"substage", to_string(worker.substage)},
           {"substage_progress", worker.substage_progress}};
}

void to_json(json &j, const ProgressSnapshot &snapshot) {
  j = json{{"stage", to_string(snapshot.stage)},
           {"job_id", snapshot.job_id.empty() ? json(nullptr)
                                              : json(snapshot.job_id)},
           {"total_videos", snapshot.total_videos},
           {"completed_videos", snapshot.completed_videos},
           {"failed_videos", snapshot.failed_videos},
           {"remaining_videos", snapshot.remaining_videos},
           {"overall_progress", snapshot.overall_progress},
           {"tokens_generated", snapshot.tokens_generated},
           {"tokens_per_sec", snapshot.tokens_per_sec},
           {"elapsed_seconds", snapshot.elapsed_seconds},
           {"batch_size", snapshot.batch_size},
           {"workers", snapshot.workers},
           {"error_message", optional_json(snapshot.error_message)}};
}

void to_json(json &j, const TaskResult &result) {
  j = json{{"video_name", result.video_name},
           {"status", to_string(result.status)},
           {"worker", optional_json(result.worker)},
           {"error", optional_json(result.error)},
           {"output_path", optional_json(result.output_path)},
           {"tokens_generated", result.tokens_generated},
           {"elapsed_seconds", result.elapsed_seconds}};
}

void to_json(json &j, const StartResponse &response) {
  j = json{{"accepted", response.accepted},
           {"total_videos", response.total_videos},
           {"job_id", optional_json(response.job_id)},
           {"message", response.message}};
}

void to_json(json &j, const StopResponse &response) {
  j = json{{"accepted", response.accepted},
           {"videos_completed", response.videos_completed},
           {"videos_failed", response.videos_failed},
           {"videos_remaining", response.videos_remaining}};
}

// **---- REQUEST PARSING ----**

StartRequest parse_start_request(const json &body) {
  StartRequest request;
  if (body.is_null())
    return request;
  if (!body.is_object())
    throw RequestError("Start request must be a JSON object");

  auto names = body.find("video_names");
  if (names != body.end() && !names->is_null()) {
    if (!names->is_array())
      throw RequestError("video_names must be an array of strings");
    std::vector<std::string> list;
    for (const auto &name : *names) {
      if (!name.is_string())
        throw RequestError("video_names must be an array of strings");
      list.push_back(name.get<std::string>());
    }
    request.video_names = std::move(list);
  }

  auto prompt = body.find("prompt");
  if (prompt != body.end() && !prompt->is_null()) {
    if (!prompt->is_string())
      throw RequestError("prompt must be a string");
    request.prompt = prompt->get<std::string>();
  }

  auto override_json = body.find("settings_override");
  if (override_json != body.end() && !override_json->is_null()) {
    if (!override_json->is_object())
      throw RequestError("settings_override must be an object");
    request.settings_override = *override_json;
  }

  return request;
}

void apply_settings_override(GenerationSettings &settings,
                             const json &override_json) {
  if (override_json.is_null())
    return;
  if (!override_json.is_object())
    throw SettingsError("settings_override must be an object");

  /// Work on a copy so a rejected override leaves settings untouched
  GenerationSettings next = settings;
  for (auto it = override_json.begin(); it != override_json.end(); ++it) {
    const std::string &key = it.key();
    const json &value = it.value();

    if (key == "model_id") {
      next.model_id = require_string(value, "model_id");
    } else if (key == "device") {
      next.device = require_string(value, "device");
    } else if (key == "max_frames") {
      next.max_frames = require_int(value, "max_frames");
    } else if (key == "frame_size") {
      next.frame_size = require_int(value, "frame_size");
    } else if (key == "max_tokens") {
      next.max_tokens = require_int(value, "max_tokens");
    } else if (key == "temperature") {
      next.temperature = require_number(value, "temperature");
    } else if (key == "batch_size") {
      next.batch_size = require_int(value, "batch_size");
    } else if (key == "include_metadata") {
      next.include_metadata = require_bool(value, "include_metadata");
    } else if (key == "prompt") {
      next.prompt = require_string(value, "prompt");
    } else {
      throw SettingsError(fmt::format("Unknown setting: {}", key));
    }
  }

  Config::validate_settings(next);
  settings = std::move(next);
}

} // namespace caption_suite
