/**
 * @file job.cpp
 * @brief Job construction and identifier generation
 */

#include "caption_suite/job.hpp"

#include <chrono>
#include <random>
#include <unordered_set>

#include <fmt/core.h>

#include "caption_suite/logging.hpp"

namespace caption_suite {

Job::Job(std::string id, const std::vector<MediaFile> &videos,
         GenerationSettings settings)
    : id_(std::move(id)), settings_(std::move(settings)) {
  /// Video names are the task key, keep the first occurrence only
  std::unordered_set<std::string> seen;
  videos_.reserve(videos.size());
  for (const auto &video : videos) {
    if (seen.insert(video.name).second) {
      videos_.push_back(video);
    } else {
      LOG_WARN("[Job {}] Duplicate video dropped: {}", id_, video.name);
    }
  }
  queue_.enqueue(videos_);
}

std::string Job::generate_id() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count();

  static thread_local std::mt19937 rng{std::random_device{}()};
  std::uniform_int_distribution<uint32_t> dist(0, 0xFFFF);
  return fmt::format("job_{}_{:04x}", ms, dist(rng));
}

} // namespace caption_suite
