/**
 * @file job.hpp
 * @brief One processing run over a list of videos
 *
 * @details A Job binds an immutable request (ordered unique videos and a
 *          settings snapshot) to the WorkQueue its workers pull from. Stage
 *          transitions are not stored here; they belong to the aggregator.
 */

#ifndef CAPTION_SUITE_JOB_HPP
#define CAPTION_SUITE_JOB_HPP

#include <string>
#include <vector>

#include "types.hpp"
#include "work_queue.hpp"

namespace caption_suite {

class Job {
public:
  /**
   * @brief Build a job and fill its work queue.
   * @param id Job identifier
   * @param videos Requested videos; duplicate names are dropped, first wins
   * @param settings Generation settings snapshot
   */
  Job(std::string id, const std::vector<MediaFile> &videos,
      GenerationSettings settings);

  Job(const Job &) = delete;
  Job &operator=(const Job &) = delete;

  const std::string &id() const { return id_; }
  const GenerationSettings &settings() const { return settings_; }
  const std::vector<MediaFile> &videos() const { return videos_; }
  int total() const { return static_cast<int>(videos_.size()); }

  WorkQueue &queue() { return queue_; }
  const WorkQueue &queue() const { return queue_; }

  /**
   * @brief Generate a unique job identifier.
   * @return "job_<unix-ms>_<random hex>"
   */
  static std::string generate_id();

private:
  std::string id_;
  std::vector<MediaFile> videos_;
  GenerationSettings settings_;
  WorkQueue queue_;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_JOB_HPP
