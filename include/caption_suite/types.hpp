/**
 * @file types.hpp
 * @brief Core data types and constants for Caption Suite
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Job, task and worker lifecycle enums
 *
 *          - Decoded frames and video metadata
 *
 *          - Generation settings snapshot
 *
 *          - Worker event payloads and progress snapshots
 */

#ifndef CAPTION_SUITE_TYPES_HPP
#define CAPTION_SUITE_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace caption_suite {

// **----- CONSTANTS -----**

/// Smallest short side a frame is scaled up to before captioning
constexpr int MIN_FRAME_SIDE = 224;

/// Identifier of a worker inside a job (index into the device list)
using WorkerId = int;

// **----- LIFECYCLE ENUMS -----**

/**
 * @enum JobStage
 * @brief Stage of the current processing run.
 * @note Complete, Error and Stopped are terminal.
 */
enum class JobStage : uint8_t {
  Idle,
  LoadingModel,
  Processing,
  Complete,
  Error,
  Stopped
};

/**
 * @enum TaskStatus
 * @brief Status of one video inside a job.
 */
enum class TaskStatus : uint8_t {
  Queued,
  Assigned,
  Extracting,
  Encoding,
  Generating,
  Done,
  Failed
};

/**
 * @enum Substage
 * @brief Pipeline phase a worker is currently executing.
 */
enum class Substage : uint8_t { Idle, ExtractingFrames, Encoding, Generating };

const char *to_string(JobStage stage);
const char *to_string(TaskStatus status);
const char *to_string(Substage substage);

inline bool is_terminal(JobStage stage) {
  return stage == JobStage::Complete || stage == JobStage::Error ||
         stage == JobStage::Stopped;
}

inline bool is_active(JobStage stage) {
  return stage == JobStage::LoadingModel || stage == JobStage::Processing;
}

// **----- MEDIA -----**

/**
 * @struct MediaFile
 * @brief A discovered video: display name plus absolute path.
 * @note name is relative to the working directory with '/' separators.
 */
struct MediaFile {
  std::string name;
  std::string path;
};

/**
 * @struct Frame
 * @brief One decoded frame, packed RGB24.
 */
struct Frame {
  int width = 0;             //< Width in pixels
  int height = 0;            //< Height in pixels
  double timestamp = 0;      //< Presentation time in seconds
  std::vector<uint8_t> rgb;  //< width * height * 3 bytes
};

/**
 * @struct VideoMetadata
 * @brief Stream properties reported by frame extraction.
 */
struct VideoMetadata {
  int width = 0;
  int height = 0;
  double fps = 0;
  int64_t frame_count = 0;
  double duration = 0;       //< Seconds, 0 if unknown
  int frames_extracted = 0;
};

// **----- SETTINGS -----**

/**
 * @struct GenerationSettings
 * @brief Immutable snapshot of generation parameters for one job.
 */
struct GenerationSettings {
  std::string model_id;
  std::string device;        //< "cuda" or "cpu"
  int max_frames = 16;
  int frame_size = 336;
  int max_tokens = 512;
  double temperature = 0.3;
  int batch_size = 1;        //< Number of devices / workers
  bool include_metadata = false;
  std::string prompt;
};

// **----- PROGRESS -----**

/**
 * @struct WorkerState
 * @brief Per-worker view published in every snapshot.
 */
struct WorkerState {
  WorkerId worker_id = 0;
  std::string device;
  std::optional<std::string> current_video;
  Substage substage = Substage::Idle;
  double substage_progress = 0;  //< Fraction in [0, 1]
  bool active = false;           //< Loop still running
};

/**
 * @struct ProgressSnapshot
 * @brief Point-in-time view of the job, recomputed on every event.
 */
struct ProgressSnapshot {
  JobStage stage = JobStage::Idle;
  std::string job_id;
  int total_videos = 0;
  int completed_videos = 0;
  int failed_videos = 0;
  int remaining_videos = 0;
  double overall_progress = 0;
  int64_t tokens_generated = 0;
  double tokens_per_sec = 0;
  double elapsed_seconds = 0;
  int batch_size = 0;
  std::vector<WorkerState> workers;
  std::optional<std::string> error_message;
};

/**
 * @struct TaskResult
 * @brief Final record of one task, used for the job summary.
 */
struct TaskResult {
  std::string video_name;
  TaskStatus status = TaskStatus::Queued;
  std::optional<WorkerId> worker;
  std::optional<std::string> error;
  std::optional<std::string> output_path;
  int64_t tokens_generated = 0;
  double elapsed_seconds = 0;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_TYPES_HPP
