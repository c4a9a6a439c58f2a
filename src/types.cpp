/**
 * @file types.cpp
 * @brief Wire names for lifecycle enums
 */

#include "caption_suite/types.hpp"

namespace caption_suite {

const char *to_string(JobStage stage) {
  switch (stage) {
  case JobStage::Idle:
    return "idle";
  case JobStage::LoadingModel:
    return "loading_model";
  case JobStage::Processing:
    return "processing";
  case JobStage::Complete:
    return "complete";
  case JobStage::Error:
    return "error";
  case JobStage::Stopped:
    return "stopped";
  }
  return "idle";
}

const char *to_string(TaskStatus status) {
  switch (status) {
  case TaskStatus::Queued:
    return "queued";
  case TaskStatus::Assigned:
    return "assigned";
  case TaskStatus::Extracting:
    return "extracting";
  case TaskStatus::Encoding:
    return "encoding";
  case TaskStatus::Generating:
    return "generating";
  case TaskStatus::Done:
    return "done";
  case TaskStatus::Failed:
    return "failed";
  }
  return "queued";
}

const char *to_string(Substage substage) {
  switch (substage) {
  case Substage::Idle:
    return "idle";
  case Substage::ExtractingFrames:
    return "extracting_frames";
  case Substage::Encoding:
    return "encoding";
  case Substage::Generating:
    return "generating";
  }
  return "idle";
}

} // namespace caption_suite
