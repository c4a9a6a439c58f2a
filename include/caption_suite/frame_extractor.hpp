/**
 * @file frame_extractor.hpp
 * @brief Frame extraction interface
 *
 * @details A FrameExtractor turns one media path into an ordered list of
 *          RGB24 frames sampled uniformly over the video stream. The libav
 *          implementation lives in ffmpeg_frame_extractor.hpp so that the
 *          core library does not depend on FFmpeg headers.
 */

#ifndef CAPTION_SUITE_FRAME_EXTRACTOR_HPP
#define CAPTION_SUITE_FRAME_EXTRACTOR_HPP

#include <functional>
#include <string>
#include <vector>

#include "types.hpp"

namespace caption_suite {

/**
 * @struct ExtractionLimits
 * @brief Per-job sampling parameters.
 */
struct ExtractionLimits {
  int max_frames = 16; //< Upper bound on sampled frames
  int frame_size = 336; //< Longest side after resizing
};

class FrameExtractor {
public:
  /**
   * @brief Called after each decoded frame with the sampled count so far.
   * @return false to abandon extraction (throws StoppedError)
   */
  using FrameCallback = std::function<bool(int extracted, int target)>;

  virtual ~FrameExtractor() = default;

  /**
   * @brief Decode and sample frames from a video.
   *
   * @param path Media path
   * @param limits Sampling limits
   * @param metadata Output: stream properties
   * @param on_frame Progress and cancellation hook
   * @return Sampled frames in presentation order
   * @throws DecodeError if the media cannot be opened or decoded
   * @throws StoppedError if on_frame returned false
   */
  virtual std::vector<Frame> extract(const std::string &path,
                                     const ExtractionLimits &limits,
                                     VideoMetadata &metadata,
                                     const FrameCallback &on_frame) = 0;
};

/**
 * @brief Output size for a frame, aspect preserved.
 * @note A long side above frame_size is scaled down to it; otherwise a short
 *       side below MIN_FRAME_SIDE is scaled up to it. Anything else is kept.
 */
void fit_frame_size(int width, int height, int frame_size, int &out_width,
                    int &out_height);

/**
 * @brief Indices of k frames spread evenly from the first to the last frame.
 * @note Returns every index when frame_count <= k.
 */
std::vector<int64_t> sample_indices(int64_t frame_count, int k);

} // namespace caption_suite

#endif // CAPTION_SUITE_FRAME_EXTRACTOR_HPP
