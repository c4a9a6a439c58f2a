/**
 * @file ffmpeg_frame_extractor.hpp
 * @brief libav based frame extraction
 *
 * @details Decodes the best video stream of a file with libavformat and
 *          libavcodec, keeps the frames picked by sample_indices() and
 *          converts them to RGB24 at the fitted size with libswscale.
 *
 * @attention THREAD MODEL:
 *            - Each worker owns its own extractor instance.
 *
 *            - FFmpeg decoder state is not thread-safe; nothing is shared
 *              between extract() calls.
 */

#ifndef CAPTION_SUITE_FFMPEG_FRAME_EXTRACTOR_HPP
#define CAPTION_SUITE_FFMPEG_FRAME_EXTRACTOR_HPP

#include "frame_extractor.hpp"

namespace caption_suite {

class FFmpegFrameExtractor : public FrameExtractor {
public:
  std::vector<Frame> extract(const std::string &path,
                             const ExtractionLimits &limits,
                             VideoMetadata &metadata,
                             const FrameCallback &on_frame) override;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_FFMPEG_FRAME_EXTRACTOR_HPP
