/**
 * @file caption_writer.hpp
 * @brief Caption persistence
 *
 * @details One text file per finished video, named <stem><extension>, either
 *          beside the video or mirrored under an output directory. With
 *          include_metadata the caption is followed by a trailer:
 *
 *          ============================================================
 *          METADATA
 *          ============================================================
 *          Video: clip.mp4
 *          Worker: cuda:0
 *          Frames processed: 16
 *          Output tokens: 212
 *          Tokens/sec: 41.3
 */

#ifndef CAPTION_SUITE_CAPTION_WRITER_HPP
#define CAPTION_SUITE_CAPTION_WRITER_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace caption_suite {

/**
 * @struct CaptionMetadata
 * @brief Trailer values for one caption.
 */
struct CaptionMetadata {
  std::string device;
  int frames = 0;
  int64_t tokens = 0;
  double tokens_per_sec = 0;
};

class CaptionWriter {
public:
  virtual ~CaptionWriter() = default;

  /**
   * @brief Write the caption of one video.
   * @return Path of the written file
   * @throws PersistError if the file cannot be written
   */
  virtual std::string persist(const MediaFile &video, const std::string &text,
                              const CaptionMetadata &metadata,
                              bool include_metadata) = 0;
};

class FileCaptionWriter : public CaptionWriter {
public:
  /**
   * @param extension Caption extension including the dot
   * @param output_dir Target directory; empty writes beside each video
   */
  FileCaptionWriter(std::string extension, std::string output_dir);

  std::string persist(const MediaFile &video, const std::string &text,
                      const CaptionMetadata &metadata,
                      bool include_metadata) override;

  std::string output_path_for(const MediaFile &video) const;

private:
  std::string extension_;
  std::string output_dir_;
};

} // namespace caption_suite

#endif // CAPTION_SUITE_CAPTION_WRITER_HPP
