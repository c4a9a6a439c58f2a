/**
 * @file media_files.hpp
 * @brief Media discovery, request filtering and device placement
 *
 * @details Provides:
 *
 *          - Video discovery in a working directory (optionally recursive)
 *
 *          - Case-insensitive filtering by requested video names
 *
 *          - Device list selection for a job
 *
 *          - Time formatting utilities
 *
 * @note Video names are paths relative to the working directory with '/'
 *       separators, so the same name identifies a file on every platform.
 */

#ifndef CAPTION_SUITE_MEDIA_FILES_HPP
#define CAPTION_SUITE_MEDIA_FILES_HPP

#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace caption_suite {

// **---- Discovery ----**

/**
 * @brief Check a file name against the supported video extensions.
 * @note Comparison is case-insensitive (.MP4 matches).
 */
bool is_video_file(const std::string &filename);

/**
 * @brief Find every video in a directory.
 *
 * @param root Working directory
 * @param recursive Descend into subdirectories
 * @return Videos sorted by name; names differing only in case are kept once
 * @throws std::filesystem::filesystem_error if root cannot be listed
 */
std::vector<MediaFile> find_media_files(const std::string &root,
                                        bool recursive);

/**
 * @brief Keep the videos whose names appear in requested.
 *
 * @param available Discovery result
 * @param requested Requested names; absent means every video
 * @return Matches in discovery order
 * @note Matching is case-insensitive and treats '\\' as '/'.
 */
std::vector<MediaFile>
select_videos(const std::vector<MediaFile> &available,
              const std::optional<std::vector<std::string>> &requested);

// **---- Device Placement ----**

/**
 * @brief Devices for a job, one worker each.
 *
 * @param device Device family ("cuda" or "cpu")
 * @param batch_size Requested number of devices
 * @param videos Number of videos in the job
 * @param explicit_list Comma-separated devices; overrides device/batch_size
 * @return min(devices, videos) entries, at least one
 *
 * @note Without an explicit list cuda yields cuda:0..N-1 and cpu yields N
 *       entries of "cpu".
 */
std::vector<std::string> select_devices(const std::string &device,
                                        int batch_size, int videos,
                                        const std::string &explicit_list);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace caption_suite

#endif // CAPTION_SUITE_MEDIA_FILES_HPP
