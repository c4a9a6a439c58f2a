/**
 * @file frame_extractor.cpp
 * @brief Sampling and resize arithmetic shared by frame extractors
 */

#include "caption_suite/frame_extractor.hpp"

#include <algorithm>

namespace caption_suite {

void fit_frame_size(int width, int height, int frame_size, int &out_width,
                    int &out_height) {
  out_width = width;
  out_height = height;
  if (width <= 0 || height <= 0)
    return;

  const int max_dim = std::max(width, height);
  const int min_dim = std::min(width, height);

  double scale;
  if (max_dim > frame_size) {
    scale = static_cast<double>(frame_size) / max_dim;
  } else if (min_dim < MIN_FRAME_SIDE) {
    scale = static_cast<double>(MIN_FRAME_SIDE) / min_dim;
  } else {
    return;
  }

  out_width = std::max(1, static_cast<int>(width * scale));
  out_height = std::max(1, static_cast<int>(height * scale));
}

std::vector<int64_t> sample_indices(int64_t frame_count, int k) {
  std::vector<int64_t> indices;
  if (frame_count <= 0 || k <= 0)
    return indices;

  if (frame_count <= k) {
    indices.reserve(frame_count);
    for (int64_t i = 0; i < frame_count; ++i)
      indices.push_back(i);
    return indices;
  }

  indices.reserve(k);
  if (k == 1) {
    indices.push_back(0);
    return indices;
  }

  /// Evenly spaced over [0, frame_count - 1], truncated toward zero
  const double step = static_cast<double>(frame_count - 1) / (k - 1);
  for (int i = 0; i < k; ++i)
    indices.push_back(static_cast<int64_t>(i * step));
  return indices;
}

} // namespace caption_suite
