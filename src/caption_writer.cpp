/**
 * @file caption_writer.cpp
 * @brief Caption file output
 */

#include "caption_suite/caption_writer.hpp"

#include <filesystem>
#include <fstream>

#include <fmt/format.h>

#include "caption_suite/errors.hpp"

namespace fs = std::filesystem;

namespace caption_suite {

FileCaptionWriter::FileCaptionWriter(std::string extension,
                                     std::string output_dir)
    : extension_(std::move(extension)), output_dir_(std::move(output_dir)) {}

std::string FileCaptionWriter::output_path_for(const MediaFile &video) const {
  fs::path out;
  if (output_dir_.empty()) {
    out = fs::path(video.path);
  } else {
    /// Mirror the relative layout under output_dir
    out = fs::path(output_dir_) / fs::path(video.name);
  }
  out.replace_extension(extension_);
  return out.string();
}

std::string FileCaptionWriter::persist(const MediaFile &video,
                                       const std::string &text,
                                       const CaptionMetadata &metadata,
                                       bool include_metadata) {
  const std::string path = output_path_for(video);

  std::error_code ec;
  fs::path parent = fs::path(path).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);
  if (ec) {
    throw PersistError(fmt::format("Cannot create {}: {}", parent.string(),
                                   ec.message()));
  }

  std::ofstream out(path, std::ios::trunc);
  if (!out)
    throw PersistError(fmt::format("Cannot open {} for writing", path));

  out << text;
  if (include_metadata) {
    const std::string rule(60, '=');
    out << "\n\n" << rule << "\nMETADATA\n" << rule << "\n";
    out << "Video: " << fs::path(video.path).filename().string() << "\n";
    out << "Worker: " << metadata.device << "\n";
    out << "Frames processed: " << metadata.frames << "\n";
    out << "Output tokens: " << metadata.tokens << "\n";
    out << fmt::format("Tokens/sec: {:.1f}\n", metadata.tokens_per_sec);
  }

  out.flush();
  if (!out)
    throw PersistError(fmt::format("Failed writing caption to {}", path));
  return path;
}

} // namespace caption_suite
