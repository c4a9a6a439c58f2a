/**
 * @file media_files.cpp
 * @brief Media discovery and device placement implementation
 */

#include "caption_suite/media_files.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <unordered_set>

#include <fmt/core.h>

namespace caption_suite {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

const char *const VIDEO_EXTENSIONS[] = {".mp4",  ".mkv", ".avi", ".mov",
                                        ".webm", ".m4v", ".ts",  ".flv",
                                        ".wmv",  ".mpeg", ".mpg"};

std::string to_lower(std::string s) {
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}

/// Lower-case key with '/' separators
std::string name_key(const std::string &name) {
  std::string key = to_lower(name);
  std::replace(key.begin(), key.end(), '\\', '/');
  return key;
}

std::string trim(const std::string &s) {
  auto begin = s.find_first_not_of(" \t");
  if (begin == std::string::npos)
    return "";
  auto end = s.find_last_not_of(" \t");
  return s.substr(begin, end - begin + 1);
}

void add_if_video(const fs::directory_entry &entry, const fs::path &root,
                  std::vector<MediaFile> &out) {
  if (!entry.is_regular_file())
    return;
  if (!is_video_file(entry.path().filename().string()))
    return;

  MediaFile file;
  file.name = entry.path().lexically_relative(root).generic_string();
  file.path = fs::absolute(entry.path()).string();
  out.push_back(std::move(file));
}

} // anonymous namespace

// **---- Discovery ----**

bool is_video_file(const std::string &filename) {
  std::string ext = to_lower(fs::path(filename).extension().string());
  for (const char *known : VIDEO_EXTENSIONS) {
    if (ext == known)
      return true;
  }
  return false;
}

std::vector<MediaFile> find_media_files(const std::string &root,
                                        bool recursive) {
  std::vector<MediaFile> found;
  fs::path base(root);

  if (recursive) {
    for (const auto &entry : fs::recursive_directory_iterator(
             base, fs::directory_options::skip_permission_denied)) {
      add_if_video(entry, base, found);
    }
  } else {
    for (const auto &entry : fs::directory_iterator(base)) {
      add_if_video(entry, base, found);
    }
  }

  std::sort(found.begin(), found.end(),
            [](const MediaFile &a, const MediaFile &b) {
              return to_lower(a.name) < to_lower(b.name);
            });

  /// Case-insensitive filesystems can report one file twice
  std::unordered_set<std::string> seen;
  std::vector<MediaFile> unique;
  unique.reserve(found.size());
  for (auto &file : found) {
    if (seen.insert(name_key(file.name)).second)
      unique.push_back(std::move(file));
  }
  return unique;
}

std::vector<MediaFile>
select_videos(const std::vector<MediaFile> &available,
              const std::optional<std::vector<std::string>> &requested) {
  if (!requested || requested->empty())
    return available;

  std::unordered_set<std::string> wanted;
  for (const auto &name : *requested)
    wanted.insert(name_key(name));

  std::vector<MediaFile> selected;
  for (const auto &file : available) {
    if (wanted.count(name_key(file.name)))
      selected.push_back(file);
  }
  return selected;
}

// **---- Device Placement ----**

std::vector<std::string> select_devices(const std::string &device,
                                        int batch_size, int videos,
                                        const std::string &explicit_list) {
  std::vector<std::string> devices;
  const int limit = std::max(1, videos);

  if (!explicit_list.empty()) {
    std::size_t pos = 0;
    while (pos <= explicit_list.size() &&
           static_cast<int>(devices.size()) < limit) {
      auto comma = explicit_list.find(',', pos);
      if (comma == std::string::npos)
        comma = explicit_list.size();
      std::string entry = trim(explicit_list.substr(pos, comma - pos));
      if (!entry.empty())
        devices.push_back(entry);
      pos = comma + 1;
    }
    if (!devices.empty())
      return devices;
  }

  const int count = std::max(1, std::min(batch_size, limit));
  for (int i = 0; i < count; ++i) {
    devices.push_back(device == "cuda" ? fmt::format("cuda:{}", i) : device);
  }
  return devices;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace caption_suite
