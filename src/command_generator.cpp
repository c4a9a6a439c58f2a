/**
 * @file command_generator.cpp
 * @brief External VLM command execution and stdout token streaming
 */

#include "caption_suite/command_generator.hpp"

#include <atomic>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <fstream>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

#include <fmt/core.h>

#include "caption_suite/errors.hpp"
#include "caption_suite/logging.hpp"

namespace caption_suite {

namespace {

/// Poll timeout while the child is silent (stop checks)
constexpr int POLL_INTERVAL_MS = 100;

std::atomic<int> next_instance{0};

std::string trim(const std::string &s) {
  std::size_t begin = 0;
  while (begin < s.size() &&
         std::isspace(static_cast<unsigned char>(s[begin])))
    begin++;
  std::size_t end = s.size();
  while (end > begin && std::isspace(static_cast<unsigned char>(s[end - 1])))
    end--;
  return s.substr(begin, end - begin);
}

bool requested(const GenerationHooks &hooks) {
  return hooks.stop_requested && hooks.stop_requested();
}

} // anonymous namespace

std::string shell_quote(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 2);
  out += '\'';
  for (char c : value) {
    if (c == '\'') {
      out += "'\\''";
    } else {
      out += c;
    }
  }
  out += '\'';
  return out;
}

int device_index(const std::string &device) {
  auto colon = device.find(':');
  if (colon == std::string::npos)
    return 0;
  try {
    return std::stoi(device.substr(colon + 1));
  } catch (const std::exception &) {
    return 0;
  }
}

CommandCaptionGenerator::CommandCaptionGenerator(CommandOptions options)
    : options_(std::move(options)) {
  std::string tag = options_.device;
  for (auto &c : tag) {
    if (!std::isalnum(static_cast<unsigned char>(c)))
      c = '_';
  }
  scratch_dir_ = std::filesystem::temp_directory_path() /
                 fmt::format("caption_suite_{}_{}_{}", getpid(), tag,
                             next_instance.fetch_add(1));
}

CommandCaptionGenerator::~CommandCaptionGenerator() { unload(); }

void CommandCaptionGenerator::load() {
  const std::string &tmpl = options_.command_template;

  auto require_file = [&](const char *placeholder, const std::string &path,
                          const char *what) {
    if (tmpl.find(placeholder) == std::string::npos)
      return;
    if (path.empty()) {
      throw DeviceError(
          fmt::format("{} path not configured for {}", what, options_.device));
    }
    if (!std::filesystem::exists(path)) {
      throw DeviceError(fmt::format("{} not found: {}", what, path));
    }
  };
  require_file("{model}", options_.model_path, "Model");
  require_file("{mmproj}", options_.mmproj_path, "Projector");

  /// A template that does not format is a device error
  try {
    build_command({"frame.ppm"}, GenerationRequest{});
  } catch (const GenerationError &e) {
    throw DeviceError(e.what());
  }

  std::error_code ec;
  std::filesystem::create_directories(scratch_dir_, ec);
  if (ec) {
    throw DeviceError(fmt::format("Cannot create scratch directory {}: {}",
                                  scratch_dir_.string(), ec.message()));
  }

  loaded_ = true;
  LOG_INFO("[Generator {}] Ready ({})", options_.device, options_.model_id);
}

void CommandCaptionGenerator::unload() {
  if (!loaded_)
    return;
  std::error_code ec;
  std::filesystem::remove_all(scratch_dir_, ec);
  if (ec) {
    LOG_WARN("[Generator {}] Could not remove {}: {}", options_.device,
             scratch_dir_.string(), ec.message());
  }
  loaded_ = false;
}

std::string
CommandCaptionGenerator::build_command(const std::vector<std::string> &images,
                                       const GenerationRequest &request) const {
  const bool bare = options_.image_arg.empty() || options_.image_arg == "none";

  std::string image_list;
  for (const auto &image : images) {
    if (!image_list.empty())
      image_list += ' ';
    if (!bare) {
      image_list += options_.image_arg;
      image_list += ' ';
    }
    image_list += shell_quote(image);
  }

  try {
    return fmt::format(
        fmt::runtime(options_.command_template),
        fmt::arg("model", shell_quote(options_.model_path)),
        fmt::arg("mmproj", shell_quote(options_.mmproj_path)),
        fmt::arg("model_id", shell_quote(options_.model_id)),
        fmt::arg("images", image_list),
        fmt::arg("prompt", shell_quote(request.prompt)),
        fmt::arg("max_tokens", request.max_tokens),
        fmt::arg("temperature", request.temperature),
        fmt::arg("device", shell_quote(options_.device)),
        fmt::arg("device_index", device_index(options_.device)));
  } catch (const fmt::format_error &e) {
    throw GenerationError(
        fmt::format("Bad generator command template: {}", e.what()));
  }
}

std::vector<std::string>
CommandCaptionGenerator::write_frames(const std::vector<Frame> &frames) {
  std::vector<std::string> paths;
  paths.reserve(frames.size());

  for (std::size_t i = 0; i < frames.size(); ++i) {
    const Frame &f = frames[i];
    auto path = scratch_dir_ / fmt::format("frame_{:03}.ppm", i);

    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << "P6\n" << f.width << ' ' << f.height << "\n255\n";
    out.write(reinterpret_cast<const char *>(f.rgb.data()),
              static_cast<std::streamsize>(f.rgb.size()));
    if (!out) {
      throw GenerationError(
          fmt::format("Failed to write frame {}", path.string()));
    }
    paths.push_back(path.string());
  }
  return paths;
}

Caption CommandCaptionGenerator::generate(const std::vector<Frame> &frames,
                                          const GenerationRequest &request,
                                          const GenerationHooks &hooks) {
  if (!loaded_)
    throw DeviceError(fmt::format("Model not loaded on {}", options_.device));
  if (frames.empty())
    throw GenerationError("No frames to caption");

  const std::string cmd = build_command(write_frames(frames), request);

  /// Close-on-exec so children of other workers never hold our write end
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    throw GenerationError(fmt::format("pipe() failed: {}", std::strerror(errno)));
  }

  pid_t pid = fork();
  if (pid < 0) {
    int err = errno;
    close(fds[0]);
    close(fds[1]);
    throw GenerationError(fmt::format("fork() failed: {}", std::strerror(err)));
  }

  if (pid == 0) {
    /// Own process group so a stop reaches the whole pipeline
    setpgid(0, 0);
    dup2(fds[1], STDOUT_FILENO);
    close(fds[0]);
    close(fds[1]);
    execl("/bin/sh", "sh", "-c", cmd.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }
  setpgid(pid, pid);
  close(fds[1]);

  // **---- STREAM STDOUT ----**

  Caption caption;
  bool encoded = false;
  bool in_word = false;
  bool stopped = false;
  char buf[4096];

  while (true) {
    if (requested(hooks)) {
      stopped = true;
      break;
    }

    pollfd pfd{fds[0], POLLIN, 0};
    int ready = poll(&pfd, 1, POLL_INTERVAL_MS);
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (ready == 0)
      continue;

    ssize_t n = read(fds[0], buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR)
        continue;
      break;
    }
    if (n == 0)
      break;

    if (!encoded) {
      encoded = true;
      if (hooks.on_encoded)
        hooks.on_encoded();
    }

    caption.text.append(buf, static_cast<std::size_t>(n));
    const int64_t before = caption.tokens;
    for (ssize_t i = 0; i < n; ++i) {
      bool space = std::isspace(static_cast<unsigned char>(buf[i])) != 0;
      if (!space && !in_word)
        caption.tokens++;
      in_word = !space;
    }
    if (caption.tokens != before && hooks.on_token)
      hooks.on_token(caption.tokens);
  }
  close(fds[0]);

  if (stopped) {
    kill(-pid, SIGTERM);
    kill(pid, SIGTERM);
  }

  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR)
      break;
  }

  for (std::size_t i = 0; i < frames.size(); ++i) {
    std::error_code ec;
    std::filesystem::remove(scratch_dir_ / fmt::format("frame_{:03}.ppm", i),
                            ec);
  }

  if (stopped)
    throw StoppedError();

  if (!WIFEXITED(status) || WEXITSTATUS(status) != 0) {
    int code = WIFEXITED(status) ? WEXITSTATUS(status) : -1;
    throw GenerationError(
        fmt::format("Generator command failed with status {}", code));
  }

  caption.text = trim(caption.text);
  if (caption.text.empty())
    throw GenerationError("Generator produced no caption");

  return caption;
}

} // namespace caption_suite
