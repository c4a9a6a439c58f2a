#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <vector>

#include "caption_suite/command_generator.hpp"
#include "caption_suite/errors.hpp"
#include "fakes.hpp"

using namespace caption_suite;
using namespace caption_suite::test_support;

namespace {

CommandOptions options_for(const std::string &tmpl) {
  CommandOptions options;
  options.command_template = tmpl;
  options.image_arg = "--image";
  options.model_id = "test/vlm";
  options.device = "cpu";
  return options;
}

std::vector<Frame> one_frame() {
  Frame frame;
  frame.width = 2;
  frame.height = 2;
  frame.rgb.assign(12, 128);
  return {frame};
}

GenerationRequest request_for(const std::string &prompt) {
  GenerationRequest request;
  request.prompt = prompt;
  request.max_tokens = 64;
  request.temperature = 0.2;
  return request;
}

} // namespace

TEST(ShellQuoteTest, WrapsAndEscapesSingleQuotes) {
  EXPECT_EQ(shell_quote("plain"), "'plain'");
  EXPECT_EQ(shell_quote("it's"), "'it'\\''s'");
  EXPECT_EQ(shell_quote(""), "''");
  EXPECT_EQ(shell_quote("$HOME; rm -rf /"), "'$HOME; rm -rf /'");
}

TEST(DeviceIndexTest, ParsesOrdinal) {
  EXPECT_EQ(device_index("cuda:2"), 2);
  EXPECT_EQ(device_index("cuda:0"), 0);
  EXPECT_EQ(device_index("cpu"), 0);
  EXPECT_EQ(device_index("cuda:x"), 0);
}

TEST(CommandGeneratorTest, BuildsCommandFromTemplate) {
  CommandOptions options = options_for(
      "vlm {images} -p {prompt} -n {max_tokens} --gpu {device_index}");
  options.device = "cuda:3";
  CommandCaptionGenerator generator(options);

  EXPECT_EQ(generator.build_command({"/t/a.ppm", "/t/b.ppm"},
                                    request_for("what's here")),
            "vlm --image '/t/a.ppm' --image '/t/b.ppm' -p 'what'\\''s here' "
            "-n 64 --gpu 3");
}

TEST(CommandGeneratorTest, BareImageList) {
  CommandOptions options = options_for("vlm {images} {model_id} {device}");
  options.image_arg = "none";
  CommandCaptionGenerator generator(options);

  EXPECT_EQ(generator.build_command({"/t/a.ppm", "/t/b.ppm"}, request_for("p")),
            "vlm '/t/a.ppm' '/t/b.ppm' 'test/vlm' 'cpu'");
}

TEST(CommandGeneratorTest, UnknownPlaceholderFailsLoad) {
  CommandCaptionGenerator generator(options_for("vlm {weights}"));
  EXPECT_THROW(generator.load(), DeviceError);
}

TEST(CommandGeneratorTest, MissingModelFileFailsLoad) {
  TempDir dir;
  CommandOptions options = options_for("vlm -m {model} {images}");
  options.model_path = (dir.path() / "missing.gguf").string();
  CommandCaptionGenerator missing(options);
  EXPECT_THROW(missing.load(), DeviceError);

  options.model_path.clear();
  CommandCaptionGenerator unset(options);
  EXPECT_THROW(unset.load(), DeviceError);

  options.model_path = dir.touch("model.gguf").string();
  CommandCaptionGenerator present(options);
  EXPECT_NO_THROW(present.load());
  present.unload();
}

TEST(CommandGeneratorTest, GenerateBeforeLoadIsDeviceError) {
  CommandCaptionGenerator generator(options_for("printf hi"));
  EXPECT_THROW(generator.generate(one_frame(), request_for("p"), {}),
               DeviceError);
}

TEST(CommandGeneratorTest, StreamsStdoutAndCountsWords) {
  CommandCaptionGenerator generator(
      options_for("printf '  A red car\\nparks outside.  '"));
  generator.load();

  bool encoded = false;
  int64_t last_tokens = 0;
  GenerationHooks hooks;
  hooks.on_encoded = [&]() { encoded = true; };
  hooks.on_token = [&](int64_t tokens) { last_tokens = tokens; };
  hooks.stop_requested = []() { return false; };

  Caption caption = generator.generate(one_frame(), request_for("p"), hooks);
  EXPECT_EQ(caption.text, "A red car\nparks outside.");
  EXPECT_EQ(caption.tokens, 5);
  EXPECT_TRUE(encoded);
  EXPECT_EQ(last_tokens, 5);
  generator.unload();
}

TEST(CommandGeneratorTest, FramesAreWrittenAsPpm) {
  CommandOptions options = options_for("head -c 2 {images}");
  options.image_arg = "none";
  CommandCaptionGenerator generator(options);
  generator.load();

  Caption caption = generator.generate(one_frame(), request_for("p"), {});
  EXPECT_EQ(caption.text, "P6");
  generator.unload();
}

TEST(CommandGeneratorTest, NonZeroExitIsGenerationError) {
  CommandCaptionGenerator generator(options_for("printf partial; exit 3"));
  generator.load();
  EXPECT_THROW(generator.generate(one_frame(), request_for("p"), {}),
               GenerationError);
}

TEST(CommandGeneratorTest, EmptyOutputIsGenerationError) {
  CommandCaptionGenerator generator(options_for("printf '   '"));
  generator.load();
  EXPECT_THROW(generator.generate(one_frame(), request_for("p"), {}),
               GenerationError);
}

TEST(CommandGeneratorTest, NoFramesIsGenerationError) {
  CommandCaptionGenerator generator(options_for("printf hi"));
  generator.load();
  EXPECT_THROW(generator.generate({}, request_for("p"), {}), GenerationError);
}

TEST(CommandGeneratorTest, StopTerminatesTheCommand) {
  CommandCaptionGenerator generator(options_for("sleep 10; printf late"));
  generator.load();

  std::atomic<int> polls{0};
  GenerationHooks hooks;
  hooks.stop_requested = [&]() { return polls.fetch_add(1) >= 2; };

  auto start = std::chrono::steady_clock::now();
  EXPECT_THROW(generator.generate(one_frame(), request_for("p"), hooks),
               StoppedError);
  EXPECT_LT(std::chrono::steady_clock::now() - start, std::chrono::seconds(5));
}
