// Unit tests for encode argument construction and the ffmpeg-backed engine.
// The engine tests substitute /bin/sh scripts for the ffmpeg binary.

#include "cut_render/ffmpeg_executor.hpp"

#include <filesystem>
#include <fstream>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "cut_render/graph_compiler.hpp"

using namespace cut_render;

namespace {

EncodeJob sample_job(const std::string &output)
{
  EncodeJob job;
  job.source_path = "/media/in.mp4";
  job.output_path = output;
  job.graph = compile_concat({{0, 10000}, {15000, 25000}}).value();
  return job;
}

/// Write an executable shell script standing in for ffmpeg
std::string write_script(const std::string &name, const std::string &body)
{
  std::string path = ::testing::TempDir() + name;
  {
    std::ofstream out(path);
    out << "#!/bin/sh\n" << body << "\n";
  }
  std::filesystem::permissions(path, std::filesystem::perms::owner_all);
  return path;
}

} // namespace

TEST(FfmpegExecutorTest, EncodeArgsOrder)
{
  RenderConfig config;
  config.threads = 3;
  EncodeJob job = sample_job("/out/base_cuts.mp4");

  const std::vector<std::string> expected = {
      "-y", "-hide_banner", "-loglevel", "error",
      "-i", "/media/in.mp4",
      "-filter_complex", to_filter_complex(job.graph),
      "-map", "[vout]", "-map", "[aout]",
      "-r", "30",
      "-c:v", "libx264", "-preset", "fast", "-crf", "20",
      "-c:a", "aac", "-b:a", "192k",
      "-threads", "3",
      "/out/base_cuts.mp4"};
  EXPECT_EQ(build_encode_args(job, config), expected);
}

TEST(FfmpegExecutorTest, EncodeArgsFollowConfig)
{
  RenderConfig config;
  config.preset = "veryslow";
  config.crf = 18;
  config.frame_rate = 25;
  config.audio_bitrate = "128k";
  config.threads = 0;

  auto args = build_encode_args(sample_job("/out/x.mp4"), config);
  auto at = [&args](const std::string &flag) {
    for (std::size_t i = 0; i + 1 < args.size(); ++i) {
      if (args[i] == flag)
        return args[i + 1];
    }
    return std::string();
  };
  EXPECT_EQ(at("-preset"), "veryslow");
  EXPECT_EQ(at("-crf"), "18");
  EXPECT_EQ(at("-r"), "25");
  EXPECT_EQ(at("-b:a"), "128k");
  EXPECT_EQ(at("-threads"), std::to_string(detect_cpu_limit()));
}

TEST(FfmpegExecutorTest, SuccessfulEncode)
{
  RenderConfig config;
  config.ffmpeg_path = write_script("fake_ffmpeg_ok.sh", "exit 0");

  FfmpegEngine engine;
  CancellationToken cancel;
  EXPECT_TRUE(engine.encode(sample_job(::testing::TempDir() + "ok.mp4"), config,
                            cancel)
                  .ok());
}

TEST(FfmpegExecutorTest, FailureCarriesStderrAndRemovesPartialOutput)
{
  RenderConfig config;
  config.ffmpeg_path = write_script(
      "fake_ffmpeg_fail.sh", "echo 'Error initializing filter' >&2\nexit 1");

  std::string output = ::testing::TempDir() + "partial.mp4";
  {
    std::ofstream partial(output);
    partial << "half-written";
  }

  FfmpegEngine engine("[Job t] ");
  CancellationToken cancel;
  Status s = engine.encode(sample_job(output), config, cancel);

  ASSERT_FALSE(s.ok());
  const auto &f = std::get<CodecExecutionFailed>(s.error());
  EXPECT_EQ(f.exit_code, 1);
  EXPECT_EQ(f.output_path, output);
  EXPECT_NE(f.stderr_text.find("Error initializing filter"), std::string::npos);
  EXPECT_FALSE(f.cancelled);
  EXPECT_FALSE(std::filesystem::exists(output));
}

TEST(FfmpegExecutorTest, CancelledEncode)
{
  RenderConfig config;
  config.ffmpeg_path = write_script("fake_ffmpeg_slow.sh", "exec sleep 30");

  FfmpegEngine engine;
  CancellationToken cancel;
  cancel.cancel();
  Status s =
      engine.encode(sample_job(::testing::TempDir() + "c.mp4"), config, cancel);

  ASSERT_FALSE(s.ok());
  EXPECT_TRUE(std::get<CodecExecutionFailed>(s.error()).cancelled);
}

TEST(FfmpegExecutorTest, MissingBinary)
{
  RenderConfig config;
  config.ffmpeg_path = "/nonexistent/ffmpeg";

  FfmpegEngine engine;
  CancellationToken cancel;
  Status s =
      engine.encode(sample_job(::testing::TempDir() + "m.mp4"), config, cancel);
  ASSERT_FALSE(s.ok());
  EXPECT_EQ(std::get<CodecExecutionFailed>(s.error()).exit_code, 127);
}
