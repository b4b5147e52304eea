/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "cut_render/ffmpeg_executor.hpp"

#include <chrono>
#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "cut_render/graph_compiler.hpp"
#include "cut_render/logging.hpp"

namespace cut_render {

namespace {

/// Delete a partial output; a missing file is fine
void remove_partial(const std::string &path, const std::string &prefix) {
  std::error_code ec;
  if (std::filesystem::remove(path, ec)) {
    LOG_WARN("{}Removed partial output {}", prefix, path);
  } else if (ec) {
    LOG_WARN("{}Could not remove partial output {}: {}", prefix, path,
             ec.message());
  }
}

/// Last non-empty line of the captured stderr, for the log line
std::string last_line(const std::string &text) {
  auto end = text.find_last_not_of("\r\n");
  if (end == std::string::npos)
    return "";
  auto begin = text.rfind('\n', end);
  begin = (begin == std::string::npos) ? 0 : begin + 1;
  return text.substr(begin, end - begin + 1);
}

} // anonymous namespace

std::vector<std::string> build_encode_args(const EncodeJob &job,
                                           const RenderConfig &config) {
  return {"-y",
          "-hide_banner",
          "-loglevel",
          "error",
          "-i",
          job.source_path,
          "-filter_complex",
          to_filter_complex(job.graph),
          "-map",
          job.graph.video_out,
          "-map",
          job.graph.audio_out,
          "-r",
          std::to_string(config.frame_rate),
          "-c:v",
          config.video_codec,
          "-preset",
          config.preset,
          "-crf",
          std::to_string(config.crf),
          "-c:a",
          config.audio_codec,
          "-b:a",
          config.audio_bitrate,
          "-threads",
          std::to_string(resolve_thread_count(config.threads)),
          job.output_path};
}

FfmpegEngine::FfmpegEngine(std::string log_prefix)
    : prefix_(std::move(log_prefix)) {}

Status FfmpegEngine::encode(const EncodeJob &job, const RenderConfig &config,
                            const CancellationToken &cancel) {
  std::vector<std::string> argv;
  argv.reserve(32);
  argv.push_back(config.ffmpeg_path);
  for (auto &arg : build_encode_args(job, config)) {
    argv.push_back(std::move(arg));
  }

  LOG_INFO("{}Encoding {} ({} filter nodes)", prefix_,
           std::filesystem::path(job.output_path).filename().string(),
           job.graph.nodes.size());

  ProcessResult proc = run_process(
      argv, cancel, std::chrono::seconds(config.encode_timeout_sec));

  if (proc.started && proc.exit_code == 0 && !proc.cancelled) {
    return Status::Ok();
  }

  if (proc.timed_out) {
    LOG_ERROR("{}FFmpeg timed out after {}s", prefix_,
              config.encode_timeout_sec);
  } else if (proc.cancelled) {
    LOG_WARN("{}FFmpeg cancelled", prefix_);
  } else {
    LOG_ERROR("{}FFmpeg failed with status {}: {}", prefix_, proc.exit_code,
              last_line(proc.stderr_text));
  }

  remove_partial(job.output_path, prefix_);

  CodecExecutionFailed failure;
  failure.output_path = job.output_path;
  failure.exit_code = proc.exit_code;
  failure.stderr_text = std::move(proc.stderr_text);
  failure.cancelled = proc.cancelled;
  failure.timed_out = proc.timed_out;
  return failure;
}

} // namespace cut_render
