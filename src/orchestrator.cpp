/**
 * @file orchestrator.cpp
 * @brief Render orchestration implementation
 *
 * @details Drives one job through its stages:
 *
 *          1. Check keep segments and select the render state
 *
 *          2. Compile graphs (fail fast on a bad transition config, before
 *             any encode starts)
 *
 *          3. Base render: encode, probe, validate
 *
 *          4. Transitioned render, when the state calls for it
 *
 * @note When the job label is set, all log messages are prefixed with
 *       [Job <label>].
 */

#include "cut_render/orchestrator.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/color.h>
#include <fmt/core.h>

#include "cut_render/duration_estimator.hpp"
#include "cut_render/graph_compiler.hpp"
#include "cut_render/logging.hpp"
#include "cut_render/output_validator.hpp"
#include "cut_render/segment_extractor.hpp"

namespace cut_render {

// **---- Render State ----**

RenderState select_render_state(std::size_t segment_count,
                                bool transitions_enabled) {
  if (segment_count <= 1)
    return RenderState::kSingleSegment;
  return transitions_enabled ? RenderState::kMultiSegmentWithTransitions
                             : RenderState::kMultiSegmentHardCut;
}

const char *to_string(RenderState state) {
  switch (state) {
  case RenderState::kSingleSegment:
    return "SINGLE_SEGMENT";
  case RenderState::kMultiSegmentHardCut:
    return "MULTI_SEGMENT_HARD_CUT";
  case RenderState::kMultiSegmentWithTransitions:
    return "MULTI_SEGMENT_WITH_TRANSITIONS";
  }
  return "UNKNOWN";
}

// **---- Constructor ----**

Composer::Composer(CodecEngine &engine, MediaProber &prober,
                   std::string job_label)
    : engine_(engine), prober_(prober), job_label_(std::move(job_label)) {}

// **---- Logging Helpers ----**

std::string Composer::prefix() const {
  return job_label_.empty() ? "" : fmt::format("[Job {}] ", job_label_);
}

void Composer::log_info(const std::string &msg) {
  LOG_INFO("{}{}", prefix(), msg);
}

void Composer::log_phase(const std::string &msg) {
  LOG_PHASE("{}{}", prefix(), msg);
}

void Composer::log_error(const Error &error) {
  LOG_ERROR("{}[{}] {}", prefix(), to_string(category(error)),
            describe(error));
}

// **---- Main Processing ----**

Result<ComposeResult> Composer::compose(const std::string &source_path,
                                        const std::vector<KeepSegment> &segments,
                                        const RenderConfig &config,
                                        const std::string &output_dir,
                                        const CancellationToken &cancel) {
  TIMER_START(compose);

  // **----- PLAN -----**

  Status checked = check_keep_segments(segments);
  if (!checked) {
    log_error(checked.error());
    return checked.error();
  }

  ComposeResult result;
  result.segment_count = segments.size();
  result.source_keep_ms = total_keep_ms(segments);
  result.state = select_render_state(segments.size(), config.transitions_enabled);

  log_phase(fmt::format("Render state: {} ({} segments, {} kept)",
                        to_string(result.state), segments.size(),
                        format_time(ms_to_sec(result.source_keep_ms))));

  // **----- COMPILE -----**

  {
    TIMER_START(compile);
    TrimOptions trim;
    trim.last_segment_by_duration = config.last_segment_by_duration;

    Result<FilterGraph> base = compile_concat(segments, trim);
    if (!base) {
      log_error(base.error());
      return base.error();
    }
    result.base_graph = std::move(base.value());

    if (result.state == RenderState::kMultiSegmentWithTransitions) {
      Result<FilterGraph> xfade =
          compile_crossfade(segments, config.transition());
      if (!xfade) {
        log_error(xfade.error());
        return xfade.error();
      }
      result.transition_graph = std::move(xfade.value());
    }
    TIMER_END(compile);
  }

  std::error_code ec;
  std::filesystem::create_directories(output_dir, ec);
  if (ec) {
    CodecExecutionFailed failure;
    failure.output_path = output_dir;
    failure.stderr_text =
        fmt::format("cannot create output directory: {}", ec.message());
    log_error(failure);
    return failure;
  }
  const std::filesystem::path dir(output_dir);

  // **----- BASE RENDER -----**

  log_phase("Rendering hard-cut artifact...");
  Result<RenderArtifact> base = render_variant(
      source_path, segments, result.base_graph, RenderMode::kHardCut, config,
      (dir / BASE_OUTPUT_NAME).string(), cancel);
  if (!base) {
    log_error(base.error());
    return base.error();
  }
  result.base = std::move(base.value());

  // **----- TRANSITIONED RENDER -----**

  if (result.transition_graph) {
    log_phase(fmt::format("Rendering crossfade artifact ({}ms)...",
                          config.transition_duration_ms));
    Result<RenderArtifact> xfade = render_variant(
        source_path, segments, *result.transition_graph, RenderMode::kCrossfade,
        config, (dir / TRANSITION_OUTPUT_NAME).string(), cancel);
    if (!xfade) {
      log_error(xfade.error());
      return xfade.error();
    }

    TransitionInfo info;
    info.duration_ms = config.transition_duration_ms;
    info.audio_fade_ms = config.audio_fade_ms;
    xfade.value().transition = info;
    result.transitioned = std::move(xfade.value());
  }

  TIMER_END(compose);
  return result;
}

// **---- Single Render ----**

Result<RenderArtifact> Composer::render_variant(
    const std::string &source_path, const std::vector<KeepSegment> &segments,
    const FilterGraph &graph, RenderMode mode, const RenderConfig &config,
    const std::string &output_path, const CancellationToken &cancel) {

  if (cancel.is_cancelled()) {
    CodecExecutionFailed failure;
    failure.output_path = output_path;
    failure.stderr_text = "cancelled before encode";
    failure.cancelled = true;
    return failure;
  }

  // **----- ENCODE -----**

  {
    TIMER_START(encode);
    Status encoded =
        engine_.encode({source_path, output_path, graph}, config, cancel);
    TIMER_END(encode);
    if (!encoded)
      return encoded.error();
  }

  // **----- PROBE -----**

  TIMER_START(probe);
  Result<ProbeResult> probed = prober_.probe(output_path);
  TIMER_END(probe);
  if (!probed)
    return probed.error();

  const ProbeResult &info = probed.value();
  const StreamInfo *video = info.find("video");
  if (!video) {
    return ProbeFailed{output_path, "no video stream in output"};
  }

  RenderArtifact artifact;
  artifact.output_location = output_path;
  artifact.duration_sec = info.duration_sec;
  artifact.resolution = fmt::format("{}x{}", video->width.value_or(0),
                                    video->height.value_or(0));
  artifact.frame_rate =
      video->frame_rate.value_or(fmt::format("{}/1", config.frame_rate));
  artifact.codec = video->codec.value_or(config.video_codec);

  log_info(fmt::format("Probed {}: {:.3f}s, {}, {} @ {}", to_string(mode),
                       artifact.duration_sec, artifact.codec,
                       artifact.resolution, artifact.frame_rate));

  // **----- VALIDATE -----**

  TIMER_START(validate);
  const TimeMs transition_ms = config.transition_duration_ms;
  const double fps = parse_frame_rate(artifact.frame_rate, config.frame_rate);

  Status duration_ok =
      validate_duration(artifact.duration_sec,
                        expected_duration_ms(segments, mode, transition_ms),
                        mode, fps, segments.size());
  if (!duration_ok)
    return duration_ok.error();

  Result<DriftReport> drift = prober_.measure_drift(
      output_path, join_points_ms(segments, mode, transition_ms));
  if (!drift)
    return drift.error();

  Status sync_ok = validate_sync(drift.value(), mode);
  if (!sync_ok)
    return sync_ok.error();
  TIMER_END(validate);

  return artifact;
}

// **---- Render Summary ----**

void print_render_summary(const ComposeResult &result,
                          const std::string &job_label) {
  std::string prefix =
      job_label.empty() ? "" : fmt::format("[Job {}] ", job_label);

  auto row = [&](const RenderArtifact &a, const char *name) {
    fmt::print("{}{:<20} {:>15}\n", prefix, name, format_time(a.duration_sec));
    fmt::print("{}{:<20} {:>15}\n", prefix, "  Duration (s):",
               fmt::format("{:.3f}", a.duration_sec));
    fmt::print("{}{:<20} {:>15}\n", prefix, "  Video:",
               fmt::format("{} {}", a.codec, a.resolution));
    fmt::print("{}{:<20} {:>15}\n", prefix, "  Frame rate:", a.frame_rate);
  };

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "{}================== RENDER SUMMARY ==================\n",
             prefix);
  fmt::print("{}{:<20} {:>30}\n", prefix, "State:", to_string(result.state));
  fmt::print("{}{:<20} {:>15}\n", prefix, "Segments:", result.segment_count);
  fmt::print("{}{:<20} {:>15}\n", prefix,
             "Kept:", format_time(ms_to_sec(result.source_keep_ms)));
  row(result.base, "Hard cut:");
  if (result.transitioned) {
    row(*result.transitioned, "Crossfade:");
    fmt::print("{}{:<20} {:>13}ms\n", prefix, "  Transition:",
               result.transitioned->transition->duration_ms);
  }
  fmt::print(fg(fmt::color::cyan),
             "{}====================================================\n",
             prefix);
  std::fflush(stdout);
}

} // namespace cut_render
