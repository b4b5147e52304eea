/**
 * @file main.cpp
 * @brief Entry point for Cut Render application
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Cut plan loading and keep segment extraction
 *
 *          - One compose() call with the environment-derived RenderConfig
 *
 *          - Appending render, pipeline and error records to
 *            <output_dir>/renders.jsonl
 *
 * @note Exit codes: 0 success, 1 configuration error, 2 execution error,
 *       3 quality gate failure. SIGINT/SIGTERM cancel the running encode.
 */

#include <csignal>
#include <cstdio>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/core.h>

#include "cut_render/artifact_history.hpp"
#include "cut_render/config.hpp"
#include "cut_render/cut_plan.hpp"
#include "cut_render/ffmpeg_executor.hpp"
#include "cut_render/logging.hpp"
#include "cut_render/media_probe.hpp"
#include "cut_render/orchestrator.hpp"
#include "cut_render/segment_extractor.hpp"
#include "cut_render/system.hpp"

using namespace cut_render;

namespace {

constexpr const char *HISTORY_FILE_NAME = "renders.jsonl";

/// Token cancelled from the signal handler
CancellationToken g_cancel;

extern "C" void on_signal(int) { g_cancel.cancel(); }

int exit_code_for(const Error &error) {
  switch (category(error)) {
  case ErrorCategory::kConfiguration:
    return 1;
  case ErrorCategory::kExecution:
    return 2;
  case ErrorCategory::kQualityGate:
    return 3;
  }
  return 2;
}

/// Record a failure and map it to the process exit code
int fail(ArtifactHistory &history, const Error &error) {
  if (!history.append_failure(error)) {
    LOG_WARN("Failure record not written to {}", history.path());
  }
  return exit_code_for(error);
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 4) {
    LOG_WARN("Usage: ./cut_render <source> <cut_plan.json> <output_dir> "
             "[--transitions]");
    return 1;
  }

  std::string source_arg = argv[1];
  std::string plan_arg = argv[2];
  std::string output_arg = argv[3];
  bool force_transitions = false;
  for (int i = 4; i < argc; ++i) {
    std::string flag = argv[i];
    if (flag == "--transitions") {
      force_transitions = true;
    } else {
      LOG_WARN("Unknown option: {}", flag);
      return 1;
    }
  }

  ArtifactHistory history(
      (std::filesystem::path(output_arg) / HISTORY_FILE_NAME).string());

  RenderConfig config;
  try {
    config = Config::render_config();
  } catch (const std::exception &e) {
    LOG_ERROR("[configuration] Invalid environment setting: {}", e.what());
    return 1;
  }
  if (force_transitions)
    config.transitions_enabled = true;

  LOG_INFO("Cut Render");
  LOG_INFO("Source: {}", source_arg);
  LOG_INFO("Cut plan: {}", plan_arg);
  LOG_INFO("Output directory: {}", output_arg);
  LOG_INFO("Encode: {} preset={} crf={} fps={} threads={}", config.video_codec,
           config.preset, config.crf, config.frame_rate,
           resolve_thread_count(config.threads));
  if (config.transitions_enabled) {
    LOG_INFO("Transitions: crossfade {}ms (audio {}ms)",
             config.transition_duration_ms, config.audio_fade_ms);
  }

  // **---- PLAN ----**

  Result<CutPlan> plan = load_cut_plan(plan_arg);
  if (!plan) {
    LOG_ERROR("[configuration] {}", describe(plan.error()));
    return fail(history, plan.error());
  }

  Result<std::vector<KeepSegment>> keeps = extract_keep_segments(plan.value());
  if (!keeps) {
    LOG_ERROR("[configuration] {}", describe(keeps.error()));
    return fail(history, keeps.error());
  }

  // **---- RENDER ----**

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  FfmpegEngine engine;
  AvFormatProber prober;
  Composer composer(engine, prober);

  Result<ComposeResult> composed = composer.compose(
      source_arg, keeps.value(), config, output_arg, g_cancel);
  if (!composed) {
    TimingCollector::print_summary();
    return fail(history, composed.error());
  }

  // **---- RECORD ----**

  const ComposeResult &result = composed.value();
  bool recorded = history.append_render(result.base, config) &&
                  history.append_pipeline_log(
                      result.base.output_location,
                      "Base cuts rendered (no transitions)");

  if (result.transitioned) {
    recorded = recorded &&
               history.append_render(*result.transitioned, config) &&
               history.append_pipeline_log(
                   result.transitioned->output_location,
                   fmt::format("Transitions applied: {} joins, {}ms crossfade",
                               result.segment_count - 1,
                               result.transitioned->transition->duration_ms));
  }

  print_render_summary(result);
  TimingCollector::print_summary();

  if (!recorded) {
    LOG_ERROR("Render succeeded but history was not written: {}",
              history.path());
    return 2;
  }

  LOG_SUCCESS("Done: {}", result.primary().output_location);
  return 0;
}
