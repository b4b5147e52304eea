/**
 * @file errors.cpp
 * @brief Error categorisation and formatting
 */

#include "cut_render/errors.hpp"

#include <type_traits>

#include <fmt/core.h>

namespace cut_render {

ErrorCategory category(const Error &error) {
  return std::visit(
      [](const auto &e) {
        using P = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<P, InvalidPlan> ||
                      std::is_same_v<P, InvalidDuration>) {
          return ErrorCategory::kConfiguration;
        } else if constexpr (std::is_same_v<P, CodecExecutionFailed> ||
                             std::is_same_v<P, ProbeFailed>) {
          return ErrorCategory::kExecution;
        } else {
          return ErrorCategory::kQualityGate;
        }
      },
      error);
}

const char *to_string(ErrorCategory cat) {
  switch (cat) {
  case ErrorCategory::kConfiguration:
    return "configuration";
  case ErrorCategory::kExecution:
    return "execution";
  case ErrorCategory::kQualityGate:
    return "quality_gate";
  }
  return "unknown";
}

const char *error_type(const Error &error) {
  static const char *const names[] = {
      "INVALID_PLAN", "INVALID_DURATION",  "CODEC_EXECUTION_FAILED",
      "PROBE_FAILED", "DURATION_MISMATCH", "SYNC_DRIFT_EXCEEDED"};
  return names[error.index()];
}

std::string describe(const Error &error) {
  return std::visit(
      [](const auto &e) -> std::string {
        using P = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<P, InvalidPlan>) {
          if (e.entry_index >= 0) {
            return fmt::format("Invalid cut plan: {} (entry {}, {} cuts, {} "
                               "keeps)",
                               e.reason, e.entry_index, e.total_cuts,
                               e.keep_count);
          }
          return fmt::format("Invalid cut plan: {} ({} cuts, {} keeps)",
                             e.reason, e.total_cuts, e.keep_count);
        } else if constexpr (std::is_same_v<P, InvalidDuration>) {
          if (e.segment_index >= 0) {
            return fmt::format(
                "Invalid transition {}: {}ms exceeds keep segment {} ({}ms)",
                e.field, e.value_ms, e.segment_index, e.segment_ms);
          }
          return fmt::format(
              "Invalid transition {}: {}ms (must be in (0, {}]ms)", e.field,
              e.value_ms, e.max_ms);
        } else if constexpr (std::is_same_v<P, CodecExecutionFailed>) {
          if (e.cancelled) {
            return fmt::format("Encode of {} cancelled{}", e.output_path,
                               e.timed_out ? " (timeout)" : "");
          }
          return fmt::format("FFmpeg failed for {} with exit code {}: {}",
                             e.output_path, e.exit_code, e.stderr_text);
        } else if constexpr (std::is_same_v<P, ProbeFailed>) {
          return fmt::format("Failed to probe {}: {}", e.path, e.reason);
        } else if constexpr (std::is_same_v<P, DurationMismatch>) {
          return fmt::format(
              "Output duration mismatch ({}, {} segments): expected {:.3f}s, "
              "got {:.3f}s (diff: {:.3f}s, tolerance: ±{:.3f}s)",
              to_string(e.mode), e.segment_count, e.expected_sec,
              e.actual_sec, e.diff_sec, e.tolerance_sec);
        } else {
          return fmt::format(
              "A/V sync drift exceeded threshold ({}): {:.1f}ms (max: "
              "{:.0f}ms, {} joins measured)",
              to_string(e.mode), e.max_drift_ms, e.budget_ms,
              e.report.measurements.size());
        }
      },
      error);
}

} // namespace cut_render
