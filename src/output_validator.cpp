/**
 * @file output_validator.cpp
 * @brief Duration and A/V sync validation implementation
 */

#include "cut_render/output_validator.hpp"

#include <cmath>
#include <cstdlib>

#include "cut_render/duration_estimator.hpp"
#include "cut_render/logging.hpp"

namespace cut_render {

namespace {

/// strtod over the whole string, nothing left over
bool parse_double(const std::string &text, double &out) {
  if (text.empty())
    return false;
  char *end = nullptr;
  out = std::strtod(text.c_str(), &end);
  return end == text.c_str() + text.size() && std::isfinite(out);
}

} // anonymous namespace

double parse_frame_rate(const std::string &rate, double fallback) {
  double fps = 0;
  auto slash = rate.find('/');
  if (slash == std::string::npos) {
    if (!parse_double(rate, fps))
      return fallback;
  } else {
    double num = 0;
    double den = 0;
    if (!parse_double(rate.substr(0, slash), num) ||
        !parse_double(rate.substr(slash + 1), den) || den <= 0) {
      return fallback;
    }
    fps = num / den;
  }
  return fps > 0 ? fps : fallback;
}

Status validate_duration(double actual_sec, TimeMs expected_ms,
                         RenderMode mode, double fps,
                         std::size_t segment_count) {
  const double expected_sec = ms_to_sec(expected_ms);
  const double tolerance = duration_tolerance_sec(mode, expected_sec, fps);
  const double diff = std::fabs(actual_sec - expected_sec);

  if (diff > tolerance) {
    return DurationMismatch{expected_sec, actual_sec, diff,
                            tolerance,    mode,       segment_count};
  }

  LOG_INFO("Duration validation passed ({}): expected {:.3f}s, got {:.3f}s "
           "(diff {:.3f}s, tolerance ±{:.3f}s)",
           to_string(mode), expected_sec, actual_sec, diff, tolerance);
  return Status::Ok();
}

Status validate_sync(const DriftReport &report, RenderMode mode) {
  if (report.max_drift_ms > SYNC_DRIFT_BUDGET_MS) {
    return SyncDriftExceeded{report.max_drift_ms, SYNC_DRIFT_BUDGET_MS, mode,
                             report};
  }

  LOG_INFO("A/V sync check passed ({}): max drift {:.1f}ms over {} joins",
           to_string(mode), report.max_drift_ms, report.measurements.size());
  return Status::Ok();
}

} // namespace cut_render
