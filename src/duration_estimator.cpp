/**
 * @file duration_estimator.cpp
 * @brief Expected duration and tolerance implementation
 */

#include "cut_render/duration_estimator.hpp"

#include <algorithm>

namespace cut_render {

TimeMs total_keep_ms(const std::vector<KeepSegment> &segments) {
  TimeMs total = 0;
  for (const auto &s : segments) {
    total += s.duration_ms();
  }
  return total;
}

std::size_t join_count(const std::vector<KeepSegment> &segments) {
  return segments.empty() ? 0 : segments.size() - 1;
}

TimeMs expected_duration_ms(const std::vector<KeepSegment> &segments,
                            RenderMode mode, TimeMs transition_ms) {
  TimeMs total = total_keep_ms(segments);
  if (mode == RenderMode::kCrossfade) {
    total -= static_cast<TimeMs>(join_count(segments)) * transition_ms;
  }
  return total;
}

double duration_tolerance_sec(RenderMode mode, double expected_sec,
                              double fps) {
  const double frame_sec = 1.0 / fps;
  if (mode == RenderMode::kHardCut)
    return frame_sec;

  return std::max({frame_sec, expected_sec * CROSSFADE_TOLERANCE_RATIO,
                   CROSSFADE_MIN_TOLERANCE_SEC});
}

std::vector<TimeMs> join_points_ms(const std::vector<KeepSegment> &segments,
                                   RenderMode mode, TimeMs transition_ms) {
  std::vector<TimeMs> points;
  points.reserve(join_count(segments));

  TimeMs source_sum = 0;
  for (std::size_t i = 1; i < segments.size(); ++i) {
    source_sum += segments[i - 1].duration_ms();
    if (mode == RenderMode::kCrossfade) {
      points.push_back(source_sum - static_cast<TimeMs>(i) * transition_ms);
    } else {
      points.push_back(source_sum);
    }
  }
  return points;
}

} // namespace cut_render
