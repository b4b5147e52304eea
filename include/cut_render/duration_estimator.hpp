/**
 * @file duration_estimator.hpp
 * @brief Analytically expected output duration per render mode
 *
 * @details
 *   - Hard cut:  expected = sum(end_i - start_i), tolerance = 1 frame
 *
 *   - Crossfade: expected = sum(end_i - start_i) - (N-1) * duration,
 *                tolerance = max(1 frame, 2% of expected, 5s)
 *
 * @attention The crossfade expectation is computed from the closed form,
 *            independently of the folder's running offset. The two must
 *            agree exactly in milliseconds.
 */

#ifndef CUT_RENDER_DURATION_ESTIMATOR_HPP
#define CUT_RENDER_DURATION_ESTIMATOR_HPP

#include <vector>

#include "types.hpp"

namespace cut_render {

/// Floor of the crossfade tolerance
constexpr double CROSSFADE_MIN_TOLERANCE_SEC = 5.0;

/// Relative crossfade tolerance
constexpr double CROSSFADE_TOLERANCE_RATIO = 0.02;

/**
 * @brief Sum of keep segment durations.
 */
TimeMs total_keep_ms(const std::vector<KeepSegment> &segments);

/**
 * @brief Number of joins between segments (N-1, 0 for empty input).
 */
std::size_t join_count(const std::vector<KeepSegment> &segments);

/**
 * @brief Expected output duration.
 * @param transition_ms Crossfade duration, ignored in hard-cut mode
 */
TimeMs expected_duration_ms(const std::vector<KeepSegment> &segments,
                            RenderMode mode, TimeMs transition_ms);

/**
 * @brief Accepted |actual - expected| for a mode.
 * @param expected_sec Expected duration in seconds
 * @param fps Output frame rate (> 0)
 */
double duration_tolerance_sec(RenderMode mode, double expected_sec, double fps);

/**
 * @brief Positions of the joins on the output timeline.
 *
 * @note Hard cut: cumulative segment ends. Crossfade: the start of each
 *       fade, which is where the incoming segment first appears.
 *
 * @return N-1 positions in ascending order
 */
std::vector<TimeMs> join_points_ms(const std::vector<KeepSegment> &segments,
                                   RenderMode mode, TimeMs transition_ms);

} // namespace cut_render

#endif // CUT_RENDER_DURATION_ESTIMATOR_HPP
