/**
 * @file output_validator.hpp
 * @brief Quality gates on a rendered output
 *
 * @details Two checks, both hard failures:
 *
 *          - Duration: |measured - expected| must stay within the mode's
 *            tolerance (see duration_estimator.hpp)
 *
 *          - A/V sync: the largest drift measured at the joins must not
 *            exceed SYNC_DRIFT_BUDGET_MS (boundary inclusive)
 */

#ifndef CUT_RENDER_OUTPUT_VALIDATOR_HPP
#define CUT_RENDER_OUTPUT_VALIDATOR_HPP

#include <cstddef>
#include <string>

#include "errors.hpp"
#include "types.hpp"

namespace cut_render {

/// Maximum accepted audio/video drift at any join
constexpr double SYNC_DRIFT_BUDGET_MS = 50.0;

/**
 * @brief Parse a frame rate such as "30/1", "30000/1001" or "25".
 * @return Frames per second, or `fallback` when unparseable or non-positive
 */
double parse_frame_rate(const std::string &rate, double fallback);

/**
 * @brief Compare a measured duration with the expectation.
 *
 * @param actual_sec Duration reported by the prober
 * @param expected_ms Duration from the estimator
 * @param mode Render mode (selects the tolerance rule)
 * @param fps Output frame rate
 * @param segment_count Keep segments in the render (diagnostics only)
 * @return DurationMismatch when outside tolerance
 */
Status validate_duration(double actual_sec, TimeMs expected_ms,
                         RenderMode mode, double fps,
                         std::size_t segment_count);

/**
 * @brief Enforce the A/V drift budget.
 * @return SyncDriftExceeded (with every measurement) when max > budget
 */
Status validate_sync(const DriftReport &report, RenderMode mode);

} // namespace cut_render

#endif // CUT_RENDER_OUTPUT_VALIDATOR_HPP
