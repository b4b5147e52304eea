/**
 * @file segment_extractor.hpp
 * @brief Cut plan -> ordered keep segments
 *
 * @details Filters the plan to "keep" entries and converts their timestamps
 *          to TimeMs. Rejects, never repairs:
 *
 *          - a plan with nothing to keep
 *
 *          - a timestamp that does not parse
 *
 *          - a segment with end <= start
 *
 *          - a keep starting before the previous keep
 *
 *          - a keep overlapping the previous keep
 *
 *          The first violation fails the whole plan.
 */

#ifndef CUT_RENDER_SEGMENT_EXTRACTOR_HPP
#define CUT_RENDER_SEGMENT_EXTRACTOR_HPP

#include <vector>

#include "cut_plan.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace cut_render {

/**
 * @brief Extract the ordered keep segments of a plan.
 * @return Non-empty, ordered, non-overlapping segments, or InvalidPlan
 */
Result<std::vector<KeepSegment>> extract_keep_segments(const CutPlan &plan);

/**
 * @brief Re-check an already extracted segment list.
 * @note Used when segments reach compose() without going through a plan.
 */
Status check_keep_segments(const std::vector<KeepSegment> &segments);

} // namespace cut_render

#endif // CUT_RENDER_SEGMENT_EXTRACTOR_HPP
