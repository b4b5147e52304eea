/**
 * @file graph_compiler.hpp
 * @brief Keep segments -> FFmpeg filter_complex graphs
 *
 * @details Two strategies over the same input:
 *
 *          - Concatenation (hard cuts): per-segment trim/atrim reset to a
 *            zero-based timestamp, then one N-way concat per media type.
 *
 *          - Crossfade (smoothed joins): the same trims, then a pairwise
 *            fold of N streams into one through N-1 xfade/acrossfade joins.
 *
 * @attention Compilation is pure and deterministic: identical inputs yield
 *            byte-identical graphs.
 *
 * @note Labels: [v{i}]/[a{i}] for trimmed segments, [vx{i}]/[ax{i}] for the
 *       fold output after join i, [vout]/[aout] for concat output.
 */

#ifndef CUT_RENDER_GRAPH_COMPILER_HPP
#define CUT_RENDER_GRAPH_COMPILER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace cut_render {

/**
 * @struct TrimOptions
 * @brief Trim emission switches.
 */
struct TrimOptions {
  /**
   * @brief Express the last segment's trim as start+duration.
   * @note trim's end is exclusive; with some frame rates an explicit end
   *       drops the final frame of the last segment.
   */
  bool last_segment_by_duration = true;
};

/**
 * @struct CrossfadeFold
 * @brief Output of the crossfade chain folder.
 */
struct CrossfadeFold {
  std::vector<std::string> nodes;     //< Join nodes, video then audio per join
  std::vector<TimeMs> fade_offsets_ms; //< Fade start on the output timeline
  std::size_t video_joins = 0;
  std::size_t audio_joins = 0;
  std::string video_out; //< Label of the last video join (or [v0])
  std::string audio_out; //< Label of the last audio join (or [a0])
  TimeMs timeline_ms = 0; //< Length of the emitted output timeline
};

/**
 * @brief Check a transition configuration.
 * @return InvalidDuration unless 0 < duration_ms <= 5000 and audio_fade_ms > 0 */
Status validate_transition(const TransitionConfig &transition);

/**
 * @brief Emit the video and audio trim nodes of every segment.
 *
 * @param segments Keep segments (non-empty)
 * @param last_by_duration Express the last trim by duration instead of end
 * @return 2*N nodes, [v{i}] then [a{i}] for each segment
 */
std::vector<std::string> build_trim_nodes(const std::vector<KeepSegment> &segments,
                                          bool last_by_duration);

/**
 * @brief Compile a hard-cut graph.
 * @return Graph with outputs [vout]/[aout], or InvalidPlan when empty
 */
Result<FilterGraph> compile_concat(const std::vector<KeepSegment> &segments,
                                   const TrimOptions &options = TrimOptions());

/**
 * @brief Fold N trimmed streams into one through N-1 crossfade joins.
 *
 * @attention The fade offset of join i is measured on the emerging output
 *            timeline (the cumulative emitted length), not on the source.
 *
 * @return Join nodes and final labels, or InvalidDuration when the
 *         transition is invalid or a segment is shorter than either fade
 */
Result<CrossfadeFold> fold_crossfade_chain(
    const std::vector<KeepSegment> &segments,
    const TransitionConfig &transition);

/**
 * @brief Compile a crossfade graph: trim nodes followed by the fold.
 * @return Graph, InvalidPlan when fewer than two segments, or InvalidDuration
 */
Result<FilterGraph> compile_crossfade(const std::vector<KeepSegment> &segments,
                                      const TransitionConfig &transition);

/**
 * @brief Serialise a graph to the -filter_complex argument.
 */
std::string to_filter_complex(const FilterGraph &graph);

} // namespace cut_render

#endif // CUT_RENDER_GRAPH_COMPILER_HPP
