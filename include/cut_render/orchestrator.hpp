/**
 * @file orchestrator.hpp
 * @brief Render orchestration: which artifacts to produce, and producing them
 *
 * @details The Composer drives one job through its stages, strictly in
 *          sequence:
 *
 *          1. Check the keep segments
 *
 *          2. Select the render state from (N, transitions enabled)
 *
 *          3. Compile the hard-cut graph, and the crossfade graph when
 *             transitions apply
 *
 *          4. For each artifact: encode, probe, validate duration, measure
 *             and validate A/V drift
 *
 * @note The Composer persists nothing. Artifact records are the caller's
 *       (see artifact_history.hpp). Any error is terminal for the attempt.
 */

#ifndef CUT_RENDER_ORCHESTRATOR_HPP
#define CUT_RENDER_ORCHESTRATOR_HPP

#include <optional>
#include <string>
#include <vector>

#include "config.hpp"
#include "errors.hpp"
#include "ffmpeg_executor.hpp"
#include "media_probe.hpp"
#include "system.hpp"
#include "types.hpp"

namespace cut_render {

/// File name of the hard-cut artifact inside the output directory
constexpr const char *BASE_OUTPUT_NAME = "base_cuts.mp4";

/// File name of the transitioned artifact inside the output directory
constexpr const char *TRANSITION_OUTPUT_NAME = "with_transitions.mp4";

/**
 * @brief Which artifacts a job produces.
 */
enum class RenderState {
  kSingleSegment,              //< N = 1: base only, transitions never apply
  kMultiSegmentHardCut,        //< N > 1, transitions off: base only
  kMultiSegmentWithTransitions //< N > 1, transitions on: base + transitioned
};

/**
 * @brief Pure decision over (segment count, transitions enabled).
 */
RenderState select_render_state(std::size_t segment_count,
                                bool transitions_enabled);

/// "SINGLE_SEGMENT", "MULTI_SEGMENT_HARD_CUT" or
/// "MULTI_SEGMENT_WITH_TRANSITIONS"
const char *to_string(RenderState state);

/**
 * @struct ComposeResult
 * @brief Artifacts and graphs of a successful compose().
 */
struct ComposeResult {
  RenderState state = RenderState::kSingleSegment;
  RenderArtifact base;
  std::optional<RenderArtifact> transitioned;
  FilterGraph base_graph;
  std::optional<FilterGraph> transition_graph;
  std::size_t segment_count = 0;
  TimeMs source_keep_ms = 0; //< Sum of keep segment durations

  /// The artifact to surface first: transitioned when present
  const RenderArtifact &primary() const {
    return transitioned ? *transitioned : base;
  }
};

/**
 * @class Composer
 * @brief Drives compile -> encode -> probe -> validate for one job.
 *
 * @attention THREAD MODEL:
 *            - One Composer per job. The engine and prober are borrowed and
 *              must outlive it.
 */
class Composer {
  CodecEngine &engine_;
  MediaProber &prober_;
  std::string job_label_; //< Log prefix label (empty = no prefix)

  /**
   * @brief Encode one graph, then probe and validate the output.
   * @return The artifact (without transition metadata), or the first error
   */
  Result<RenderArtifact> render_variant(const std::string &source_path,
                                        const std::vector<KeepSegment> &segments,
                                        const FilterGraph &graph,
                                        RenderMode mode,
                                        const RenderConfig &config,
                                        const std::string &output_path,
                                        const CancellationToken &cancel);

  /**
   * @brief Log a message with optional job prefix.
   */
  void log_info(const std::string &msg);
  void log_phase(const std::string &msg);
  void log_error(const Error &error);

  std::string prefix() const;

public:
  /**
   * @brief Construct a composer.
   * @param engine Codec engine used for every encode
   * @param prober Prober used for duration and drift
   * @param job_label Job label for log prefixing (empty = no prefix)
   */
  Composer(CodecEngine &engine, MediaProber &prober, std::string job_label = "");

  /**
   * @brief Render all artifacts the state calls for.
   *
   * @param source_path Source video
   * @param segments Ordered, non-overlapping keep segments
   * @param config Encode and transition settings
   * @param output_dir Directory for the rendered files (created if missing)
   * @param cancel Aborts the running encode
   * @return ComposeResult, or the first error
   */
  Result<ComposeResult> compose(const std::string &source_path,
                                const std::vector<KeepSegment> &segments,
                                const RenderConfig &config,
                                const std::string &output_dir,
                                const CancellationToken &cancel);
};

/**
 * @brief Print a render summary table to stdout.
 * @param job_label Job label prefix (empty = none)
 */
void print_render_summary(const ComposeResult &result,
                          const std::string &job_label = "");

} // namespace cut_render

#endif // CUT_RENDER_ORCHESTRATOR_HPP
