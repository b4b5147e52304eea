/**
 * @file types.hpp
 * @brief Core data types and constants for Cut Render
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - TimeMs fixed-point time representation
 *
 *          - KeepSegment for source time ranges
 *
 *          - TransitionConfig and RenderMode
 *
 *          - FilterGraph, the compiled input of the codec engine
 *
 *          - RenderArtifact and probe/drift reports
 */

#ifndef CUT_RENDER_TYPES_HPP
#define CUT_RENDER_TYPES_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cut_render {

// **----- CONSTANTS -----**

/**
 * @brief Time in integer milliseconds.
 * @note All arithmetic on the output timeline (fold offsets, expected
 *       durations, join points) happens on this type. Decimal strings are
 *       produced only when a graph is compiled.
 */
using TimeMs = std::int64_t;

/// Upper bound (inclusive) for a crossfade duration
constexpr TimeMs MAX_TRANSITION_MS = 5000;

/// Default crossfade duration
constexpr TimeMs DEFAULT_TRANSITION_MS = 300;

/**
 * @brief Convert milliseconds to floating-point seconds.
 * @note Only used for reporting and tolerance comparison.
 */
inline double ms_to_sec(TimeMs ms) { return static_cast<double>(ms) / 1000.0; }

// **----- DATA STRUCTURES -----**

/**
 * @struct KeepSegment
 * @brief A range [start, end) of the source video that survives the edit.
 * @note end_ms > start_ms for every segment produced by the extractor.
 */
struct KeepSegment {
  TimeMs start_ms; //< Start time on the source timeline
  TimeMs end_ms;   //< End time on the source timeline

  TimeMs duration_ms() const { return end_ms - start_ms; }

  bool operator==(const KeepSegment &other) const {
    return start_ms == other.start_ms && end_ms == other.end_ms;
  }
};

/**
 * @struct TransitionConfig
 * @brief Crossfade parameters, applied uniformly to every join.
 */
struct TransitionConfig {
  TimeMs duration_ms = DEFAULT_TRANSITION_MS;   //< Video overlap, (0, 5000]
  TimeMs audio_fade_ms = DEFAULT_TRANSITION_MS; //< Audio overlap, > 0
};

/**
 * @brief How consecutive keep segments are combined.
 */
enum class RenderMode {
  kHardCut,  //< Abutted segments, N-way concat
  kCrossfade //< Overlapping segments, pairwise xfade fold
};

inline const char *to_string(RenderMode mode) {
  return mode == RenderMode::kCrossfade ? "crossfade" : "hard_cut";
}

/**
 * @struct FilterGraph
 * @brief Compiled filter_complex description for the codec engine.
 * @note A value: ordered nodes plus the two final output labels.
 */
struct FilterGraph {
  std::vector<std::string> nodes; //< Filter nodes in generation order
  std::string video_out;          //< Final video label, e.g. "[vout]"
  std::string audio_out;          //< Final audio label, e.g. "[aout]"

  bool operator==(const FilterGraph &other) const {
    return nodes == other.nodes && video_out == other.video_out &&
           audio_out == other.audio_out;
  }
};

/**
 * @struct TransitionInfo
 * @brief Transition metadata attached to a transitioned artifact.
 */
struct TransitionInfo {
  std::string type = "crossfade";
  TimeMs duration_ms = 0;
  TimeMs audio_fade_ms = 0;
};

/**
 * @struct RenderArtifact
 * @brief A validated render output.
 */
struct RenderArtifact {
  std::string output_location; //< Path of the rendered file
  double duration_sec = 0;     //< Measured duration
  std::string resolution;      //< "WxH"
  std::string frame_rate;      //< Rational string, e.g. "30/1"
  std::string codec;           //< Video codec name, e.g. "h264"
  std::optional<TransitionInfo> transition; //< Set on transitioned renders
};

/**
 * @struct StreamInfo
 * @brief One stream of a probed container.
 */
struct StreamInfo {
  std::string type; //< "video", "audio", "subtitle", "data" or "unknown"
  std::optional<int> width;
  std::optional<int> height;
  std::optional<std::string> frame_rate; //< "num/den"
  std::optional<std::string> codec;
  double start_time_sec = 0; //< First presentation time of the stream
};

/**
 * @struct ProbeResult
 * @brief Container-level metadata returned by the prober.
 */
struct ProbeResult {
  double duration_sec = 0;
  std::vector<StreamInfo> streams;

  /// First stream of the given type, or nullptr
  const StreamInfo *find(const std::string &type) const {
    for (const auto &s : streams) {
      if (s.type == type)
        return &s;
    }
    return nullptr;
  }
};

/**
 * @struct JoinDrift
 * @brief A/V divergence sampled at one join of the output timeline.
 */
struct JoinDrift {
  std::size_t join_index = 0;  //< 1-based join (join i precedes segment i)
  TimeMs output_time_ms = 0;   //< Join position on the output timeline
  double video_pts_sec = 0;    //< First video presentation at/after the join
  double audio_pts_sec = 0;    //< First audio presentation at/after the join
  double drift_ms = 0;         //< |video - audio| coverage offset, ms
};

/**
 * @struct DriftReport
 * @brief Per-join drift measurements plus their maximum.
 */
struct DriftReport {
  double start_offset_ms = 0; //< |video start - audio start|
  double max_drift_ms = 0;    //< max(start_offset_ms, measurements)
  std::vector<JoinDrift> measurements;
};

} // namespace cut_render

#endif // CUT_RENDER_TYPES_HPP
