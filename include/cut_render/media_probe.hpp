/**
 * @file media_probe.hpp
 * @brief Container inspection and A/V drift measurement
 *
 * @details MediaProber is the seam between the orchestrator and the media
 *          inspection backend. AvFormatProber reads the container directly
 *          through libavformat, without decoding.
 *
 * @attention THREAD MODEL:
 *            - AvFormatProber opens a fresh AVFormatContext per call and
 *              holds no state between calls, so one instance may be shared.
 */

#ifndef CUT_RENDER_MEDIA_PROBE_HPP
#define CUT_RENDER_MEDIA_PROBE_HPP

#include <string>
#include <vector>

#include "errors.hpp"
#include "types.hpp"

namespace cut_render {

/// Presentation interval of one demuxed packet, in seconds
struct PacketSpan {
  double pts_sec = 0;
  double duration_sec = 0;
};

/**
 * @brief Signed distance from t to the stream's packet coverage.
 *
 * @details Zero when some packet's [pts, pts + duration) contains t.
 *          Positive when the nearest packet starts after t, negative when
 *          it ends before t. Packets whose start lies on the frame grid
 *          around t therefore contribute no error.
 *
 * @return Offset in seconds, or +infinity when packets is empty
 */
double coverage_offset_sec(const std::vector<PacketSpan> &packets, double t);

/// |video - audio| coverage offsets at t, in milliseconds
double join_drift_ms(const std::vector<PacketSpan> &video,
                     const std::vector<PacketSpan> &audio, double t);

/**
 * @class MediaProber
 * @brief Reads duration, stream metadata and join drift from a file.
 */
class MediaProber {
public:
  virtual ~MediaProber() = default;

  /**
   * @brief Container duration and per-stream metadata.
   * @return ProbeResult, or ProbeFailed
   */
  virtual Result<ProbeResult> probe(const std::string &path) = 0;

  /**
   * @brief Measure A/V drift at each join of the output timeline.
   *
   * @param path Rendered file
   * @param join_points_ms Join positions on the output timeline
   * @return Per-join drift plus the start offset, or ProbeFailed
   */
  virtual Result<DriftReport>
  measure_drift(const std::string &path,
                const std::vector<TimeMs> &join_points_ms) = 0;
};

/**
 * @class AvFormatProber
 * @brief MediaProber backed by libavformat.
 *
 * @details Drift at a join is join_drift_ms() over the video and audio
 *          packets read around the join point. A packet without a duration
 *          takes the stream's nominal frame period (1/fps for video,
 *          frame_size/sample_rate for audio). The start offset is the difference between the two streams'
 *          start times. Both the file's first video and first audio stream
 *          must exist.
 */
class AvFormatProber : public MediaProber {
public:
  Result<ProbeResult> probe(const std::string &path) override;

  Result<DriftReport>
  measure_drift(const std::string &path,
                const std::vector<TimeMs> &join_points_ms) override;
};

} // namespace cut_render

#endif // CUT_RENDER_MEDIA_PROBE_HPP
