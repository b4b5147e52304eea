// Fake codec engine and prober for orchestration tests.
// Neither touches ffmpeg; both record what they were asked to do.

#ifndef CUT_RENDER_TESTS_FAKE_MEDIA_HPP
#define CUT_RENDER_TESTS_FAKE_MEDIA_HPP

#include <algorithm>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cut_render/ffmpeg_executor.hpp"
#include "cut_render/media_probe.hpp"

namespace cut_render::fakes {

class FakeCodecEngine : public CodecEngine {
public:
  std::vector<EncodeJob> jobs;

  /// Output file name that fails to encode (empty = none)
  std::string fail_on;
  int fail_exit_code = 1;
  std::string fail_stderr = "Error while filtering";

  Status encode(const EncodeJob &job, const RenderConfig &,
                const CancellationToken &cancel) override {
    jobs.push_back(job);
    if (cancel.is_cancelled()) {
      CodecExecutionFailed failure;
      failure.output_path = job.output_path;
      failure.cancelled = true;
      return failure;
    }
    if (!fail_on.empty() &&
        std::filesystem::path(job.output_path).filename().string() == fail_on) {
      CodecExecutionFailed failure;
      failure.output_path = job.output_path;
      failure.exit_code = fail_exit_code;
      failure.stderr_text = fail_stderr;
      return failure;
    }
    return Status::Ok();
  }
};

class FakeMediaProber : public MediaProber {
public:
  /// Reported duration by output file name
  std::map<std::string, double> durations;

  /// Drift reported at every join
  double join_drift_ms = 10.0;
  double start_offset_ms = 0.0;

  bool fail_probe = false;
  bool omit_video = false;

  std::vector<std::string> probed;
  std::map<std::string, std::vector<TimeMs>> drift_requests;

  Result<ProbeResult> probe(const std::string &path) override {
    probed.push_back(path);
    if (fail_probe)
      return ProbeFailed{path, "moov atom not found"};

    ProbeResult result;
    auto it = durations.find(std::filesystem::path(path).filename().string());
    result.duration_sec = (it != durations.end()) ? it->second : 0.0;

    if (!omit_video) {
      StreamInfo video;
      video.type = "video";
      video.width = 1920;
      video.height = 1080;
      video.frame_rate = "30/1";
      video.codec = "h264";
      result.streams.push_back(video);
    }

    StreamInfo audio;
    audio.type = "audio";
    audio.codec = "aac";
    result.streams.push_back(audio);
    return result;
  }

  Result<DriftReport>
  measure_drift(const std::string &path,
                const std::vector<TimeMs> &join_points_ms) override {
    drift_requests[std::filesystem::path(path).filename().string()] =
        join_points_ms;

    DriftReport report;
    report.start_offset_ms = start_offset_ms;
    report.max_drift_ms = start_offset_ms;
    for (std::size_t i = 0; i < join_points_ms.size(); ++i) {
      JoinDrift d;
      d.join_index = i + 1;
      d.output_time_ms = join_points_ms[i];
      d.drift_ms = join_drift_ms;
      report.measurements.push_back(d);
      report.max_drift_ms = std::max(report.max_drift_ms, d.drift_ms);
    }
    return report;
  }
};

} // namespace cut_render::fakes

#endif // CUT_RENDER_TESTS_FAKE_MEDIA_HPP
