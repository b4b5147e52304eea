/**
 * @file media_probe.cpp
 * @brief libavformat-backed probing and drift measurement
 */

#include "cut_render/media_probe.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

#include <fmt/core.h>

#include "cut_render/logging.hpp"

namespace cut_render {

namespace {

/// Seek this far before a join so the first packets after it are read
constexpr double SEEK_BACK_SEC = 2.0;

/// Stop reading once both streams are this far past the join
constexpr double LOOKAHEAD_SEC = 1.0;

/// Packet times within this distance before a join count as "at" the join
constexpr double PTS_EPSILON_SEC = 1e-6;

std::string av_error_string(int err) {
  char buf[AV_ERROR_MAX_STRING_SIZE] = {0};
  av_strerror(err, buf, sizeof(buf));
  return buf;
}

double stream_start_sec(const AVStream *s) {
  return (s->start_time != AV_NOPTS_VALUE) ? s->start_time * av_q2d(s->time_base)
                                           : 0.0;
}

/// Packet length used when the muxer left pkt->duration unset
double nominal_packet_sec(const AVStream *s) {
  const AVCodecParameters *par = s->codecpar;
  if (par->codec_type == AVMEDIA_TYPE_AUDIO) {
    if (par->frame_size > 0 && par->sample_rate > 0)
      return static_cast<double>(par->frame_size) / par->sample_rate;
    return 0.0;
  }
  AVRational fr = s->avg_frame_rate;
  if (fr.num <= 0 || fr.den <= 0)
    fr = s->r_frame_rate;
  if (fr.num <= 0 || fr.den <= 0)
    return 0.0;
  return av_q2d(av_inv_q(fr));
}

/**
 * @class InputFile
 * @brief Owns an opened AVFormatContext and a reusable packet.
 */
class InputFile {
  AVFormatContext *fmt_ctx = nullptr;
  AVPacket *pkt = nullptr;

public:
  InputFile() { pkt = av_packet_alloc(); }

  ~InputFile() {
    if (fmt_ctx)
      avformat_close_input(&fmt_ctx);
    av_packet_free(&pkt);
  }

  InputFile(const InputFile &) = delete;
  InputFile &operator=(const InputFile &) = delete;

  /**
   * @brief Open the container and read stream info.
   * @param reason Output: failure description
   * @return true on success
   */
  bool open(const std::string &path, std::string &reason) {
    if (!pkt) {
      reason = "failed to allocate AVPacket";
      return false;
    }

    int ret = avformat_open_input(&fmt_ctx, path.c_str(), nullptr, nullptr);
    if (ret < 0) {
      reason = fmt::format("avformat_open_input failed: {}", av_error_string(ret));
      return false;
    }

    ret = avformat_find_stream_info(fmt_ctx, nullptr);
    if (ret < 0) {
      reason = fmt::format("avformat_find_stream_info failed: {}",
                           av_error_string(ret));
      return false;
    }
    return true;
  }

  AVFormatContext *context() const { return fmt_ctx; }
  AVPacket *packet() const { return pkt; }
};

} // anonymous namespace

double coverage_offset_sec(const std::vector<PacketSpan> &packets, double t) {
  double best = std::numeric_limits<double>::infinity();
  for (const PacketSpan &p : packets) {
    const double end = p.pts_sec + std::max(p.duration_sec, PTS_EPSILON_SEC);
    if (p.pts_sec - PTS_EPSILON_SEC <= t && t < end)
      return 0.0;

    const double off = (p.pts_sec > t) ? p.pts_sec - t : end - t;
    if (std::fabs(off) < std::fabs(best))
      best = off;
  }
  return best;
}

double join_drift_ms(const std::vector<PacketSpan> &video,
                     const std::vector<PacketSpan> &audio, double t) {
  return std::fabs(coverage_offset_sec(video, t) -
                   coverage_offset_sec(audio, t)) *
         1000.0;
}

// **----- PROBE -----**

Result<ProbeResult> AvFormatProber::probe(const std::string &path) {
  InputFile input;
  std::string reason;
  if (!input.open(path, reason)) {
    LOG_ERROR("Probe failed for {}: {}", path, reason);
    return ProbeFailed{path, reason};
  }

  const AVFormatContext *ctx = input.context();
  ProbeResult result;

  if (ctx->duration != AV_NOPTS_VALUE && ctx->duration > 0) {
    result.duration_sec = ctx->duration / static_cast<double>(AV_TIME_BASE);
  }

  double longest_stream = 0;
  for (unsigned i = 0; i < ctx->nb_streams; ++i) {
    const AVStream *s = ctx->streams[i];
    const AVCodecParameters *par = s->codecpar;

    StreamInfo info;
    const char *type = av_get_media_type_string(par->codec_type);
    info.type = type ? type : "unknown";
    info.codec = std::string(avcodec_get_name(par->codec_id));
    info.start_time_sec = stream_start_sec(s);

    if (par->codec_type == AVMEDIA_TYPE_VIDEO) {
      if (par->width > 0)
        info.width = par->width;
      if (par->height > 0)
        info.height = par->height;

      AVRational fr = s->avg_frame_rate;
      if (fr.num <= 0 || fr.den <= 0)
        fr = s->r_frame_rate;
      if (fr.num > 0 && fr.den > 0)
        info.frame_rate = fmt::format("{}/{}", fr.num, fr.den);
    }

    if (s->duration != AV_NOPTS_VALUE && s->duration > 0) {
      longest_stream =
          std::max(longest_stream, s->duration * av_q2d(s->time_base));
    }
    result.streams.push_back(std::move(info));
  }

  /// Some muxers only record per-stream durations
  if (result.duration_sec <= 0)
    result.duration_sec = longest_stream;

  if (result.duration_sec <= 0) {
    return ProbeFailed{path, "container reports no duration"};
  }
  return result;
}

// **----- DRIFT -----**

Result<DriftReport>
AvFormatProber::measure_drift(const std::string &path,
                              const std::vector<TimeMs> &join_points_ms) {
  InputFile input;
  std::string reason;
  if (!input.open(path, reason)) {
    LOG_ERROR("Drift probe failed for {}: {}", path, reason);
    return ProbeFailed{path, reason};
  }

  AVFormatContext *ctx = input.context();
  AVPacket *pkt = input.packet();

  const int v_idx =
      av_find_best_stream(ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  const int a_idx =
      av_find_best_stream(ctx, AVMEDIA_TYPE_AUDIO, -1, -1, nullptr, 0);
  if (v_idx < 0)
    return ProbeFailed{path, "no video stream"};
  if (a_idx < 0)
    return ProbeFailed{path, "no audio stream"};

  const AVStream *vs = ctx->streams[v_idx];
  const AVStream *as = ctx->streams[a_idx];
  const double v_tb = av_q2d(vs->time_base);
  const double a_tb = av_q2d(as->time_base);
  const double v_nominal = nominal_packet_sec(vs);
  const double a_nominal = nominal_packet_sec(as);

  DriftReport report;
  report.start_offset_ms =
      std::fabs(stream_start_sec(vs) - stream_start_sec(as)) * 1000.0;
  report.max_drift_ms = report.start_offset_ms;

  constexpr double kNone = std::numeric_limits<double>::infinity();

  std::vector<PacketSpan> v_packets;
  std::vector<PacketSpan> a_packets;

  for (std::size_t i = 0; i < join_points_ms.size(); ++i) {
    const double t = ms_to_sec(join_points_ms[i]);

    int64_t seek_ts =
        static_cast<int64_t>(std::max(0.0, t - SEEK_BACK_SEC) * AV_TIME_BASE);
    int ret = av_seek_frame(ctx, -1, seek_ts, AVSEEK_FLAG_BACKWARD);
    if (ret < 0) {
      return ProbeFailed{path, fmt::format("seek to {:.3f}s failed: {}", t,
                                           av_error_string(ret))};
    }

    v_packets.clear();
    a_packets.clear();
    double v_first = kNone;
    double a_first = kNone;
    double v_seen = -kNone;
    double a_seen = -kNone;

    while (av_read_frame(ctx, pkt) >= 0) {
      const int idx = pkt->stream_index;
      int64_t ts = (pkt->pts != AV_NOPTS_VALUE) ? pkt->pts : pkt->dts;

      if ((idx == v_idx || idx == a_idx) && ts != AV_NOPTS_VALUE) {
        const bool is_video = idx == v_idx;
        const double tb = is_video ? v_tb : a_tb;
        const double sec = ts * tb;
        const double dur = (pkt->duration > 0) ? pkt->duration * tb
                                               : (is_video ? v_nominal
                                                           : a_nominal);
        double &first = is_video ? v_first : a_first;
        double &seen = is_video ? v_seen : a_seen;

        (is_video ? v_packets : a_packets).push_back({sec, dur});
        if (sec + PTS_EPSILON_SEC >= t)
          first = std::min(first, sec);
        seen = std::max(seen, sec);
      }
      av_packet_unref(pkt);

      if (v_seen >= t + LOOKAHEAD_SEC && a_seen >= t + LOOKAHEAD_SEC)
        break;
    }

    if (v_first == kNone || a_first == kNone) {
      return ProbeFailed{
          path, fmt::format("no {} packet at or after join {} ({:.3f}s)",
                            v_first == kNone ? "video" : "audio", i + 1, t)};
    }

    JoinDrift drift;
    drift.join_index = i + 1;
    drift.output_time_ms = join_points_ms[i];
    drift.video_pts_sec = v_first;
    drift.audio_pts_sec = a_first;
    drift.drift_ms = join_drift_ms(v_packets, a_packets, t);

    report.max_drift_ms = std::max(report.max_drift_ms, drift.drift_ms);
    report.measurements.push_back(drift);
  }

  return report;
}

} // namespace cut_render
