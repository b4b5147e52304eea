/**
 * @file graph_compiler.cpp
 * @brief Filter graph compilation implementation
 */

#include "cut_render/graph_compiler.hpp"

#include <fmt/core.h>

#include "cut_render/timecode.hpp"

namespace cut_render {

Status validate_transition(const TransitionConfig &transition) {
  if (transition.duration_ms <= 0 ||
      transition.duration_ms > MAX_TRANSITION_MS) {
    return InvalidDuration{"durationMs", transition.duration_ms,
                           MAX_TRANSITION_MS};
  }
  if (transition.audio_fade_ms <= 0) {
    return InvalidDuration{"audioFadeMs", transition.audio_fade_ms,
                           MAX_TRANSITION_MS};
  }
  return Status::Ok();
}

std::vector<std::string>
build_trim_nodes(const std::vector<KeepSegment> &segments,
                 bool last_by_duration) {
  std::vector<std::string> nodes;
  nodes.reserve(segments.size() * 2);

  for (std::size_t i = 0; i < segments.size(); ++i) {
    const KeepSegment &seg = segments[i];
    std::string start = format_seconds(seg.start_ms);

    std::string bound;
    if (last_by_duration && i + 1 == segments.size()) {
      bound = fmt::format("duration={}", format_seconds(seg.duration_ms()));
    } else {
      bound = fmt::format("end={}", format_seconds(seg.end_ms));
    }

    nodes.push_back(fmt::format(
        "[0:v]trim=start={}:{},setpts=PTS-STARTPTS[v{}]", start, bound, i));
    nodes.push_back(fmt::format(
        "[0:a]atrim=start={}:{},asetpts=PTS-STARTPTS[a{}]", start, bound, i));
  }
  return nodes;
}

Result<FilterGraph> compile_concat(const std::vector<KeepSegment> &segments,
                                   const TrimOptions &options) {
  if (segments.empty()) {
    return InvalidPlan{"cannot compile an empty segment list"};
  }

  FilterGraph graph;
  graph.nodes = build_trim_nodes(segments, options.last_segment_by_duration);

  std::string v_labels;
  std::string a_labels;
  for (std::size_t i = 0; i < segments.size(); ++i) {
    v_labels += fmt::format("[v{}]", i);
    a_labels += fmt::format("[a{}]", i);
  }

  graph.nodes.push_back(
      fmt::format("{}concat=n={}:v=1:a=0[vout]", v_labels, segments.size()));
  graph.nodes.push_back(
      fmt::format("{}concat=n={}:v=0:a=1[aout]", a_labels, segments.size()));
  graph.video_out = "[vout]";
  graph.audio_out = "[aout]";
  return graph;
}

Result<CrossfadeFold>
fold_crossfade_chain(const std::vector<KeepSegment> &segments,
                     const TransitionConfig &transition) {
  Status valid = validate_transition(transition);
  if (!valid)
    return valid.error();

  if (segments.empty()) {
    return InvalidPlan{"cannot fold an empty segment list"};
  }

  /// Every segment takes part in at least one fade
  for (std::size_t i = 0; i < segments.size(); ++i) {
    const TimeMs len = segments[i].duration_ms();
    const bool video_short = len < transition.duration_ms;
    if (video_short || len < transition.audio_fade_ms) {
      InvalidDuration bad{video_short ? "durationMs" : "audioFadeMs",
                          video_short ? transition.duration_ms
                                      : transition.audio_fade_ms,
                          MAX_TRANSITION_MS};
      bad.segment_index = static_cast<long>(i);
      bad.segment_ms = len;
      return bad;
    }
  }

  const TimeMs d = transition.duration_ms;
  const std::string video_d = format_seconds(d);
  const std::string audio_d = format_seconds(transition.audio_fade_ms);

  CrossfadeFold fold;
  fold.nodes.reserve((segments.size() - 1) * 2);
  fold.fade_offsets_ms.reserve(segments.size() - 1);
  fold.video_out = "[v0]";
  fold.audio_out = "[a0]";

  /// Length of the output timeline emitted so far
  TimeMs offset = segments[0].duration_ms();

  for (std::size_t i = 1; i < segments.size(); ++i) {
    const TimeMs fade_offset = offset - d;

    std::string v_next = fmt::format("[vx{}]", i);
    std::string a_next = fmt::format("[ax{}]", i);

    fold.nodes.push_back(fmt::format(
        "{}[v{}]xfade=transition=fade:duration={}:offset={}{}",
        fold.video_out, i, video_d, format_seconds(fade_offset), v_next));
    ++fold.video_joins;

    fold.nodes.push_back(fmt::format("{}[a{}]acrossfade=d={}{}",
                                     fold.audio_out, i, audio_d, a_next));
    ++fold.audio_joins;

    fold.fade_offsets_ms.push_back(fade_offset);
    offset += segments[i].duration_ms() - d;
    fold.video_out = std::move(v_next);
    fold.audio_out = std::move(a_next);
  }

  fold.timeline_ms = offset;
  return fold;
}

Result<FilterGraph> compile_crossfade(const std::vector<KeepSegment> &segments,
                                      const TransitionConfig &transition) {
  /// A single segment has no join; it belongs to concatenation mode
  if (segments.size() < 2) {
    return InvalidPlan{"crossfade needs at least two keep segments",
                       segments.size(), segments.size(), -1};
  }

  auto fold = fold_crossfade_chain(segments, transition);
  if (!fold)
    return fold.error();

  FilterGraph graph;
  graph.nodes = build_trim_nodes(segments, false);
  graph.nodes.insert(graph.nodes.end(), fold.value().nodes.begin(),
                     fold.value().nodes.end());
  graph.video_out = fold.value().video_out;
  graph.audio_out = fold.value().audio_out;
  return graph;
}

std::string to_filter_complex(const FilterGraph &graph) {
  std::string out;
  for (std::size_t i = 0; i < graph.nodes.size(); ++i) {
    if (i > 0)
      out += ';';
    out += graph.nodes[i];
  }
  return out;
}

} // namespace cut_render
