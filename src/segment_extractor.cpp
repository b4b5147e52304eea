/**
 * @file segment_extractor.cpp
 * @brief Keep segment extraction implementation
 */

#include "cut_render/segment_extractor.hpp"

#include <fmt/core.h>

#include "cut_render/timecode.hpp"

namespace cut_render {

namespace {

/// Ordering and overlap check of `seg` against its predecessor
bool follows(const KeepSegment &prev, const KeepSegment &seg,
             std::string &reason) {
  if (seg.start_ms < prev.start_ms) {
    reason = fmt::format("keep starting at {}s precedes previous keep at {}s",
                         format_seconds(seg.start_ms),
                         format_seconds(prev.start_ms));
    return false;
  }
  if (seg.start_ms < prev.end_ms) {
    reason = fmt::format("keep {}s-{}s overlaps previous keep ending at {}s",
                         format_seconds(seg.start_ms),
                         format_seconds(seg.end_ms),
                         format_seconds(prev.end_ms));
    return false;
  }
  return true;
}

} // anonymous namespace

Result<std::vector<KeepSegment>> extract_keep_segments(const CutPlan &plan) {
  std::vector<KeepSegment> segments;
  segments.reserve(plan.cuts.size());

  for (std::size_t i = 0; i < plan.cuts.size(); ++i) {
    const CutEntry &cut = plan.cuts[i];
    if (!cut.is_keep())
      continue;

    InvalidPlan bad{"", plan.cuts.size(), segments.size(),
                    static_cast<long>(i)};

    auto start = parse_seconds(cut.start);
    auto end = parse_seconds(cut.end);
    if (!start || !end) {
      bad.reason = fmt::format("unparseable timestamp \"{}\"-\"{}\"",
                               cut.start, cut.end);
      return bad;
    }

    KeepSegment seg{*start, *end};
    if (seg.end_ms <= seg.start_ms) {
      bad.reason = fmt::format("keep {}s-{}s has end <= start",
                               format_seconds(seg.start_ms),
                               format_seconds(seg.end_ms));
      return bad;
    }

    if (!segments.empty() && !follows(segments.back(), seg, bad.reason)) {
      return bad;
    }

    segments.push_back(seg);
  }

  if (segments.empty()) {
    return InvalidPlan{"no keep segments found in cut plan", plan.cuts.size(),
                       0, -1};
  }

  return segments;
}

Status check_keep_segments(const std::vector<KeepSegment> &segments) {
  if (segments.empty()) {
    return InvalidPlan{"no keep segments to render"};
  }

  for (std::size_t i = 0; i < segments.size(); ++i) {
    InvalidPlan bad{"", segments.size(), i, static_cast<long>(i)};
    const KeepSegment &seg = segments[i];
    if (seg.start_ms < 0 || seg.end_ms <= seg.start_ms) {
      bad.reason = fmt::format("keep {}s-{}s is empty or negative",
                               format_seconds(seg.start_ms),
                               format_seconds(seg.end_ms));
      return bad;
    }
    if (i > 0 && !follows(segments[i - 1], seg, bad.reason)) {
      return bad;
    }
  }
  return Status::Ok();
}

} // namespace cut_render
