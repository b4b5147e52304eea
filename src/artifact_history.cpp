/**
 * @file artifact_history.cpp
 * @brief JSON-lines render history implementation
 */

#include "cut_render/artifact_history.hpp"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <system_error>
#include <type_traits>
#include <variant>

#include <fmt/chrono.h>
#include <fmt/core.h>

#include "cut_render/logging.hpp"

namespace cut_render {

namespace {

nlohmann::json drift_json(const DriftReport &report) {
  nlohmann::json joins = nlohmann::json::array();
  for (const auto &m : report.measurements) {
    joins.push_back({{"join", m.join_index},
                     {"outputTimeMs", m.output_time_ms},
                     {"videoPtsSec", m.video_pts_sec},
                     {"audioPtsSec", m.audio_pts_sec},
                     {"driftMs", m.drift_ms}});
  }
  return {{"startOffsetMs", report.start_offset_ms},
          {"maxDriftMs", report.max_drift_ms},
          {"joins", joins}};
}

nlohmann::json error_details(const Error &error) {
  return std::visit(
      [](const auto &e) -> nlohmann::json {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, InvalidPlan>) {
          return {{"reason", e.reason},
                  {"totalCuts", e.total_cuts},
                  {"keepCount", e.keep_count},
                  {"entryIndex", e.entry_index}};
        } else if constexpr (std::is_same_v<T, InvalidDuration>) {
          return {{"field", e.field},
                  {"valueMs", e.value_ms},
                  {"maxMs", e.max_ms},
                  {"segmentIndex", e.segment_index},
                  {"segmentMs", e.segment_ms}};
        } else if constexpr (std::is_same_v<T, CodecExecutionFailed>) {
          return {{"outputPath", e.output_path},
                  {"exitCode", e.exit_code},
                  {"stderr", e.stderr_text},
                  {"cancelled", e.cancelled},
                  {"timedOut", e.timed_out}};
        } else if constexpr (std::is_same_v<T, ProbeFailed>) {
          return {{"path", e.path}, {"reason", e.reason}};
        } else if constexpr (std::is_same_v<T, DurationMismatch>) {
          return {{"expectedSec", e.expected_sec},
                  {"actualSec", e.actual_sec},
                  {"diffSec", e.diff_sec},
                  {"toleranceSec", e.tolerance_sec},
                  {"mode", to_string(e.mode)},
                  {"segmentCount", e.segment_count}};
        } else {
          return {{"maxDriftMs", e.max_drift_ms},
                  {"budgetMs", e.budget_ms},
                  {"mode", to_string(e.mode)},
                  {"report", drift_json(e.report)}};
        }
      },
      error);
}

} // anonymous namespace

std::string utc_timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch()) %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03d}Z", fmt::gmtime(t),
                     static_cast<int>(ms.count()));
}

nlohmann::json render_record(const RenderArtifact &artifact,
                             const RenderConfig &config) {
  nlohmann::json record = {
      {"kind", "render"},
      {"key", artifact.output_location},
      {"type", "preview"},
      {"codec", artifact.codec},
      {"durationSec", artifact.duration_sec},
      {"resolution", artifact.resolution},
      {"fps", artifact.frame_rate},
      {"notes", fmt::format("preset={},crf={},{}", config.preset, config.crf,
                            artifact.transition ? "with_transitions"
                                                : "no_transitions")}};
  if (artifact.transition) {
    record["transition"] = {{"type", artifact.transition->type},
                            {"durationMs", artifact.transition->duration_ms},
                            {"audioFadeMs", artifact.transition->audio_fade_ms}};
  }
  return record;
}

nlohmann::json failure_record(const Error &error) {
  return {{"kind", "error"},
          {"errorType", error_type(error)},
          {"category", to_string(category(error))},
          {"message", describe(error)},
          {"details", error_details(error)}};
}

// **---- ArtifactHistory ----**

ArtifactHistory::ArtifactHistory(std::string path) : path_(std::move(path)) {}

bool ArtifactHistory::append(const nlohmann::json &record) {
  std::filesystem::path p(path_);
  if (p.has_parent_path()) {
    std::error_code ec;
    std::filesystem::create_directories(p.parent_path(), ec);
    if (ec) {
      LOG_ERROR("Cannot create history directory {}: {}",
                p.parent_path().string(), ec.message());
      return false;
    }
  }

  std::ofstream out(path_, std::ios::app);
  if (!out) {
    LOG_ERROR("Cannot open history file: {}", path_);
    return false;
  }
  out << record.dump() << '\n';
  out.flush();
  if (!out) {
    LOG_ERROR("Failed to write history file: {}", path_);
    return false;
  }
  return true;
}

bool ArtifactHistory::append_render(const RenderArtifact &artifact,
                                    const RenderConfig &config) {
  nlohmann::json record = render_record(artifact, config);
  record["renderedAt"] = utc_timestamp();
  return append(record);
}

bool ArtifactHistory::append_failure(const Error &error) {
  nlohmann::json record = failure_record(error);
  record["createdAt"] = utc_timestamp();
  return append(record);
}

bool ArtifactHistory::append_pipeline_log(const std::string &key,
                                          const std::string &summary) {
  return append({{"kind", "pipeline"},
                 {"key", key},
                 {"summary", summary},
                 {"createdAt", utc_timestamp()}});
}

std::vector<nlohmann::json> ArtifactHistory::load() const {
  std::vector<nlohmann::json> records;
  std::ifstream in(path_);
  if (!in)
    return records;

  std::string line;
  std::size_t line_no = 0;
  while (std::getline(in, line)) {
    ++line_no;
    if (line.empty())
      continue;
    try {
      records.push_back(nlohmann::json::parse(line));
    } catch (const nlohmann::json::exception &e) {
      LOG_WARN("Skipping unreadable history line {} in {}: {}", line_no, path_,
               e.what());
    }
  }
  return records;
}

} // namespace cut_render
