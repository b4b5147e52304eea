/**
 * @file artifact_history.hpp
 * @brief Append-only render history for one job
 *
 * @details One JSON object per line. Three record kinds:
 *
 *          - "render":   a validated artifact and the settings it was
 *                        rendered with
 *
 *          - "pipeline": a short stage summary keyed by artifact
 *
 *          - "error":    a failed attempt with its category
 *
 *          Re-running a job appends new records; earlier lines are never
 *          rewritten.
 *
 * @attention Single writer per history file is the caller's guarantee.
 */

#ifndef CUT_RENDER_ARTIFACT_HISTORY_HPP
#define CUT_RENDER_ARTIFACT_HISTORY_HPP

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "config.hpp"
#include "errors.hpp"
#include "types.hpp"

namespace cut_render {

/**
 * @brief Current UTC time as ISO-8601 with milliseconds,
 *        e.g. "2024-05-01T12:00:00.000Z".
 */
std::string utc_timestamp();

/**
 * @brief Render record for an artifact (without the timestamp applied).
 */
nlohmann::json render_record(const RenderArtifact &artifact,
                             const RenderConfig &config);

/**
 * @brief Error record for a failed attempt (with structured details).
 */
nlohmann::json failure_record(const Error &error);

/**
 * @class ArtifactHistory
 * @brief JSON-lines history file.
 */
class ArtifactHistory {
  std::string path_;

  /// Append one record as a single line
  bool append(const nlohmann::json &record);

public:
  explicit ArtifactHistory(std::string path);

  const std::string &path() const { return path_; }

  /**
   * @brief Append a render record.
   * @return true on success
   */
  bool append_render(const RenderArtifact &artifact, const RenderConfig &config);

  /**
   * @brief Append an error record.
   * @return true on success
   */
  bool append_failure(const Error &error);

  /**
   * @brief Append a pipeline summary for an artifact.
   * @return true on success
   */
  bool append_pipeline_log(const std::string &key, const std::string &summary);

  /**
   * @brief Read every record in append order.
   * @note A missing file is an empty history. Unparseable lines are skipped
   *       with a warning.
   */
  std::vector<nlohmann::json> load() const;
};

} // namespace cut_render

#endif // CUT_RENDER_ARTIFACT_HISTORY_HPP
