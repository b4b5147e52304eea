/**
 * @file cut_plan.hpp
 * @brief Cut plan model and JSON loading
 *
 * @details A cut plan is produced by the external planner and has already
 *          passed schema validation. It is loaded here only far enough to
 *          hand it to the segment extractor.
 */

#ifndef CUT_RENDER_CUT_PLAN_HPP
#define CUT_RENDER_CUT_PLAN_HPP

#include <optional>
#include <string>
#include <vector>

#include "errors.hpp"

namespace cut_render {

/**
 * @struct CutEntry
 * @brief One planner decision over a source range.
 */
struct CutEntry {
  std::string start;  //< Decimal seconds
  std::string end;    //< Decimal seconds
  std::string type;   //< "keep" or "cut"
  std::string reason; //< Planner reason, free text
  std::optional<double> confidence; //< 0..1 when present

  bool is_keep() const { return type == "keep"; }
};

/**
 * @struct CutPlan
 * @brief Ordered planner output for one source video.
 */
struct CutPlan {
  std::string schema_version; //< Empty when the plan omits it
  std::string source;
  std::string output;
  std::vector<CutEntry> cuts;
};

/**
 * @brief Parse a cut plan from JSON text.
 *
 * @note "start" and "end" may be strings or numbers; numbers are rendered
 *       with millisecond precision.
 *
 * @return The plan, or InvalidPlan carrying the parse diagnostic
 */
Result<CutPlan> parse_cut_plan(const std::string &json_text);

/**
 * @brief Read and parse a cut plan file.
 * @return The plan, or InvalidPlan if the file is missing or malformed
 */
Result<CutPlan> load_cut_plan(const std::string &path);

} // namespace cut_render

#endif // CUT_RENDER_CUT_PLAN_HPP
