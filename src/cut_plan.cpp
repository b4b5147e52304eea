/**
 * @file cut_plan.cpp
 * @brief Cut plan JSON loading implementation
 */

#include "cut_render/cut_plan.hpp"

#include <fstream>
#include <iterator>
#include <utility>

#include <fmt/core.h>
#include <nlohmann/json.hpp>

#include "cut_render/logging.hpp"
#include "cut_render/timecode.hpp"

namespace cut_render {

using json = nlohmann::json;

namespace {

/// Timestamps arrive as "12.5" from the planner, occasionally as 12.5
bool read_timestamp(const json &entry, const char *key, std::string &out) {
  auto it = entry.find(key);
  if (it == entry.end())
    return false;
  if (it->is_string()) {
    out = it->get<std::string>();
    return true;
  }
  if (it->is_number()) {
    auto ms = seconds_to_ms(it->get<double>());
    if (!ms)
      return false;
    out = format_seconds(*ms);
    return true;
  }
  return false;
}

/// Optional top-level string; absent reads as empty, any other type fails
bool read_string_field(const json &root, const char *key, std::string &out) {
  auto it = root.find(key);
  if (it == root.end() || it->is_null())
    return true;
  if (!it->is_string())
    return false;
  out = it->get<std::string>();
  return true;
}

} // anonymous namespace

Result<CutPlan> parse_cut_plan(const std::string &json_text) {
  json root;
  try {
    root = json::parse(json_text);
  } catch (const json::parse_error &e) {
    return InvalidPlan{fmt::format("malformed JSON: {}", e.what())};
  }

  if (!root.is_object()) {
    return InvalidPlan{"cut plan must be a JSON object"};
  }

  auto cuts = root.find("cuts");
  if (cuts == root.end() || !cuts->is_array()) {
    return InvalidPlan{"cut plan has no \"cuts\" array"};
  }

  CutPlan plan;
  for (auto field : {std::make_pair("schemaVersion", &plan.schema_version),
                     std::make_pair("source", &plan.source),
                     std::make_pair("output", &plan.output)}) {
    if (!read_string_field(root, field.first, *field.second)) {
      return InvalidPlan{
          fmt::format("cut plan \"{}\" must be a string", field.first)};
    }
  }
  plan.cuts.reserve(cuts->size());

  std::size_t keeps = 0;
  for (std::size_t i = 0; i < cuts->size(); ++i) {
    const json &entry = (*cuts)[i];
    InvalidPlan bad{"", cuts->size(), keeps, static_cast<long>(i)};

    if (!entry.is_object()) {
      bad.reason = "cut entry is not an object";
      return bad;
    }

    CutEntry cut;
    if (!read_timestamp(entry, "start", cut.start) ||
        !read_timestamp(entry, "end", cut.end)) {
      bad.reason = "cut entry needs string or numeric \"start\" and \"end\"";
      return bad;
    }

    auto type = entry.find("type");
    if (type == entry.end() || !type->is_string()) {
      bad.reason = "cut entry has no \"type\"";
      return bad;
    }
    cut.type = type->get<std::string>();
    if (cut.type != "keep" && cut.type != "cut") {
      bad.reason = fmt::format("unknown cut type \"{}\"", cut.type);
      return bad;
    }

    auto reason = entry.find("reason");
    if (reason != entry.end() && reason->is_string()) {
      cut.reason = reason->get<std::string>();
    }

    auto confidence = entry.find("confidence");
    if (confidence != entry.end() && confidence->is_number()) {
      cut.confidence = confidence->get<double>();
    }

    if (cut.is_keep())
      ++keeps;
    plan.cuts.push_back(std::move(cut));
  }

  return plan;
}

Result<CutPlan> load_cut_plan(const std::string &path) {
  std::ifstream in(path);
  if (!in) {
    LOG_ERROR("Failed to open cut plan: {}", path);
    return InvalidPlan{fmt::format("cannot open cut plan {}", path)};
  }

  std::string text((std::istreambuf_iterator<char>(in)),
                   std::istreambuf_iterator<char>());

  /// Strip a UTF-8 byte order mark
  if (text.size() >= 3 && static_cast<unsigned char>(text[0]) == 0xEF &&
      static_cast<unsigned char>(text[1]) == 0xBB &&
      static_cast<unsigned char>(text[2]) == 0xBF) {
    text.erase(0, 3);
  }

  return parse_cut_plan(text);
}

} // namespace cut_render
