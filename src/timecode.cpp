/**
 * @file timecode.cpp
 * @brief Decimal-seconds parsing and formatting
 */

#include "cut_render/timecode.hpp"

#include <cmath>

#include <fmt/core.h>

namespace cut_render {

namespace {

/// More whole-second digits than this cannot be a real recording
constexpr std::size_t MAX_WHOLE_DIGITS = 12;

inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

} // anonymous namespace

std::optional<TimeMs> parse_seconds(const std::string &text) {
  if (text.empty())
    return std::nullopt;

  std::size_t pos = 0;
  TimeMs whole = 0;
  std::size_t whole_digits = 0;

  while (pos < text.size() && is_digit(text[pos])) {
    if (++whole_digits > MAX_WHOLE_DIGITS)
      return std::nullopt;
    whole = whole * 10 + (text[pos] - '0');
    ++pos;
  }

  TimeMs frac_ms = 0;
  std::size_t frac_digits = 0;
  bool round_up = false;

  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    while (pos < text.size() && is_digit(text[pos])) {
      int d = text[pos] - '0';
      if (frac_digits < 3) {
        frac_ms = frac_ms * 10 + d;
      } else if (frac_digits == 3) {
        round_up = (d >= 5);
      }
      ++frac_digits;
      ++pos;
    }
  }

  /// Trailing garbage, or no digits at all
  if (pos != text.size() || (whole_digits == 0 && frac_digits == 0))
    return std::nullopt;

  /// Scale "1.5" -> 500, "1.25" -> 250
  for (std::size_t i = frac_digits; i < 3; ++i) {
    frac_ms *= 10;
  }

  TimeMs ms = whole * 1000 + frac_ms;
  if (round_up)
    ++ms;
  return ms;
}

std::optional<TimeMs> seconds_to_ms(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0)
    return std::nullopt;
  return static_cast<TimeMs>(std::llround(seconds * 1000.0));
}

std::string format_seconds(TimeMs ms) {
  if (ms < 0) {
    return fmt::format("-{}", format_seconds(-ms));
  }
  return fmt::format("{}.{:03d}", ms / 1000, static_cast<int>(ms % 1000));
}

} // namespace cut_render
