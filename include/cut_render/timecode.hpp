/**
 * @file timecode.hpp
 * @brief Conversion between decimal-seconds strings and TimeMs
 *
 * @details Cut plans carry timestamps as decimal strings ("12.345") and the
 *          codec engine expects decimal strings in its filter grammar. Both
 *          conversions go through integer milliseconds so that no floating
 *          point error accumulates in between.
 */

#ifndef CUT_RENDER_TIMECODE_HPP
#define CUT_RENDER_TIMECODE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace cut_render {

/**
 * @brief Parse a non-negative decimal-seconds string.
 *
 * @note Accepts "12", "12.", "12.3", ".5", "0012.3456". Digits beyond the
 *       millisecond are rounded half-up. Signs, exponents, whitespace and
 *       any other character are rejected.
 *
 * @param text Decimal seconds
 * @return Milliseconds, or std::nullopt if the text is malformed
 */
std::optional<TimeMs> parse_seconds(const std::string &text);

/**
 * @brief Convert floating-point seconds (e.g. a JSON number) to milliseconds.
 * @return Rounded milliseconds, or std::nullopt for negative/non-finite input
 */
std::optional<TimeMs> seconds_to_ms(double seconds);

/**
 * @brief Format milliseconds as seconds with exactly three decimals.
 * @note 9500 -> "9.500", 0 -> "0.000". Pure integer formatting.
 */
std::string format_seconds(TimeMs ms);

} // namespace cut_render

#endif // CUT_RENDER_TIMECODE_HPP
