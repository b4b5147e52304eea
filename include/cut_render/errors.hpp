/**
 * @file errors.hpp
 * @brief Error taxonomy and Result/Status return types
 *
 * @details Every failure of a render attempt is one of six tagged payloads,
 *          held in the Error variant:
 *
 *          - InvalidPlan, InvalidDuration      (configuration)
 *
 *          - CodecExecutionFailed, ProbeFailed (execution)
 *
 *          - DurationMismatch, SyncDriftExceeded (quality gate)
 *
 *          Operations return Result<T> (value or Error) or Status (ok or
 *          Error). All errors are terminal for the current attempt.
 */

#ifndef CUT_RENDER_ERRORS_HPP
#define CUT_RENDER_ERRORS_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

#include "types.hpp"

namespace cut_render {

// **----- PAYLOADS -----**

/// Empty or corrupt keep list
struct InvalidPlan {
  std::string reason;
  std::size_t total_cuts = 0;  //< Entries in the plan (keep + cut)
  std::size_t keep_count = 0;  //< Keep entries seen so far
  long entry_index = -1;       //< Offending plan entry (-1 = whole plan)
};

/// Transition duration outside (0, 5000] ms, non-positive audio fade, or a
/// fade longer than the keep segment it overlaps
struct InvalidDuration {
  std::string field; //< "durationMs" or "audioFadeMs"
  TimeMs value_ms = 0;
  TimeMs max_ms = MAX_TRANSITION_MS;
  long segment_index = -1; //< Too-short keep segment (-1 = config only)
  TimeMs segment_ms = 0;
};

/// External encode process failed, was cancelled or timed out
struct CodecExecutionFailed {
  std::string output_path;
  int exit_code = -1;
  std::string stderr_text; //< Captured tail of the process stderr
  bool cancelled = false;
  bool timed_out = false;
};

/// External inspection failed
struct ProbeFailed {
  std::string path;
  std::string reason;
};

/// Measured output duration outside the mode's tolerance
struct DurationMismatch {
  double expected_sec = 0;
  double actual_sec = 0;
  double diff_sec = 0;
  double tolerance_sec = 0;
  RenderMode mode = RenderMode::kHardCut;
  std::size_t segment_count = 0;
};

/// A/V drift above the fixed budget
struct SyncDriftExceeded {
  double max_drift_ms = 0;
  double budget_ms = 0;
  RenderMode mode = RenderMode::kHardCut;
  DriftReport report;
};

using Error = std::variant<InvalidPlan, InvalidDuration, CodecExecutionFailed,
                           ProbeFailed, DurationMismatch, SyncDriftExceeded>;

template <typename E> struct is_error_payload : std::false_type {};
template <> struct is_error_payload<InvalidPlan> : std::true_type {};
template <> struct is_error_payload<InvalidDuration> : std::true_type {};
template <> struct is_error_payload<CodecExecutionFailed> : std::true_type {};
template <> struct is_error_payload<ProbeFailed> : std::true_type {};
template <> struct is_error_payload<DurationMismatch> : std::true_type {};
template <> struct is_error_payload<SyncDriftExceeded> : std::true_type {};

/**
 * @brief Diagnostic category of an error.
 * @note Configuration: fix the plan/config. Execution: retry or escalate.
 *       Quality gate: source material or encoder issue.
 */
enum class ErrorCategory { kConfiguration, kExecution, kQualityGate };

ErrorCategory category(const Error &error);

const char *to_string(ErrorCategory cat);

/// Stable upper-case identifier, e.g. "DURATION_MISMATCH"
const char *error_type(const Error &error);

/// One-line human readable diagnostic with the payload values
std::string describe(const Error &error);

// **----- RESULT TYPES -----**

/**
 * @class Result
 * @brief Either a value of type T or an Error.
 */
template <typename T> class Result {
public:
  Result(T value) : data_(std::move(value)) {}
  Result(Error error) : data_(std::move(error)) {}

  template <typename E,
            typename = std::enable_if_t<is_error_payload<std::decay_t<E>>::value>>
  Result(E &&payload) : data_(Error(std::forward<E>(payload))) {}

  bool ok() const { return data_.index() == 0; }
  explicit operator bool() const { return ok(); }

  const T &value() const { return std::get<0>(data_); }
  T &value() { return std::get<0>(data_); }

  const Error &error() const { return std::get<1>(data_); }

private:
  std::variant<T, Error> data_;
};

/**
 * @class Status
 * @brief Success, or an Error.
 */
class Status {
public:
  Status() = default;
  Status(Error error) : error_(std::move(error)) {}

  template <typename E,
            typename = std::enable_if_t<is_error_payload<std::decay_t<E>>::value>>
  Status(E &&payload) : error_(Error(std::forward<E>(payload))) {}

  static Status Ok() { return Status(); }

  bool ok() const { return !error_.has_value(); }
  explicit operator bool() const { return ok(); }

  const Error &error() const { return *error_; }

private:
  std::optional<Error> error_;
};

} // namespace cut_render

#endif // CUT_RENDER_ERRORS_HPP
