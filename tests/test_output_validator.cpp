// Unit tests for the duration and A/V sync quality gates.

#include "cut_render/output_validator.hpp"

#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "cut_render/duration_estimator.hpp"

using namespace cut_render;

namespace {

DriftReport report_with_max(double max_ms)
{
  DriftReport report;
  JoinDrift low;
  low.join_index = 1;
  low.drift_ms = 12.0;
  JoinDrift high;
  high.join_index = 2;
  high.drift_ms = max_ms;
  report.measurements = {low, high};
  report.max_drift_ms = max_ms;
  return report;
}

} // namespace

TEST(OutputValidatorTest, ParseFrameRate)
{
  EXPECT_DOUBLE_EQ(parse_frame_rate("30/1", 25), 30.0);
  EXPECT_NEAR(parse_frame_rate("30000/1001", 25), 29.97, 0.001);
  EXPECT_DOUBLE_EQ(parse_frame_rate("24", 25), 24.0);
  EXPECT_DOUBLE_EQ(parse_frame_rate("0/0", 25), 25.0);
  EXPECT_DOUBLE_EQ(parse_frame_rate("abc", 25), 25.0);
  EXPECT_DOUBLE_EQ(parse_frame_rate("", 30), 30.0);
}

TEST(OutputValidatorTest, CrossfadeExampleWithinTolerance)
{
  std::vector<KeepSegment> segs = {{0, 10000}, {15000, 25000}};
  TimeMs expected = expected_duration_ms(segs, RenderMode::kCrossfade, 500);
  ASSERT_EQ(expected, 19500);

  for (double actual : {14.5, 17.0, 19.5, 22.0, 24.5}) {
    EXPECT_TRUE(
        validate_duration(actual, expected, RenderMode::kCrossfade, 30.0, 2)
            .ok())
        << actual;
  }
}

TEST(OutputValidatorTest, CrossfadeOutsideTolerance)
{
  Status s = validate_duration(24.6, 19500, RenderMode::kCrossfade, 30.0, 2);
  ASSERT_FALSE(s.ok());
  const auto &m = std::get<DurationMismatch>(s.error());
  EXPECT_DOUBLE_EQ(m.expected_sec, 19.5);
  EXPECT_DOUBLE_EQ(m.actual_sec, 24.6);
  EXPECT_DOUBLE_EQ(m.tolerance_sec, 5.0);
  EXPECT_NEAR(m.diff_sec, 5.1, 1e-9);
  EXPECT_EQ(m.mode, RenderMode::kCrossfade);
  EXPECT_EQ(m.segment_count, 2u);

  EXPECT_FALSE(
      validate_duration(14.4, 19500, RenderMode::kCrossfade, 30.0, 2).ok());
}

TEST(OutputValidatorTest, HardCutAllowsOneFrame)
{
  EXPECT_TRUE(validate_duration(20.03, 20000, RenderMode::kHardCut, 30.0, 2).ok());
  EXPECT_TRUE(validate_duration(19.97, 20000, RenderMode::kHardCut, 30.0, 2).ok());
  EXPECT_FALSE(validate_duration(20.1, 20000, RenderMode::kHardCut, 30.0, 2).ok());
}

TEST(OutputValidatorTest, DriftAtBudgetPasses)
{
  EXPECT_TRUE(validate_sync(report_with_max(50.0), RenderMode::kHardCut).ok());
  EXPECT_TRUE(validate_sync(report_with_max(0.0), RenderMode::kCrossfade).ok());
}

TEST(OutputValidatorTest, DriftAboveBudgetFails)
{
  Status s = validate_sync(report_with_max(51.0), RenderMode::kCrossfade);
  ASSERT_FALSE(s.ok());
  const auto &e = std::get<SyncDriftExceeded>(s.error());
  EXPECT_DOUBLE_EQ(e.max_drift_ms, 51.0);
  EXPECT_DOUBLE_EQ(e.budget_ms, SYNC_DRIFT_BUDGET_MS);
  EXPECT_EQ(e.mode, RenderMode::kCrossfade);
  ASSERT_EQ(e.report.measurements.size(), 2u);
  EXPECT_EQ(e.report.measurements[1].join_index, 2u);
}
