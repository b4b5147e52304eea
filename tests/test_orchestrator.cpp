// Orchestration tests against fake codec engine and prober.

#include "cut_render/orchestrator.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <variant>
#include <vector>

#include <gtest/gtest.h>

#include "cut_render/graph_compiler.hpp"
#include "cut_render/logging.hpp"
#include "fixtures/fake_media.hpp"

using namespace cut_render;
using cut_render::fakes::FakeCodecEngine;
using cut_render::fakes::FakeMediaProber;

namespace {

class ComposerTest : public ::testing::Test {
protected:
  FakeCodecEngine engine;
  FakeMediaProber prober;
  CancellationToken cancel;
  RenderConfig config;
  std::string out_dir;

  void SetUp() override
  {
    out_dir = ::testing::TempDir() + "cut_render_compose_" +
              ::testing::UnitTest::GetInstance()->current_test_info()->name();
    prober.durations[BASE_OUTPUT_NAME] = 20.0;
    prober.durations[TRANSITION_OUTPUT_NAME] = 19.5;
    config.transition_duration_ms = 500;
    config.audio_fade_ms = 500;
  }

  void TearDown() override
  {
    std::error_code ec;
    std::filesystem::remove_all(out_dir, ec);
  }

  Result<ComposeResult> run(const std::vector<KeepSegment> &segments)
  {
    Composer composer(engine, prober, "test");
    return composer.compose("/media/source.mp4", segments, config, out_dir,
                            cancel);
  }

  static std::vector<KeepSegment> two_segments()
  {
    return {{0, 10000}, {15000, 25000}};
  }
};

} // namespace

// **---- Render state ----**

TEST(RenderStateTest, SelectionIsPureOverCountAndFlag)
{
  EXPECT_EQ(select_render_state(1, false), RenderState::kSingleSegment);
  EXPECT_EQ(select_render_state(1, true), RenderState::kSingleSegment);
  EXPECT_EQ(select_render_state(2, false), RenderState::kMultiSegmentHardCut);
  EXPECT_EQ(select_render_state(2, true),
            RenderState::kMultiSegmentWithTransitions);
  EXPECT_EQ(select_render_state(40, true),
            RenderState::kMultiSegmentWithTransitions);

  EXPECT_STREQ(to_string(RenderState::kSingleSegment), "SINGLE_SEGMENT");
  EXPECT_STREQ(to_string(RenderState::kMultiSegmentHardCut),
               "MULTI_SEGMENT_HARD_CUT");
  EXPECT_STREQ(to_string(RenderState::kMultiSegmentWithTransitions),
               "MULTI_SEGMENT_WITH_TRANSITIONS");
}

// **---- Compose ----**

TEST_F(ComposerTest, SingleSegmentWithTransitionsProducesBaseOnly)
{
  config.transitions_enabled = true;
  prober.durations[BASE_OUTPUT_NAME] = 5.0;

  auto result = run({{0, 5000}});
  ASSERT_TRUE(result.ok()) << describe(result.error());

  EXPECT_EQ(result.value().state, RenderState::kSingleSegment);
  EXPECT_FALSE(result.value().transitioned.has_value());
  EXPECT_FALSE(result.value().transition_graph.has_value());
  EXPECT_FALSE(result.value().base.transition.has_value());
  EXPECT_FALSE(result.value().primary().transition.has_value());
  ASSERT_EQ(engine.jobs.size(), 1u);
  EXPECT_EQ(std::filesystem::path(engine.jobs[0].output_path).filename().string(),
            BASE_OUTPUT_NAME);
}

TEST_F(ComposerTest, HardCutOnlyWhenTransitionsDisabled)
{
  auto result = run(two_segments());
  ASSERT_TRUE(result.ok()) << describe(result.error());

  EXPECT_EQ(result.value().state, RenderState::kMultiSegmentHardCut);
  EXPECT_FALSE(result.value().transitioned.has_value());
  ASSERT_EQ(engine.jobs.size(), 1u);
  EXPECT_EQ(engine.jobs[0].source_path, "/media/source.mp4");
  EXPECT_EQ(engine.jobs[0].graph, result.value().base_graph);
  EXPECT_EQ(prober.drift_requests[BASE_OUTPUT_NAME],
            (std::vector<TimeMs>{10000}));
}

TEST_F(ComposerTest, TransitionsProduceBothArtifacts)
{
  config.transitions_enabled = true;

  auto result = run(two_segments());
  ASSERT_TRUE(result.ok()) << describe(result.error());

  const ComposeResult &r = result.value();
  EXPECT_EQ(r.state, RenderState::kMultiSegmentWithTransitions);
  ASSERT_EQ(engine.jobs.size(), 2u);

  EXPECT_FALSE(r.base.transition.has_value());
  EXPECT_DOUBLE_EQ(r.base.duration_sec, 20.0);
  EXPECT_EQ(r.base.resolution, "1920x1080");
  EXPECT_EQ(r.base.frame_rate, "30/1");
  EXPECT_EQ(r.base.codec, "h264");

  ASSERT_TRUE(r.transitioned.has_value());
  ASSERT_TRUE(r.transitioned->transition.has_value());
  EXPECT_EQ(r.transitioned->transition->type, "crossfade");
  EXPECT_EQ(r.transitioned->transition->duration_ms, 500);
  EXPECT_EQ(r.transitioned->transition->audio_fade_ms, 500);
  EXPECT_DOUBLE_EQ(r.transitioned->duration_sec, 19.5);
  EXPECT_EQ(&r.primary(), &*r.transitioned);

  ASSERT_TRUE(r.transition_graph.has_value());
  EXPECT_EQ(r.transition_graph->video_out, "[vx1]");
  EXPECT_EQ(prober.drift_requests[TRANSITION_OUTPUT_NAME],
            (std::vector<TimeMs>{9500}));
}

TEST_F(ComposerTest, RecordsStageTimings)
{
#if !ENABLE_TIMING
  GTEST_SKIP() << "timing macros compiled out";
#endif
  config.transitions_enabled = true;
  TimingCollector::clear();

  ASSERT_TRUE(run(two_segments()).ok());

  std::vector<std::string> names;
  for (const TimingEntry &entry : TimingCollector::snapshot())
    names.push_back(entry.name);

  // One compile and compose, then encode/probe/validate per artifact
  auto count = [&names](const std::string &name) {
    return std::count(names.begin(), names.end(), name);
  };
  EXPECT_EQ(count("compile"), 1);
  EXPECT_EQ(count("encode"), 2);
  EXPECT_EQ(count("probe"), 2);
  EXPECT_EQ(count("validate"), 2);
  EXPECT_EQ(count("compose"), 1);
  EXPECT_EQ(names.back(), "compose");

  TimingCollector::clear();
  EXPECT_TRUE(TimingCollector::snapshot().empty());
}

TEST_F(ComposerTest, GraphsAreIdenticalAcrossRuns)
{
  config.transitions_enabled = true;
  auto first = run(two_segments());
  auto second = run(two_segments());
  ASSERT_TRUE(first.ok());
  ASSERT_TRUE(second.ok());
  EXPECT_EQ(first.value().base_graph, second.value().base_graph);
  EXPECT_EQ(*first.value().transition_graph, *second.value().transition_graph);
}

TEST_F(ComposerTest, EmptySegmentsIsInvalidPlan)
{
  auto result = run({});
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<InvalidPlan>(result.error()));
  EXPECT_TRUE(engine.jobs.empty());
}

TEST_F(ComposerTest, InvalidTransitionFailsBeforeAnyEncode)
{
  config.transitions_enabled = true;
  config.transition_duration_ms = 6000;

  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<InvalidDuration>(result.error()));
  EXPECT_TRUE(engine.jobs.empty());
}

TEST_F(ComposerTest, SegmentShorterThanFadeFailsBeforeAnyEncode)
{
  config.transitions_enabled = true;
  config.transition_duration_ms = 1000;

  auto result = run({{0, 10000}, {12000, 12400}});
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(std::get<InvalidDuration>(result.error()).segment_index, 1);
  EXPECT_EQ(category(result.error()), ErrorCategory::kConfiguration);
  EXPECT_TRUE(engine.jobs.empty());
}

TEST_F(ComposerTest, CodecFailureIsExecutionError)
{
  engine.fail_on = BASE_OUTPUT_NAME;

  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  const auto &f = std::get<CodecExecutionFailed>(result.error());
  EXPECT_EQ(f.stderr_text, "Error while filtering");
  EXPECT_EQ(category(result.error()), ErrorCategory::kExecution);
  EXPECT_TRUE(prober.probed.empty());
}

TEST_F(ComposerTest, TransitionedFailureFailsTheAttempt)
{
  config.transitions_enabled = true;
  engine.fail_on = TRANSITION_OUTPUT_NAME;

  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<CodecExecutionFailed>(result.error()));
  EXPECT_EQ(engine.jobs.size(), 2u);
}

TEST_F(ComposerTest, ProbeFailure)
{
  prober.fail_probe = true;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<ProbeFailed>(result.error()));
}

TEST_F(ComposerTest, MissingVideoStreamIsProbeFailure)
{
  prober.omit_video = true;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<ProbeFailed>(result.error()));
}

TEST_F(ComposerTest, DurationMismatchIsQualityGate)
{
  prober.durations[BASE_OUTPUT_NAME] = 21.0;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  const auto &m = std::get<DurationMismatch>(result.error());
  EXPECT_EQ(m.mode, RenderMode::kHardCut);
  EXPECT_EQ(m.segment_count, 2u);
  EXPECT_EQ(category(result.error()), ErrorCategory::kQualityGate);
}

TEST_F(ComposerTest, CrossfadeToleranceAcceptsLooseDuration)
{
  config.transitions_enabled = true;
  prober.durations[TRANSITION_OUTPUT_NAME] = 24.5;
  EXPECT_TRUE(run(two_segments()).ok());

  prober.durations[TRANSITION_OUTPUT_NAME] = 24.6;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_EQ(std::get<DurationMismatch>(result.error()).mode,
            RenderMode::kCrossfade);
}

TEST_F(ComposerTest, SyncDriftBoundary)
{
  prober.join_drift_ms = 50.0;
  EXPECT_TRUE(run(two_segments()).ok());

  prober.join_drift_ms = 51.0;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  const auto &e = std::get<SyncDriftExceeded>(result.error());
  EXPECT_DOUBLE_EQ(e.max_drift_ms, 51.0);
  EXPECT_EQ(e.report.measurements.size(), 1u);
}

TEST_F(ComposerTest, StartOffsetCountsTowardsDrift)
{
  prober.join_drift_ms = 5.0;
  prober.start_offset_ms = 80.0;
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::holds_alternative<SyncDriftExceeded>(result.error()));
}

TEST_F(ComposerTest, CancelledBeforeEncode)
{
  cancel.cancel();
  auto result = run(two_segments());
  ASSERT_FALSE(result.ok());
  EXPECT_TRUE(std::get<CodecExecutionFailed>(result.error()).cancelled);
  EXPECT_TRUE(engine.jobs.empty());
}
