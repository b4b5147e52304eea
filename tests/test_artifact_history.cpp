// Unit tests for the append-only JSON-lines render history.

#include "cut_render/artifact_history.hpp"

#include <cstdio>
#include <fstream>
#include <string>

#include <gtest/gtest.h>

using namespace cut_render;

namespace {

RenderArtifact base_artifact()
{
  RenderArtifact a;
  a.output_location = "/out/base_cuts.mp4";
  a.duration_sec = 20.0;
  a.resolution = "1920x1080";
  a.frame_rate = "30/1";
  a.codec = "h264";
  return a;
}

std::string history_path(const char *name)
{
  std::string path = ::testing::TempDir() + name;
  std::remove(path.c_str());
  return path;
}

} // namespace

TEST(ArtifactHistoryTest, RenderRecordFields)
{
  RenderConfig config;
  auto record = render_record(base_artifact(), config);
  EXPECT_EQ(record["kind"], "render");
  EXPECT_EQ(record["key"], "/out/base_cuts.mp4");
  EXPECT_EQ(record["type"], "preview");
  EXPECT_EQ(record["codec"], "h264");
  EXPECT_DOUBLE_EQ(record["durationSec"].get<double>(), 20.0);
  EXPECT_EQ(record["resolution"], "1920x1080");
  EXPECT_EQ(record["fps"], "30/1");
  EXPECT_EQ(record["notes"], "preset=fast,crf=20,no_transitions");
  EXPECT_FALSE(record.contains("transition"));
}

TEST(ArtifactHistoryTest, TransitionedRecordCarriesTransition)
{
  RenderArtifact a = base_artifact();
  a.output_location = "/out/with_transitions.mp4";
  a.transition = TransitionInfo{"crossfade", 500, 400};

  RenderConfig config;
  config.preset = "medium";
  config.crf = 23;
  auto record = render_record(a, config);
  EXPECT_EQ(record["notes"], "preset=medium,crf=23,with_transitions");
  ASSERT_TRUE(record.contains("transition"));
  EXPECT_EQ(record["transition"]["type"], "crossfade");
  EXPECT_EQ(record["transition"]["durationMs"], 500);
  EXPECT_EQ(record["transition"]["audioFadeMs"], 400);
}

TEST(ArtifactHistoryTest, FailureRecordHasCategory)
{
  DurationMismatch m;
  m.expected_sec = 19.5;
  m.actual_sec = 30.0;
  m.mode = RenderMode::kCrossfade;
  auto record = failure_record(m);
  EXPECT_EQ(record["kind"], "error");
  EXPECT_EQ(record["errorType"], "DURATION_MISMATCH");
  EXPECT_EQ(record["category"], "quality_gate");
  EXPECT_EQ(record["details"]["mode"], "crossfade");
  EXPECT_FALSE(record["message"].get<std::string>().empty());
}

TEST(ArtifactHistoryTest, AppendsInOrderAndNeverRewrites)
{
  std::string path = history_path("history_append.jsonl");
  ArtifactHistory history(path);
  RenderConfig config;

  ASSERT_TRUE(history.append_render(base_artifact(), config));
  ASSERT_TRUE(history.append_pipeline_log("/out/base_cuts.mp4",
                                          "Base cuts rendered (no transitions)"));

  // A re-run appends a second record for the same key
  ASSERT_TRUE(history.append_render(base_artifact(), config));
  ASSERT_TRUE(history.append_failure(ProbeFailed{"/out/x.mp4", "truncated"}));

  auto records = history.load();
  ASSERT_EQ(records.size(), 4u);
  EXPECT_EQ(records[0]["kind"], "render");
  EXPECT_TRUE(records[0].contains("renderedAt"));
  EXPECT_EQ(records[1]["kind"], "pipeline");
  EXPECT_EQ(records[1]["summary"], "Base cuts rendered (no transitions)");
  EXPECT_EQ(records[2]["key"], records[0]["key"]);
  EXPECT_EQ(records[3]["errorType"], "PROBE_FAILED");
  EXPECT_EQ(records[3]["category"], "execution");
  EXPECT_TRUE(records[3].contains("createdAt"));

  std::remove(path.c_str());
}

TEST(ArtifactHistoryTest, MissingFileIsEmpty)
{
  ArtifactHistory history(history_path("history_missing.jsonl"));
  EXPECT_TRUE(history.load().empty());
}

TEST(ArtifactHistoryTest, SkipsCorruptLines)
{
  std::string path = history_path("history_corrupt.jsonl");
  {
    std::ofstream out(path);
    out << "{\"kind\":\"render\",\"key\":\"a\"}\n"
        << "{not json\n"
        << "\n"
        << "{\"kind\":\"pipeline\",\"key\":\"a\"}\n";
  }
  ArtifactHistory history(path);
  auto records = history.load();
  ASSERT_EQ(records.size(), 2u);
  EXPECT_EQ(records[1]["kind"], "pipeline");
  std::remove(path.c_str());
}

TEST(ArtifactHistoryTest, TimestampFormat)
{
  std::string ts = utc_timestamp();
  ASSERT_EQ(ts.size(), 24u);
  EXPECT_EQ(ts[4], '-');
  EXPECT_EQ(ts[10], 'T');
  EXPECT_EQ(ts[19], '.');
  EXPECT_EQ(ts.back(), 'Z');
}
