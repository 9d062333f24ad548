/**
 * @file test_timing_planner.cpp
 * @brief Window allocation, loop policy and input rejection
 */

#include <gtest/gtest.h>

#include <optional>
#include <string>
#include <vector>

#include "loopweave/errors.hpp"
#include "loopweave/timing_planner.hpp"

namespace loopweave {
namespace {

std::vector<OverlaySegment> make_segments(
    const std::vector<std::optional<double>> &durations) {
  std::vector<OverlaySegment> out;
  for (size_t i = 0; i < durations.size(); ++i) {
    OverlaySegment s;
    s.text = "Be still, and know " + std::to_string(i);
    s.requested_duration = durations[i];
    s.sequence_index = static_cast<int>(i);
    out.push_back(s);
  }
  return out;
}

std::vector<RenderedOverlay> make_overlays(
    const std::vector<OverlaySegment> &segments, const Canvas &canvas) {
  std::vector<RenderedOverlay> out;
  for (const auto &s : segments) {
    out.push_back({"/tmp/overlay_" + std::to_string(s.sequence_index) + ".png",
                   canvas.width, canvas.height, s.sequence_index});
  }
  return out;
}

MediaAsset video(double duration) {
  return {"/media/background.mp4", MediaKind::Video, duration, 1920, 1080, 30};
}

MediaAsset audio(double duration) {
  return {"/media/music.mp3", MediaKind::Audio, duration, 0, 0, 0};
}

void expect_partition(const std::vector<WindowSpan> &w, double total) {
  ASSERT_FALSE(w.empty());
  EXPECT_EQ(w.front().start, 0.0);
  for (size_t i = 0; i < w.size(); ++i) {
    EXPECT_LT(w[i].start, w[i].end);
    if (i + 1 < w.size())
      EXPECT_EQ(w[i].end, w[i + 1].start) << "gap or overlap after window " << i;
  }
  EXPECT_EQ(w.back().end, total);
}

// **---- Window allocation ----**

TEST(TimingPlannerTest, EqualSplitOfSixtySeconds) {
  auto segs = make_segments({std::nullopt, std::nullopt, std::nullopt});
  auto w = TimingPlanner::allocate_windows(60.0, segs);

  ASSERT_EQ(w.size(), 3u);
  EXPECT_DOUBLE_EQ(w[0].start, 0.0);
  EXPECT_DOUBLE_EQ(w[0].end, 20.0);
  EXPECT_DOUBLE_EQ(w[1].end, 40.0);
  EXPECT_EQ(w[2].end, 60.0);
  expect_partition(w, 60.0);
}

TEST(TimingPlannerTest, ExplicitDurationAndEqualRemainder) {
  auto segs = make_segments({45.0, std::nullopt, std::nullopt});
  auto w = TimingPlanner::allocate_windows(60.0, segs);

  ASSERT_EQ(w.size(), 3u);
  EXPECT_DOUBLE_EQ(w[0].end, 45.0);
  EXPECT_DOUBLE_EQ(w[1].end - w[1].start, 7.5);
  EXPECT_DOUBLE_EQ(w[2].end - w[2].start, 7.5);
  EXPECT_EQ(w[2].end, 60.0);
}

TEST(TimingPlannerTest, LastWindowEndsExactlyAtTotal) {
  /// Thirds of a non-representable total accumulate rounding error
  for (double total : {10.0, 0.3, 7.77, 28800.0, 123.456}) {
    auto segs = make_segments(std::vector<std::optional<double>>(7));
    auto w = TimingPlanner::allocate_windows(total, segs);
    expect_partition(w, total);
  }
}

TEST(TimingPlannerTest, ManyWindowsForEightHours) {
  auto segs = make_segments(std::vector<std::optional<double>>(960));
  auto w = TimingPlanner::allocate_windows(28800.0, segs);
  ASSERT_EQ(w.size(), 960u);
  expect_partition(w, 28800.0);
}

TEST(TimingPlannerTest, AllExplicitMustSumToTotal) {
  EXPECT_NO_THROW(
      TimingPlanner::allocate_windows(60.0, make_segments({30.0, 30.0})));
  EXPECT_THROW(
      TimingPlanner::allocate_windows(60.0, make_segments({30.0, 20.0})),
      InputError);
}

TEST(TimingPlannerTest, ExplicitDurationsLeavingNoRoomAreRejected) {
  EXPECT_THROW(TimingPlanner::allocate_windows(
                   60.0, make_segments({60.0, std::nullopt})),
               InputError);
  EXPECT_THROW(TimingPlanner::allocate_windows(
                   60.0, make_segments({70.0, std::nullopt})),
               InputError);
}

// **---- Validation ----**

TEST(TimingPlannerTest, RejectsZeroDuration) {
  auto segs = make_segments({std::nullopt});
  EXPECT_THROW(TimingPlanner::validate(0.0, Canvas{}, segs), InputError);
  EXPECT_THROW(TimingPlanner::validate(-5.0, Canvas{}, segs), InputError);
}

TEST(TimingPlannerTest, RejectsEmptySegmentList) {
  try {
    TimingPlanner::validate(60.0, Canvas{}, {});
    FAIL() << "expected InputError";
  } catch (const InputError &e) {
    EXPECT_EQ(e.stage(), Stage::Input);
  }
}

TEST(TimingPlannerTest, RejectsBlankTextAndBadOrdering) {
  auto segs = make_segments({std::nullopt, std::nullopt});
  segs[1].text = "   ";
  EXPECT_THROW(TimingPlanner::validate(60.0, Canvas{}, segs), InputError);

  segs = make_segments({std::nullopt, std::nullopt});
  segs[1].sequence_index = 0;
  EXPECT_THROW(TimingPlanner::validate(60.0, Canvas{}, segs), InputError);
}

TEST(TimingPlannerTest, RejectsTextOfOnlyControlWhitespace) {
  auto segs = make_segments({std::nullopt, std::nullopt});
  for (const char *blank : {"\f", "\v", " \f\v\t "}) {
    segs[0].text = blank;
    EXPECT_THROW(TimingPlanner::validate(60.0, Canvas{}, segs), InputError)
        << "text of " << std::string(blank).size() << " blank chars";
    /// Nothing would be drawn for it either
    EXPECT_TRUE(is_blank(blank));
  }
}

TEST(TimingPlannerTest, RejectsNonPositiveRequestedDuration) {
  auto segs = make_segments({0.0, std::nullopt});
  EXPECT_THROW(TimingPlanner::validate(60.0, Canvas{}, segs), InputError);
}

TEST(TimingPlannerTest, RejectsOddCanvas) {
  auto segs = make_segments({std::nullopt});
  EXPECT_THROW(TimingPlanner::validate(60.0, Canvas{1921, 1080}, segs),
               InputError);
  EXPECT_NO_THROW(TimingPlanner::validate(60.0, Canvas{1080, 1080}, segs));
}

// **---- Loop policy ----**

TEST(TimingPlannerTest, LoopCount) {
  EXPECT_EQ(TimingPlanner::loop_count(10.0, 60.0), 6);
  EXPECT_EQ(TimingPlanner::loop_count(10.0, 61.0), 7);
  EXPECT_EQ(TimingPlanner::loop_count(90.0, 60.0), 1);
  EXPECT_EQ(TimingPlanner::loop_count(0.1, 0.3), 3);
}

TEST(TimingPlannerTest, TenSecondClipsLoopedSixTimes) {
  Canvas canvas;
  auto segs = make_segments({std::nullopt, std::nullopt, std::nullopt});
  Timeline tl = TimingPlanner::plan(60.0, canvas, 25, segs,
                                    make_overlays(segs, canvas), video(10.0),
                                    audio(10.0), std::nullopt, 1.0, 0.7);

  ASSERT_EQ(tl.windows.size(), 3u);
  EXPECT_DOUBLE_EQ(tl.windows[0].end, 20.0);
  EXPECT_DOUBLE_EQ(tl.windows[1].end, 40.0);
  EXPECT_EQ(tl.windows[2].end, 60.0);

  EXPECT_TRUE(tl.background.loop);
  EXPECT_EQ(tl.background.loop_count, 6);
  EXPECT_EQ(tl.music.mode, AudioMode::Loop);
  EXPECT_EQ(tl.music.loop_count, 6);
  EXPECT_FALSE(tl.narration.has_value());
}

TEST(TimingPlannerTest, ClipJustShorterThanTotalIsLooped) {
  /// 59.9s of picture in a 60s video still needs a second iteration
  Canvas canvas;
  auto segs = make_segments({std::nullopt, std::nullopt, std::nullopt});
  Timeline tl = TimingPlanner::plan(60.0, canvas, 25, segs,
                                    make_overlays(segs, canvas), video(59.9),
                                    audio(60.0), std::nullopt, 1.0, 0.7);

  EXPECT_TRUE(tl.background.loop);
  EXPECT_EQ(tl.background.loop_count, 2);
  EXPECT_DOUBLE_EQ(tl.background.source.duration, 59.9);
}

TEST(TimingPlannerTest, LongSourcesAreTrimmedNotLooped) {
  Canvas canvas;
  auto segs = make_segments({std::nullopt});
  Timeline tl = TimingPlanner::plan(60.0, canvas, 25, segs,
                                    make_overlays(segs, canvas), video(300.0),
                                    audio(60.0), std::nullopt, 1.0, 0.7);

  EXPECT_FALSE(tl.background.loop);
  EXPECT_EQ(tl.background.loop_count, 1);
  EXPECT_EQ(tl.music.mode, AudioMode::Exact);

  tl = TimingPlanner::plan(60.0, canvas, 25, segs, make_overlays(segs, canvas),
                           video(300.0), audio(200.0), std::nullopt, 1.0, 0.7);
  EXPECT_EQ(tl.music.mode, AudioMode::Trim);
}

TEST(TimingPlannerTest, EveryVisualInputGetsAScaleStep) {
  Canvas canvas{1080, 1080};
  auto segs = make_segments({std::nullopt, std::nullopt});
  Timeline tl = TimingPlanner::plan(60.0, canvas, 25, segs,
                                    make_overlays(segs, canvas), video(10.0),
                                    audio(10.0), std::nullopt, 1.0, 0.7);

  ASSERT_EQ(tl.scale_steps.size(), 3u);
  EXPECT_EQ(tl.scale_steps[0].mode, ScaleMode::Letterbox);
  for (const auto &step : tl.scale_steps) {
    EXPECT_EQ(step.width, 1080);
    EXPECT_EQ(step.height, 1080);
  }
}

TEST(TimingPlannerTest, NarrationKeepsItsGain) {
  Canvas canvas;
  auto segs = make_segments({std::nullopt});
  MediaAsset narration = audio(40.0);
  narration.path = "/media/narration.mp3";
  Timeline tl = TimingPlanner::plan(60.0, canvas, 25, segs,
                                    make_overlays(segs, canvas), video(10.0),
                                    audio(10.0), narration, 0.3, 0.7);

  ASSERT_TRUE(tl.narration.has_value());
  EXPECT_DOUBLE_EQ(tl.narration->gain, 0.7);
  EXPECT_DOUBLE_EQ(tl.music.gain, 0.3);
}

TEST(TimingPlannerTest, RejectsAssetWithoutDuration) {
  Canvas canvas;
  auto segs = make_segments({std::nullopt});
  EXPECT_THROW(TimingPlanner::plan(60.0, canvas, 25, segs,
                                   make_overlays(segs, canvas), video(0.0),
                                   audio(10.0), std::nullopt, 1.0, 0.7),
               InputError);
}

TEST(TimingPlannerTest, RejectsOverlayCountMismatch) {
  Canvas canvas;
  auto segs = make_segments({std::nullopt, std::nullopt});
  auto overlays = make_overlays(segs, canvas);
  overlays.pop_back();
  EXPECT_THROW(TimingPlanner::plan(60.0, canvas, 25, segs, overlays,
                                   video(10.0), audio(10.0), std::nullopt, 1.0,
                                   0.7),
               InputError);
}

} // namespace
} // namespace loopweave
