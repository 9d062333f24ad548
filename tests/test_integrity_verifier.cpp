/**
 * @file test_integrity_verifier.cpp
 * @brief Probe placement and the frozen/duplicated-frame verdict
 */

#include <gtest/gtest.h>

#include <algorithm>
#include <cmath>
#include <string>

#include "loopweave/integrity_verifier.hpp"

namespace loopweave {
namespace {

/// 60s at 25 fps, three 20s windows, background looped every period seconds
Timeline make_timeline(double period = 10.0, double total = 60.0) {
  Timeline tl;
  tl.total_duration = total;
  tl.fps = 25;
  const double third = total / 3.0;
  for (int i = 0; i < 3; ++i) {
    RenderedOverlay ov{"overlay.png", 1920, 1080, i};
    tl.windows.push_back({ov, i * third, i == 2 ? total : (i + 1) * third});
  }
  tl.background.source.path = "lake.mp4";
  tl.background.source.duration = period;
  tl.background.loop = period < total;
  return tl;
}

FrameSample sample(const Timeline &tl, int probe, double decoded,
                   const std::string &hash) {
  return {decoded,
          decoded,
          probe,
          loop_offset(tl, decoded),
          overlay_position(tl, decoded),
          hash};
}

bool has_point_near(const std::vector<double> &points, double t) {
  return std::any_of(points.begin(), points.end(),
                     [t](double p) { return std::fabs(p - t) < 1e-6; });
}

// ---------------------------------------------------------------------------
// Probe planning
// ---------------------------------------------------------------------------

TEST(ProbePlanTest, LoopBoundariesAndIterationMidpoints) {
  Timeline tl = make_timeline(10.0, 60.0);
  auto points = plan_probe_points(tl, VerifyOptions{});

  ASSERT_EQ(points.size(), 7u);
  for (double t : {5.0, 10.0, 20.0, 30.0, 40.0, 50.0, 55.0})
    EXPECT_TRUE(has_point_near(points, t)) << "missing probe at " << t;
  EXPECT_TRUE(std::is_sorted(points.begin(), points.end()));
}

TEST(ProbePlanTest, RespectsProbeCap) {
  Timeline tl = make_timeline(10.0, 60.0);
  VerifyOptions opt;
  opt.interval_sec = 1.0;
  auto points = plan_probe_points(tl, opt);

  EXPECT_EQ(points.size(), 8u);
  /// Iteration midpoints survive subsampling
  EXPECT_TRUE(has_point_near(points, 5.0));
  EXPECT_TRUE(has_point_near(points, 55.0));
  for (double t : points) {
    EXPECT_GT(t, 0.0);
    EXPECT_LT(t, 60.0);
  }
}

TEST(ProbePlanTest, CapNeverDropsIterationMidpoints) {
  Timeline tl = make_timeline(10.0, 60.0);
  for (int cap : {0, 1, 2}) {
    VerifyOptions opt;
    opt.max_probes = cap;
    auto points = plan_probe_points(tl, opt);
    EXPECT_EQ(points.size(), 2u) << "max_probes " << cap;
    EXPECT_TRUE(has_point_near(points, 5.0)) << "max_probes " << cap;
    EXPECT_TRUE(has_point_near(points, 55.0)) << "max_probes " << cap;
  }
}

TEST(ProbePlanTest, UnloopedBackgroundUsesQuarters) {
  Timeline tl = make_timeline(300.0, 60.0);
  auto points = plan_probe_points(tl, VerifyOptions{});
  ASSERT_EQ(points.size(), 3u);
  EXPECT_DOUBLE_EQ(points[0], 15.0);
  EXPECT_DOUBLE_EQ(points[1], 30.0);
  EXPECT_DOUBLE_EQ(points[2], 45.0);
}

TEST(ProbePlanTest, PartialSecondIteration) {
  /// 10s clip in 15s: the later probe sits inside the partial iteration
  Timeline tl = make_timeline(10.0, 15.0);
  auto points = plan_probe_points(tl, VerifyOptions{});
  EXPECT_TRUE(has_point_near(points, 5.0));
  EXPECT_TRUE(has_point_near(points, 10.0));
  EXPECT_TRUE(has_point_near(points, 12.5));
}

TEST(ProbePlanTest, SamplePairStaysDecodable) {
  Timeline tl = make_timeline();
  VerifyOptions opt;

  auto [a, b] = sample_pair(tl, 30.0, opt);
  EXPECT_NEAR(a, 29.9, 1e-9);
  EXPECT_NEAR(b, 30.1, 1e-9);

  /// Near the end both samples stay before the last frame
  auto [c, d] = sample_pair(tl, 59.95, opt);
  EXPECT_NEAR(d, 59.96, 1e-9);
  EXPECT_NEAR(d - c, opt.pair_gap_sec, 1e-9);

  auto [e, f] = sample_pair(tl, 0.05, opt);
  EXPECT_DOUBLE_EQ(e, 0.0);
  EXPECT_GT(f, e);
}

TEST(ProbePlanTest, LoopOffsetAndOverlayPosition) {
  Timeline tl = make_timeline(10.0, 60.0);
  EXPECT_NEAR(loop_offset(tl, 25.0), 5.0, 1e-9);
  EXPECT_NEAR(loop_offset(tl, 9.5), 9.5, 1e-9);

  EXPECT_EQ(overlay_position(tl, 0.0), 0);
  EXPECT_EQ(overlay_position(tl, 19.999), 0);
  EXPECT_EQ(overlay_position(tl, 20.0), 1);
  EXPECT_EQ(overlay_position(tl, 59.99), 2);
  EXPECT_EQ(overlay_position(tl, 60.0), -1);

  Timeline unlooped = make_timeline(300.0, 60.0);
  EXPECT_DOUBLE_EQ(loop_offset(unlooped, 25.0), 25.0);
}

// ---------------------------------------------------------------------------
// Verdict
// ---------------------------------------------------------------------------

TEST(VerdictTest, DistinctFramesPass) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 9.9, "aa"),
                                sample(tl, 0, 10.1, "bb"),
                                sample(tl, 1, 19.9, "cc"),
                                sample(tl, 1, 20.1, "dd")};
  EXPECT_EQ(evaluate_samples(tl, s, 60.0, VerifyOptions{}), "");
}

TEST(VerdictTest, FrozenFrameAtLoopBoundary) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 9.9, "aa"),
                                sample(tl, 0, 10.1, "aa")};
  std::string reason = evaluate_samples(tl, s, 60.0, VerifyOptions{});
  EXPECT_EQ(reason.rfind("frozen frame", 0), 0u) << reason;
}

TEST(VerdictTest, SameDecodedFrameTwiceIsNotFrozen) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 10.0, "aa"),
                                sample(tl, 0, 10.0, "aa")};
  EXPECT_EQ(evaluate_samples(tl, s, 60.0, VerifyOptions{}), "");
}

TEST(VerdictTest, DuplicateAtDifferentOffset) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 5.0, "aa"),
                                sample(tl, 1, 13.0, "aa")};
  std::string reason = evaluate_samples(tl, s, 60.0, VerifyOptions{});
  EXPECT_EQ(reason.rfind("duplicated frame", 0), 0u) << reason;
}

TEST(VerdictTest, DuplicateUnderDifferentOverlay) {
  /// Same loop offset, but the text layer changed: must differ
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 15.0, "aa"),
                                sample(tl, 1, 25.0, "aa")};
  std::string reason = evaluate_samples(tl, s, 60.0, VerifyOptions{});
  EXPECT_EQ(reason.rfind("duplicated frame", 0), 0u) << reason;
}

TEST(VerdictTest, LoopRepeatUnderSameOverlayIsLegitimate) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 2, 21.0, "aa"),
                                sample(tl, 3, 31.0, "aa")};
  EXPECT_EQ(evaluate_samples(tl, s, 60.0, VerifyOptions{}), "");
}

TEST(VerdictTest, DurationMismatchFails) {
  Timeline tl = make_timeline();
  std::vector<FrameSample> s = {sample(tl, 0, 9.9, "aa")};

  std::string reason = evaluate_samples(tl, s, 58.0, VerifyOptions{});
  EXPECT_EQ(reason.rfind("duration", 0), 0u) << reason;

  /// Within one frame (40ms at 25 fps) is accepted
  EXPECT_EQ(evaluate_samples(tl, s, 60.03, VerifyOptions{}), "");
}

TEST(VerdictTest, NoSamplesFails) {
  Timeline tl = make_timeline();
  EXPECT_EQ(evaluate_samples(tl, {}, 60.0, VerifyOptions{}),
            "no frames were sampled");
}

TEST(VerifierTest, UnreadableOutputIsAFailingVerdict) {
  Timeline tl = make_timeline();
  IntegrityVerifier verifier{VerifyOptions{}};
  AssemblyResult r = verifier.verify(tl, "/nonexistent/loopweave/out.mp4");

  EXPECT_FALSE(r.publishable());
  EXPECT_EQ(r.status, VerificationStatus::Fail);
  EXPECT_FALSE(r.reason.empty());
  EXPECT_TRUE(r.samples.empty());
  EXPECT_EQ(r.output_path, "/nonexistent/loopweave/out.mp4");
}

} // namespace
} // namespace loopweave
