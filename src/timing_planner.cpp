/**
 * @file timing_planner.cpp
 * @brief Timeline computation
 */

#include "loopweave/timing_planner.hpp"

#include <algorithm>
#include <cmath>
#include <string>

#include <fmt/core.h>

#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"

namespace loopweave {

namespace {

std::string segment_subject(const OverlaySegment &s) {
  return fmt::format("segment {}", s.sequence_index);
}

void check_asset(const MediaAsset &asset, const char *role) {
  if (!std::isfinite(asset.duration) || asset.duration <= 0.0) {
    throw InputError(fmt::format("{} has no valid duration ({})", role,
                                 asset.duration),
                     asset.path);
  }
}

} // anonymous namespace

void TimingPlanner::validate(double total_duration, const Canvas &canvas,
                             const std::vector<OverlaySegment> &segments) {
  if (!std::isfinite(total_duration) || total_duration <= 0.0) {
    throw InputError(
        fmt::format("total duration must be positive, got {}", total_duration));
  }
  if (canvas.width <= 0 || canvas.height <= 0) {
    throw InputError(fmt::format("invalid canvas {}x{}", canvas.width,
                                 canvas.height));
  }
  /// yuv420p output needs even dimensions
  if (canvas.width % 2 != 0 || canvas.height % 2 != 0) {
    throw InputError(fmt::format("canvas {}x{} must have even dimensions",
                                 canvas.width, canvas.height));
  }
  if (segments.empty())
    throw InputError("no overlay segments provided");

  for (size_t i = 0; i < segments.size(); ++i) {
    const OverlaySegment &s = segments[i];
    if (i > 0 && s.sequence_index <= segments[i - 1].sequence_index) {
      throw InputError(
          fmt::format("sequence index {} does not follow {}",
                      s.sequence_index, segments[i - 1].sequence_index),
          segment_subject(s));
    }
    if (is_blank(s.text))
      throw InputError("segment text is empty", segment_subject(s));
    if (s.requested_duration &&
        (!std::isfinite(*s.requested_duration) ||
         *s.requested_duration <= 0.0)) {
      throw InputError(fmt::format("requested duration must be positive, got {}",
                                   *s.requested_duration),
                       segment_subject(s));
    }
  }
}

std::vector<WindowSpan>
TimingPlanner::allocate_windows(double total_duration,
                                const std::vector<OverlaySegment> &segments) {
  double explicit_sum = 0.0;
  size_t unspecified = 0;
  for (const auto &s : segments) {
    if (s.requested_duration)
      explicit_sum += *s.requested_duration;
    else
      ++unspecified;
  }

  double share = 0.0;
  if (unspecified > 0) {
    double remainder = total_duration - explicit_sum;
    if (remainder <= DURATION_EPSILON) {
      throw InputError(fmt::format(
          "explicit durations ({:.3f}s) leave no time for {} unspecified "
          "segment(s) in {:.3f}s",
          explicit_sum, unspecified, total_duration));
    }
    share = remainder / static_cast<double>(unspecified);
  } else if (std::fabs(explicit_sum - total_duration) > DURATION_EPSILON) {
    throw InputError(fmt::format(
        "explicit durations sum to {:.6f}s but the video is {:.6f}s",
        explicit_sum, total_duration));
  }

  std::vector<WindowSpan> windows;
  windows.reserve(segments.size());

  double cursor = 0.0;
  for (size_t i = 0; i < segments.size(); ++i) {
    const OverlaySegment &s = segments[i];
    double length = s.requested_duration ? *s.requested_duration : share;
    double end = cursor + length;

    /// Clamp the final window to remove accumulated rounding drift
    if (i + 1 == segments.size())
      end = total_duration;

    if (end - cursor <= 0.0) {
      throw InputError(
          fmt::format("window [{:.6f}, {:.6f}) is empty", cursor, end),
          segment_subject(s));
    }
    windows.push_back({cursor, end});
    cursor = end;
  }
  return windows;
}

int TimingPlanner::loop_count(double clip_duration, double total_duration) {
  if (clip_duration <= 0.0)
    return 0;
  /// 60s / 10s is 6 iterations, not 7 after rounding noise
  double iterations = total_duration / clip_duration;
  return std::max(1, static_cast<int>(std::ceil(iterations - 1e-9)));
}

Timeline TimingPlanner::plan(double total_duration, const Canvas &canvas,
                             int fps,
                             const std::vector<OverlaySegment> &segments,
                             const std::vector<RenderedOverlay> &overlays,
                             const MediaAsset &background,
                             const MediaAsset &music,
                             const std::optional<MediaAsset> &narration,
                             double music_gain, double narration_gain) {
  validate(total_duration, canvas, segments);
  check_asset(background, "background");
  check_asset(music, "music");
  if (narration)
    check_asset(*narration, "narration");

  if (fps <= 0)
    throw InputError(fmt::format("output frame rate must be positive, got {}",
                                 fps));
  if (overlays.size() != segments.size()) {
    throw InputError(fmt::format("{} overlays rendered for {} segments",
                                 overlays.size(), segments.size()));
  }

  Timeline tl;
  tl.total_duration = total_duration;
  tl.canvas = canvas;
  tl.fps = fps;

  // **---- Overlay windows ----**

  std::vector<WindowSpan> spans = allocate_windows(total_duration, segments);
  tl.windows.reserve(spans.size());
  for (size_t i = 0; i < spans.size(); ++i) {
    if (overlays[i].segment_index != segments[i].sequence_index) {
      throw InputError(fmt::format("overlay {} was rendered for segment {}", i,
                                   overlays[i].segment_index),
                       segment_subject(segments[i]));
    }
    tl.windows.push_back({overlays[i], spans[i].start, spans[i].end});
  }

  // **---- Background ----**

  tl.background.source = background;
  tl.background.loop = background.duration + DURATION_EPSILON < total_duration;
  tl.background.loop_count = loop_count(background.duration, total_duration);
  tl.background.scale = {"background", canvas.width, canvas.height,
                         ScaleMode::Letterbox};
  tl.scale_steps.push_back(tl.background.scale);
  for (const auto &w : tl.windows) {
    tl.scale_steps.push_back(
        {fmt::format("overlay:{}", w.overlay.segment_index), canvas.width,
         canvas.height, ScaleMode::Exact});
  }

  if (background.width > 0 &&
      (background.width < canvas.width || background.height < canvas.height)) {
    LOG_WARN("Background {}x{} is smaller than the {}x{} canvas; it will be "
             "upscaled",
             background.width, background.height, canvas.width,
             canvas.height);
  }

  // **---- Audio ----**

  tl.music.source = music;
  tl.music.gain = music_gain;
  tl.music.loop_count = loop_count(music.duration, total_duration);
  if (std::fabs(music.duration - total_duration) <= DURATION_EPSILON)
    tl.music.mode = AudioMode::Exact;
  else if (music.duration < total_duration)
    tl.music.mode = AudioMode::Loop;
  else
    tl.music.mode = AudioMode::Trim;

  if (narration) {
    tl.narration = NarrationInstruction{*narration, narration_gain};
    if (narration->duration > total_duration + DURATION_EPSILON) {
      LOG_WARN("Narration ({:.1f}s) is longer than the video ({:.1f}s) and "
               "will be cut",
               narration->duration, total_duration);
    }
  }

  LOG_INFO("Timeline: {:.3f}s, {} windows, background x{}{}, music {} x{}",
           total_duration, tl.windows.size(), tl.background.loop_count,
           tl.background.loop ? " (looped)" : "", to_string(tl.music.mode),
           tl.music.loop_count);
  return tl;
}

} // namespace loopweave
