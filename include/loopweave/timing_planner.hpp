/**
 * @file timing_planner.hpp
 * @brief Computes the authoritative Timeline for one run
 *
 * @details The planner is pure: it reads probed assets and segment metadata
 *          and never touches media. It runs twice per assembly:
 *
 *          1. validate() + allocate_windows() before any media processing,
 *             so malformed input fails fast
 *
 *          2. plan() once the overlays are rendered, producing the
 *             immutable Timeline handed to composition
 *
 * @attention LOOP POLICY:
 *            A background or music asset shorter than the total duration is
 *            extended by continuous single-clip looping (ffmpeg
 *            -stream_loop), never by concatenating copies. Every concat join
 *            is a point where the decoder can repeat its last frame.
 */

#ifndef LOOPWEAVE_TIMING_PLANNER_HPP
#define LOOPWEAVE_TIMING_PLANNER_HPP

#include <optional>
#include <vector>

#include "types.hpp"

namespace loopweave {

class TimingPlanner {
public:
  /**
   * @brief Check run parameters and segments.
   * @throws InputError on non-positive duration, empty or unordered
   *         segments, empty text, non-positive explicit durations or an
   *         invalid canvas
   */
  static void validate(double total_duration, const Canvas &canvas,
                       const std::vector<OverlaySegment> &segments);

  /**
   * @brief Allocate one display window per segment.
   *
   * @details Explicit durations are honoured and the remainder is split
   *          equally among the unspecified segments. Windows are laid back
   *          to back and the last end is clamped to exactly total_duration,
   *          so accumulated floating-point error cannot leave a gap or an
   *          overlap at the end.
   *
   * @return Windows in segment order, partitioning [0, total_duration)
   * @throws InputError if the explicit durations cannot fit
   */
  static std::vector<WindowSpan>
  allocate_windows(double total_duration,
                   const std::vector<OverlaySegment> &segments);

  /**
   * @brief Build the full Timeline.
   *
   * @param overlays Rendered layers, one per segment, same order
   * @param narration Optional spoken track
   * @throws InputError on any validation failure or asset without a valid
   *         duration
   */
  static Timeline plan(double total_duration, const Canvas &canvas, int fps,
                       const std::vector<OverlaySegment> &segments,
                       const std::vector<RenderedOverlay> &overlays,
                       const MediaAsset &background, const MediaAsset &music,
                       const std::optional<MediaAsset> &narration,
                       double music_gain, double narration_gain);

  /**
   * @brief Iterations of a clip needed to cover total_duration.
   */
  static int loop_count(double clip_duration, double total_duration);
};

} // namespace loopweave

#endif // LOOPWEAVE_TIMING_PLANNER_HPP
