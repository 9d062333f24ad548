/**
 * @file composition_engine.hpp
 * @brief Turns a Timeline into one encoded MP4
 *
 * @details Everything happens in one ffmpeg invocation:
 *
 *          - background: -stream_loop -1 when it must loop, then letterboxed
 *            to the canvas, resampled to the output rate and trimmed to the
 *            total duration
 *
 *          - overlays: one PNG input each, chained through overlay filters
 *            gated on their half-open window [start, end)
 *
 *          - audio: music looped or trimmed, optionally mixed under
 *            narration, then peak-limited
 *
 *          The encoder writes to a hidden temporary file beside the output
 *          which is renamed into place only after ffmpeg exits cleanly, so a
 *          failed run never leaves a partial file under the final name.
 */

#ifndef LOOPWEAVE_COMPOSITION_ENGINE_HPP
#define LOOPWEAVE_COMPOSITION_ENGINE_HPP

#include <string>
#include <vector>

#include "types.hpp"

namespace loopweave {

/**
 * @struct EncodeSettings
 * @brief Encoder and supervision parameters for one composition.
 */
struct EncodeSettings {
  std::string ffmpeg_bin = "ffmpeg";
  std::string video_codec = "libx264";
  std::string video_preset = "medium";
  int video_crf = 23;
  std::string audio_bitrate = "192k";
  int audio_sample_rate = 48000;
  double peak_limit = 0.891;
  double timeout_base_sec = 300.0;
  double timeout_factor = 3.0;

  static EncodeSettings from_config();

  /// Deadline for a composition of the given length
  double timeout_for(double total_duration) const {
    return timeout_base_sec + timeout_factor * total_duration;
  }
};

/**
 * @brief Build the filter_complex script for a Timeline.
 *
 * @details Input numbering: 0 background, 1..N overlays in window order,
 *          N+1 music, N+2 narration. Outputs are labelled [vout] and [aout].
 */
std::string build_filter_graph(const Timeline &timeline,
                               const EncodeSettings &settings);

/**
 * @brief Build the full ffmpeg argument vector.
 *
 * @param filter_script Path ffmpeg reads the filter graph from
 * @param output_path File ffmpeg writes (the temporary, not the final name)
 */
std::vector<std::string> build_ffmpeg_args(const Timeline &timeline,
                                           const EncodeSettings &settings,
                                           const std::string &filter_script,
                                           const std::string &output_path);

/// Hidden sibling of the final output used while ffmpeg is writing
std::string temporary_output_path(const std::string &output_path);

/**
 * @brief Compose the Timeline into output_path.
 *
 * @details Verifies that every overlay layer matches the canvas before
 *          starting ffmpeg, then runs it under the deadline from
 *          EncodeSettings::timeout_for().
 *
 * @throws CompositionError on layer mismatch, ffmpeg failure, timeout or
 *         rename failure. The temporary file is removed in every case and an
 *         existing file at output_path is left untouched.
 */
void compose(const Timeline &timeline, const std::string &output_path,
             const EncodeSettings &settings);

} // namespace loopweave

#endif // LOOPWEAVE_COMPOSITION_ENGINE_HPP
