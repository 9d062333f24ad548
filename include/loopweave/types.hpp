/**
 * @file types.hpp
 * @brief Core data types for Loopweave
 *
 * @details Contains the value types that flow through one assembly run:
 *          - MediaAsset: a probed input file
 *
 *          - OverlaySegment / RenderedOverlay: on-screen text and its layer
 *
 *          - Timeline: the immutable schedule handed to composition
 *
 *          - AssemblyResult: the verdict handed to the publisher
 */

#ifndef LOOPWEAVE_TYPES_HPP
#define LOOPWEAVE_TYPES_HPP

#include <cstddef>
#include <cstring>
#include <optional>
#include <string>
#include <vector>

namespace loopweave {

// **----- CONSTANTS -----**

/**
 * @brief Tolerance for comparing durations that should be equal.
 * @note One microsecond, matching AV_TIME_BASE resolution.
 */
constexpr double DURATION_EPSILON = 1e-6;

/// Characters that separate words in segment text
constexpr const char *TEXT_WHITESPACE = " \t\n\v\f\r";

inline bool is_text_whitespace(char ch) {
  return ch != '\0' && std::strchr(TEXT_WHITESPACE, ch) != nullptr;
}

/// True when the text has nothing to draw
inline bool is_blank(const std::string &text) {
  return text.find_first_not_of(TEXT_WHITESPACE) == std::string::npos;
}

// **----- INPUTS -----**

enum class MediaKind { Video, Audio };

/**
 * @struct MediaAsset
 * @brief A resolved input file with its probed properties.
 */
struct MediaAsset {
  std::string path;
  MediaKind kind = MediaKind::Video;
  double duration = 0.0; //< Seconds, probed from the selected stream
  int width = 0;         //< Video only
  int height = 0;        //< Video only
  double fps = 0.0;      //< Video only
};

/**
 * @struct Canvas
 * @brief Output pixel resolution shared by every overlay layer.
 */
struct Canvas {
  int width = 1920;
  int height = 1080;
};

inline bool operator==(const Canvas &a, const Canvas &b) {
  return a.width == b.width && a.height == b.height;
}

/**
 * @struct OverlaySegment
 * @brief One unit of on-screen text.
 */
struct OverlaySegment {
  std::string text;
  std::string reference; //< Citation drawn under the text (may be empty)
  std::optional<double> requested_duration;
  int sequence_index = 0;
};

/**
 * @struct RenderedOverlay
 * @brief Rasterized canvas-sized RGBA layer for one segment.
 */
struct RenderedOverlay {
  std::string image_path;
  int width = 0;
  int height = 0;
  int segment_index = 0; //< OverlaySegment::sequence_index, lookup only
};

// **----- TIMELINE -----**

/**
 * @struct WindowSpan
 * @brief Half-open display interval [start, end) in seconds.
 */
struct WindowSpan {
  double start;
  double end;
};

struct OverlayWindow {
  RenderedOverlay overlay;
  double start; //< Inclusive
  double end;   //< Exclusive
};

enum class ScaleMode {
  Letterbox, //< Fit inside the canvas keeping aspect ratio, pad with black
  Exact      //< Input must already match the canvas
};

/**
 * @struct ScaleStep
 * @brief Mandatory normalization of one visual input to the canvas.
 */
struct ScaleStep {
  std::string input_label; //< "background" or "overlay:<index>"
  int width;
  int height;
  ScaleMode mode;
};

/**
 * @struct BackgroundInstruction
 * @brief Single source clip, looped continuously when it is too short.
 */
struct BackgroundInstruction {
  MediaAsset source;
  bool loop = false;
  int loop_count = 1; //< Iterations needed to cover the total duration
  ScaleStep scale;
};

enum class AudioMode { Loop, Trim, Exact };

struct AudioInstruction {
  MediaAsset source;
  AudioMode mode = AudioMode::Exact;
  int loop_count = 1;
  double gain = 1.0;
};

/**
 * @struct NarrationInstruction
 * @brief Spoken track mixed over the music. Padded or trimmed, never looped.
 */
struct NarrationInstruction {
  MediaAsset source;
  double gain = 0.7;
};

/**
 * @struct Timeline
 * @brief Authoritative schedule for one assembly run.
 * @note Windows partition [0, total_duration) exactly: windows[i].end ==
 *       windows[i+1].start and windows.back().end == total_duration.
 */
struct Timeline {
  double total_duration = 0.0;
  Canvas canvas;
  int fps = 25;
  std::vector<OverlayWindow> windows;
  BackgroundInstruction background;
  AudioInstruction music;
  std::optional<NarrationInstruction> narration;
  std::vector<ScaleStep> scale_steps;
};

// **----- RUN PARAMETERS -----**

/**
 * @struct RunRequest
 * @brief Everything one assembly run consumes, as resolved paths.
 */
struct RunRequest {
  std::string background_path;
  std::string music_path;
  std::string narration_path; //< Optional (empty = music only)
  std::vector<OverlaySegment> segments;
  double total_duration = 0.0;
  Canvas canvas;
  std::string output_path;
  std::string work_dir; //< Empty = derived from output path and run id
};

// **----- RESULT -----**

enum class VerificationStatus { Pass, Fail };

/**
 * @struct FrameSample
 * @brief One fingerprinted frame of the produced file.
 */
struct FrameSample {
  double time;          //< Requested timestamp in the output
  double decoded_time;  //< Timestamp of the frame actually decoded
  int probe;            //< Probe this sample belongs to
  double loop_offset;   //< time modulo the background loop period
  int overlay_position; //< Index into Timeline::windows
  std::string sha256;   //< Hex digest of the frame's pixel planes
};

struct AssemblyResult {
  std::string output_path;
  double total_duration = 0.0; //< Probed from the produced file
  VerificationStatus status = VerificationStatus::Fail;
  std::string reason; //< Empty on pass
  std::vector<FrameSample> samples;
  double elapsed_sec = 0.0;

  bool publishable() const { return status == VerificationStatus::Pass; }
};

const char *to_string(VerificationStatus status);
const char *to_string(AudioMode mode);

} // namespace loopweave

#endif // LOOPWEAVE_TYPES_HPP
