/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          tunables loaded from environment variables. Run parameters
 *          (assets, duration, canvas) come from the command line or a job
 *          file; everything here is process-wide policy shared by all runs.
 *          See config/loopweave.env for an annotated list.
 */

#ifndef LOOPWEAVE_CONFIG_HPP
#define LOOPWEAVE_CONFIG_HPP

#include <cstdlib>
#include <string>

namespace loopweave {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 * @return Variable content or default
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

// **---- ENCODING ----**

/// ffmpeg executable (resolved through PATH when not absolute)
inline const std::string &ffmpeg_bin() {
  static std::string val = get_env_string("FFMPEG_BIN", "ffmpeg");
  return val;
}

/// Fixed output frame rate
inline int output_fps() {
  static int val = get_env_int("OUTPUT_FPS", 25);
  return val;
}

inline const std::string &video_codec() {
  static std::string val = get_env_string("VIDEO_CODEC", "libx264");
  return val;
}

inline const std::string &video_preset() {
  static std::string val = get_env_string("VIDEO_PRESET", "medium");
  return val;
}

inline int video_crf() {
  static int val = get_env_int("VIDEO_CRF", 23);
  return val;
}

inline const std::string &audio_bitrate() {
  static std::string val = get_env_string("AUDIO_BITRATE", "192k");
  return val;
}

inline int audio_sample_rate() {
  static int val = get_env_int("AUDIO_SAMPLE_RATE", 48000);
  return val;
}

// **---- AUDIO LEVELS ----**

/// Music gain when music is the only audio (full presence)
inline double music_gain() {
  static double val = get_env_double("MUSIC_GAIN", 1.0);
  return val;
}

/// Music gain when a narration track is mixed on top
inline double music_gain_under_narration() {
  static double val = get_env_double("MUSIC_GAIN_UNDER_NARRATION", 0.3);
  return val;
}

inline double narration_gain() {
  static double val = get_env_double("NARRATION_GAIN", 0.7);
  return val;
}

/**
 * @brief Linear peak ceiling applied after mixing.
 * @note 0.891 is -1 dBFS; the limiter keeps the encoded mix from clipping.
 */
inline double audio_peak_limit() {
  static double val = get_env_double("AUDIO_PEAK_LIMIT", 0.891);
  return val;
}

// **---- COMPOSITION DEADLINE ----**

/**
 * @brief Fixed part of the ffmpeg deadline.
 * @note Deadline = base + factor * total_duration.
 */
inline double compose_timeout_base_sec() {
  static double val = get_env_double("COMPOSE_TIMEOUT_BASE_SEC", 300.0);
  return val;
}

inline double compose_timeout_factor() {
  static double val = get_env_double("COMPOSE_TIMEOUT_FACTOR", 3.0);
  return val;
}

// **---- OVERLAY RENDERING ----**

inline const std::string &font_path() {
  static std::string val = get_env_string(
      "FONT_PATH", "/usr/share/fonts/truetype/dejavu/DejaVuSerif.ttf");
  return val;
}

inline const std::string &reference_font_path() {
  static std::string val = get_env_string(
      "REFERENCE_FONT_PATH",
      "/usr/share/fonts/truetype/dejavu/DejaVuSerif-Italic.ttf");
  return val;
}

/// Fontconfig family used when the configured font files are unavailable
inline const std::string &font_family() {
  static std::string val = get_env_string("FONT_FAMILY", "serif");
  return val;
}

/// Maximum characters per wrapped line
inline int wrap_width_chars() {
  static int val = get_env_int("WRAP_WIDTH_CHARS", 50);
  return val;
}

/// Alpha (0-255) of the panel drawn behind the text
inline int panel_alpha() {
  static int val = get_env_int("PANEL_ALPHA", 120);
  return val;
}

// **---- VERIFICATION ----**

/**
 * @brief Spacing of boundary probes in seconds.
 * @note 0 = use the background loop period.
 */
inline double verify_interval_sec() {
  static double val = get_env_double("VERIFY_INTERVAL_SEC", 0.0);
  return val;
}

inline int verify_max_probes() {
  static int val = get_env_int("VERIFY_MAX_PROBES", 8);
  return val;
}

/// Distance between the two samples of one probe
inline double verify_pair_gap_sec() {
  static double val = get_env_double("VERIFY_PAIR_GAP_SEC", 0.2);
  return val;
}

/// Allowed output duration error, in frame intervals
inline double duration_tolerance_frames() {
  static double val = get_env_double("DURATION_TOLERANCE_FRAMES", 1.0);
  return val;
}

// **---- RUN MANAGEMENT ----**

/**
 * @brief Number of concurrent assembly runs in batch mode.
 * @note 0 = auto-detect from the CPU limit. Each ffmpeg invocation is
 *       already multi-threaded, so the auto value is a quarter of the CPUs.
 */
inline int parallel_runs() {
  static int val = get_env_int("PARALLEL_RUNS", 0);
  return val;
}

/// Keep the per-run working directory (overlay PNGs) after the run
inline bool keep_work_dir() {
  static bool val = (get_env_int("KEEP_WORK_DIR", 0) != 0);
  return val;
}

} // namespace Config
} // namespace loopweave

#endif // LOOPWEAVE_CONFIG_HPP
