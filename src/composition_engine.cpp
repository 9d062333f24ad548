/**
 * @file composition_engine.cpp
 * @brief ffmpeg filter graph and invocation
 */

#include "loopweave/composition_engine.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>

#include <fmt/core.h>

#include "loopweave/config.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/ffmpeg_executor.hpp"
#include "loopweave/logging.hpp"
#include "loopweave/media_probe.hpp"

namespace loopweave {

namespace fs = std::filesystem;

namespace {

/// Shared audio normalisation: planar float, fixed rate, stereo
std::string audio_format(int sample_rate) {
  return fmt::format("aformat=sample_fmts=fltp:sample_rates={}:"
                     "channel_layouts=stereo",
                     sample_rate);
}

/// Gain, then pad or cut to exactly the video length
std::string audio_chain(int input, double gain, double duration,
                        int sample_rate, const std::string &label) {
  return fmt::format("[{}:a]{},volume={:.3f},apad,atrim=duration={:.6f},"
                     "asetpts=PTS-STARTPTS[{}]",
                     input, audio_format(sample_rate), gain, duration, label);
}

void remove_quietly(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
}

} // anonymous namespace

EncodeSettings EncodeSettings::from_config() {
  EncodeSettings s;
  s.ffmpeg_bin = Config::ffmpeg_bin();
  s.video_codec = Config::video_codec();
  s.video_preset = Config::video_preset();
  s.video_crf = Config::video_crf();
  s.audio_bitrate = Config::audio_bitrate();
  s.audio_sample_rate = Config::audio_sample_rate();
  s.peak_limit = Config::audio_peak_limit();
  s.timeout_base_sec = Config::compose_timeout_base_sec();
  s.timeout_factor = Config::compose_timeout_factor();
  return s;
}

std::string build_filter_graph(const Timeline &tl,
                               const EncodeSettings &settings) {
  const int w = tl.canvas.width;
  const int h = tl.canvas.height;
  const double d = tl.total_duration;
  const size_t n = tl.windows.size();

  std::string g;
  g.reserve(256 + n * 160);

  // **---- Video ----**

  /// Background: fit inside the canvas, pad to it, fixed rate, exact length
  const std::string bg_label = n == 0 ? "vout" : "bg";
  g += fmt::format("[0:v]scale={0}:{1}:force_original_aspect_ratio=decrease,"
                   "pad={0}:{1}:(ow-iw)/2:(oh-ih)/2:color=black,setsar=1,"
                   "fps={2},trim=duration={3:.6f},setpts=PTS-STARTPTS[{4}];\n",
                   w, h, tl.fps, d, bg_label);

  std::string prev = bg_label;
  for (size_t i = 0; i < n; ++i) {
    const OverlayWindow &win = tl.windows[i];
    const size_t input = i + 1;
    const std::string out =
        (i + 1 == n) ? std::string("vout") : fmt::format("v{}", i);

    g += fmt::format("[{}:v]scale={}:{},format=rgba[ov{}];\n", input, w, h, i);
    /// lt() keeps the window half-open; between() would include the end
    g += fmt::format("[{}][ov{}]overlay=0:0:eof_action=repeat:"
                     "enable='gte(t,{:.6f})*lt(t,{:.6f})'[{}];\n",
                     prev, i, win.start, win.end, out);
    prev = out;
  }

  // **---- Audio ----**

  const int music_input = static_cast<int>(n) + 1;
  const std::string limiter = fmt::format(
      "alimiter=limit={:.3f}:level=0,{}", settings.peak_limit,
      audio_format(settings.audio_sample_rate));

  if (!tl.narration) {
    g += fmt::format("[{}:a]{},volume={:.3f},apad,atrim=duration={:.6f},"
                     "asetpts=PTS-STARTPTS,{}[aout]",
                     music_input, audio_format(settings.audio_sample_rate),
                     tl.music.gain, d, limiter);
  } else {
    g += audio_chain(music_input, tl.music.gain, d,
                     settings.audio_sample_rate, "mus");
    g += ";\n";
    g += audio_chain(music_input + 1, tl.narration->gain, d,
                     settings.audio_sample_rate, "nar");
    g += ";\n";
    g += fmt::format("[mus][nar]amix=inputs=2:duration=first:"
                     "dropout_transition=0:normalize=0,{}[aout]",
                     limiter);
  }
  return g;
}

std::vector<std::string> build_ffmpeg_args(const Timeline &tl,
                                           const EncodeSettings &settings,
                                           const std::string &filter_script,
                                           const std::string &output_path) {
  std::vector<std::string> a = {settings.ffmpeg_bin, "-y", "-hide_banner",
                                "-nostdin", "-loglevel", "error"};
  a.reserve(32 + tl.windows.size() * 2);

  /// One decoder instance loops the clip; no concatenated copies
  if (tl.background.loop) {
    a.push_back("-stream_loop");
    a.push_back("-1");
  }
  /// The clip's own soundtrack is never used
  a.push_back("-an");
  a.push_back("-i");
  a.push_back(tl.background.source.path);

  for (const auto &win : tl.windows) {
    a.push_back("-i");
    a.push_back(win.overlay.image_path);
  }

  if (tl.music.mode == AudioMode::Loop) {
    a.push_back("-stream_loop");
    a.push_back("-1");
  }
  a.push_back("-i");
  a.push_back(tl.music.source.path);

  if (tl.narration) {
    a.push_back("-i");
    a.push_back(tl.narration->source.path);
  }

  const std::vector<std::string> tail = {
      "-filter_complex_script", filter_script,
      "-map", "[vout]",
      "-map", "[aout]",
      "-t", fmt::format("{:.6f}", tl.total_duration),
      "-c:v", settings.video_codec,
      "-preset", settings.video_preset,
      "-crf", std::to_string(settings.video_crf),
      "-pix_fmt", "yuv420p",
      "-r", std::to_string(tl.fps),
      "-c:a", "aac",
      "-b:a", settings.audio_bitrate,
      "-ar", std::to_string(settings.audio_sample_rate),
      "-fflags", "+bitexact",
      "-flags:v", "+bitexact",
      "-flags:a", "+bitexact",
      "-map_metadata", "-1",
      "-movflags", "+faststart",
      "-f", "mp4",
      output_path};
  a.insert(a.end(), tail.begin(), tail.end());
  return a;
}

std::string temporary_output_path(const std::string &output_path) {
  fs::path p(output_path);
  return (p.parent_path() / ("." + p.filename().string() + ".tmp")).string();
}

void compose(const Timeline &tl, const std::string &output_path,
             const EncodeSettings &settings) {
  // **---- Preconditions ----**

  for (const auto &win : tl.windows) {
    std::optional<Canvas> size = probe_image_size(win.overlay.image_path);
    if (!size) {
      throw CompositionError("overlay layer cannot be read",
                             win.overlay.image_path);
    }
    if (!(*size == tl.canvas)) {
      throw CompositionError(
          fmt::format("overlay layer is {}x{} but the canvas is {}x{}",
                      size->width, size->height, tl.canvas.width,
                      tl.canvas.height),
          win.overlay.image_path);
    }
  }

  fs::path out(output_path);
  if (out.has_parent_path()) {
    std::error_code ec;
    fs::create_directories(out.parent_path(), ec);
    if (ec)
      throw CompositionError("cannot create output directory",
                             out.parent_path().string(), ec.message());
  }

  const std::string tmp = temporary_output_path(output_path);
  remove_quietly(tmp);

  // **---- Run ffmpeg ----**

  MemoryFile script("filter_graph_mem", build_filter_graph(tl, settings));
  std::vector<std::string> args =
      build_ffmpeg_args(tl, settings, script.path(), tmp);

  const double timeout = settings.timeout_for(tl.total_duration);
  LOG_INFO("Composing {} ({:.1f}s, {} overlays, deadline {:.0f}s)",
           out.filename().string(), tl.total_duration, tl.windows.size(),
           timeout);

  ProcessResult r = run_process(args, timeout);
  if (!r.ok()) {
    remove_quietly(tmp);
    throw CompositionError(fmt::format("ffmpeg {}", r.describe()), output_path,
                           r.stderr_tail);
  }

  std::error_code ec;
  auto size = fs::file_size(tmp, ec);
  if (ec || size == 0) {
    remove_quietly(tmp);
    throw CompositionError("ffmpeg reported success but wrote no output",
                           output_path, r.stderr_tail);
  }

  fs::rename(tmp, output_path, ec);
  if (ec) {
    remove_quietly(tmp);
    throw CompositionError("cannot move output into place", output_path,
                           ec.message());
  }

  LOG_INFO("Composed {} in {:.1f}s ({:.1f} MB)", out.filename().string(),
           r.elapsed_sec, size / (1024.0 * 1024.0));
}

} // namespace loopweave
