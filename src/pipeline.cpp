/**
 * @file pipeline.cpp
 * @brief Assembly run implementation
 */

#include "loopweave/pipeline.hpp"

#include <chrono>
#include <filesystem>
#include <optional>
#include <unistd.h>

#include <fmt/color.h>
#include <fmt/core.h>

#include "loopweave/config.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"
#include "loopweave/media_probe.hpp"
#include "loopweave/system.hpp"
#include "loopweave/timing_planner.hpp"

namespace loopweave {

namespace fs = std::filesystem;

namespace {

/// Removes the run's work dir on every exit path unless asked to keep it
struct WorkDirGuard {
  std::string path;
  bool keep;
  ~WorkDirGuard() {
    if (keep || path.empty())
      return;
    std::error_code ec;
    fs::remove_all(path, ec);
  }
};

} // anonymous namespace

// **---- Constructor ----**

AssemblyPipeline::AssemblyPipeline(RunRequest request, int run_id)
    : request_(std::move(request)), run_id_(run_id),
      render_options_(RenderOptions::from_config()),
      encode_settings_(EncodeSettings::from_config()),
      verify_options_(VerifyOptions::from_config()) {
  work_dir_ = request_.work_dir.empty()
                  ? make_work_dir(request_.output_path, run_id_)
                  : request_.work_dir;
}

std::string AssemblyPipeline::make_work_dir(const std::string &output_path,
                                            int run_id) {
  fs::path out(output_path);
  std::string name = fmt::format(".loopweave-{}-{}-{}", out.stem().string(),
                                 getpid(), run_id < 0 ? 0 : run_id);
  return (out.parent_path() / name).string();
}

// **---- Logging Helpers ----**

void AssemblyPipeline::log_info(const std::string &msg) {
  if (run_id_ >= 0) {
    LOG_INFO("[Run {}] {}", run_id_, msg);
  } else {
    LOG_INFO("{}", msg);
  }
}

void AssemblyPipeline::log_phase(const std::string &msg) {
  if (run_id_ >= 0) {
    LOG_PHASE("[Run {}] {}", run_id_, msg);
  } else {
    LOG_PHASE("{}", msg);
  }
}

// **---- Main Processing ----**

AssemblyResult AssemblyPipeline::run() {
  auto run_start = std::chrono::steady_clock::now();
  TIMER_START(total_run);

  try {
    const double total = request_.total_duration;

    // **----- PHASE 0: VALIDATE AND PROBE -----**

    log_phase("Validating input...");
    TIMER_START(validate);

    /// Window allocation is checked here so bad manifests fail before any
    /// media work
    TimingPlanner::validate(total, request_.canvas, request_.segments);
    TimingPlanner::allocate_windows(total, request_.segments);

    MediaAsset background =
        probe_media(request_.background_path, MediaKind::Video);
    MediaAsset music = probe_media(request_.music_path, MediaKind::Audio);
    std::optional<MediaAsset> narration;
    if (!request_.narration_path.empty())
      narration = probe_media(request_.narration_path, MediaKind::Audio);

    TIMER_END(validate);
    log_info(fmt::format("Target: {} at {}x{}, {} segments",
                         format_time(total), request_.canvas.width,
                         request_.canvas.height, request_.segments.size()));

    // **----- PHASE 1: RENDER OVERLAYS -----**

    WorkDirGuard guard{work_dir_, Config::keep_work_dir()};

    log_phase(fmt::format("Rendering {} overlays...",
                          request_.segments.size()));
    TIMER_START(render);
    OverlayRenderer renderer(request_.canvas, work_dir_, render_options_);
    std::vector<RenderedOverlay> overlays =
        renderer.render_all(request_.segments);
    TIMER_END(render);

    // **----- PHASE 2: PLAN -----**

    log_phase("Planning timeline...");
    TIMER_START(plan);
    const double music_gain = narration ? Config::music_gain_under_narration()
                                        : Config::music_gain();
    Timeline timeline = TimingPlanner::plan(
        total, request_.canvas, Config::output_fps(), request_.segments,
        overlays, background, music, narration, music_gain,
        Config::narration_gain());
    TIMER_END(plan);

    // **----- PHASE 3: COMPOSE -----**

    log_phase("Composing...");
    TIMER_START(compose);
    compose(timeline, request_.output_path, encode_settings_);
    TIMER_END(compose);

    // **----- PHASE 4: VERIFY -----**

    log_phase("Verifying...");
    TIMER_START(verify);
    IntegrityVerifier verifier(verify_options_);
    AssemblyResult result = verifier.verify(timeline, request_.output_path);
    TIMER_END(verify);

    TIMER_END(total_run);
    result.elapsed_sec = std::chrono::duration<double>(
                             std::chrono::steady_clock::now() - run_start)
                             .count();

    if (guard.keep)
      log_info(fmt::format("Keeping work dir {}", work_dir_));

    /// Only print timing summary in single-run mode
    if (run_id_ < 0) {
      TimingCollector::print_summary();
    }
    print_assembly_summary(timeline, result);
    return result;

  } catch (const AssemblyError &e) {
    if (run_id_ >= 0) {
      LOG_ERROR("[Run {}] {}", run_id_, e.what());
    } else {
      LOG_ERROR("{}", e.what());
    }
    if (!e.diagnostic().empty()) {
      if (run_id_ >= 0) {
        LOG_ERROR("[Run {}] diagnostic: {}", run_id_, e.diagnostic());
      } else {
        LOG_ERROR("diagnostic: {}", e.diagnostic());
      }
    }
    throw;
  }
}

// **---- Assembly Summary ----**

void AssemblyPipeline::print_assembly_summary(const Timeline &tl,
                                              const AssemblyResult &result) {
  std::string prefix = (run_id_ >= 0) ? fmt::format("[Run {}] ", run_id_) : "";

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  if (run_id_ >= 0) {
    fmt::print(fg(fmt::color::cyan), "{}======= ASSEMBLY SUMMARY =======\n",
               prefix);
  } else {
    fmt::print(fg(fmt::color::cyan),
               "================= ASSEMBLY SUMMARY =================\n");
  }

  fmt::print("{}{:<20} {:>30}\n", prefix, "Output:",
             fs::path(result.output_path).filename().string());
  fmt::print("{}{:<20} {:>30}\n", prefix,
             "Requested:", format_time(tl.total_duration));
  fmt::print("{}{:<20} {:>30}\n", prefix,
             "Produced:", format_time(result.total_duration));
  fmt::print("{}{:<20} {:>30}\n", prefix, "Canvas:",
             fmt::format("{}x{} @ {}fps", tl.canvas.width, tl.canvas.height,
                         tl.fps));
  fmt::print("{}{:<20} {:>30}\n", prefix, "Overlays:", tl.windows.size());
  fmt::print("{}{:<20} {:>30}\n", prefix, "Background loops:",
             tl.background.loop ? fmt::format("{}x", tl.background.loop_count)
                                : std::string("none"));
  fmt::print("{}{:<20} {:>30}\n", prefix, "Music:",
             fmt::format("{} x{}", to_string(tl.music.mode),
                         tl.music.loop_count));
  fmt::print("{}{:<20} {:>30}\n", prefix,
             "Narration:", tl.narration ? "mixed" : "none");
  fmt::print("{}{:<20} {:>30}\n", prefix, "Samples:", result.samples.size());
  fmt::print("{}{:<20} {:>29.1f}s\n", prefix, "Elapsed:", result.elapsed_sec);

  if (result.publishable()) {
    fmt::print(fg(fmt::color::green), "{}{:<20} {:>30}\n", prefix,
               "Verdict:", to_string(result.status));
  } else {
    fmt::print(fg(fmt::color::red), "{}{:<20} {:>30}\n", prefix,
               "Verdict:", to_string(result.status));
    fmt::print(fg(fmt::color::red), "{}{}\n", prefix, result.reason);
  }

  if (run_id_ >= 0) {
    fmt::print(fg(fmt::color::cyan), "{}================================\n",
               prefix);
  } else {
    fmt::print(fg(fmt::color::cyan),
               "====================================================\n");
  }
  std::fflush(stdout);
}

} // namespace loopweave
