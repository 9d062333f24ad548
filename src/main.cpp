/**
 * @file main.cpp
 * @brief Entry point for Loopweave
 *
 * @details Main entry point that handles:
 *
 *          - Command-line argument parsing
 *
 *          - Single run mode: assemble one video
 *
 *          - Batch mode: every *.job file of a directory, run concurrently
 *            by the BatchAssembler
 *
 * @note Exit codes: 0 pass, 1 usage, 2 input error, 3 render error,
 *       4 composition error, 5 verification failed. Batch mode returns the
 *       number of failed jobs, capped at 255.
 */

#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "loopweave/batch_assembler.hpp"
#include "loopweave/config.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"
#include "loopweave/pipeline.hpp"
#include "loopweave/segment_manifest.hpp"

using namespace loopweave;

namespace {

void print_usage() {
  LOG_WARN("Usage: loopweave <background> <music> <segments.txt> <output.mp4> "
           "<duration_sec> [width] [height] [narration]");
  LOG_WARN("       loopweave <jobs_dir> <output_dir>");
}

int run_batch(const std::string &jobs_dir, const std::string &output_dir) {
  namespace fs = std::filesystem;

  std::error_code ec;
  fs::create_directories(output_dir, ec);
  if (ec) {
    LOG_ERROR("Cannot create output directory {}: {}", output_dir,
              ec.message());
    return EXIT_CODE_USAGE;
  }

  LOG_INFO("Loopweave - Batch Mode");
  LOG_INFO("Jobs directory: {}", jobs_dir);
  LOG_INFO("Output directory: {}", output_dir);

  std::vector<std::string> jobs;
  try {
    jobs = find_job_files(jobs_dir);
  } catch (const InputError &e) {
    LOG_ERROR("{}", e.what());
    return exit_code_for(e.stage());
  }
  if (jobs.empty()) {
    LOG_WARN("No *.job files found in directory");
    return 0;
  }
  LOG_INFO("Found {} job files", jobs.size());

  BatchAssembler assembler(Config::parallel_runs()); // 0 = auto-detect
  return batch_exit_status(assembler.process(jobs, output_dir));
}

int run_single(int argc, char *argv[]) {
  RunRequest request;
  request.background_path = argv[1];
  request.music_path = argv[2];
  request.output_path = argv[4];
  try {
    request.total_duration = parse_positive(argv[5], "duration");
    if (argc > 6)
      request.canvas.width = parse_dimension(argv[6], "width");
    if (argc > 7)
      request.canvas.height = parse_dimension(argv[7], "height");
    if (argc > 8)
      request.narration_path = argv[8];
    request.segments = load_segments(argv[3]);
  } catch (const InputError &e) {
    LOG_ERROR("{}", e.what());
    return exit_code_for(e.stage());
  }

  LOG_INFO("Loopweave - Single Run");
  LOG_INFO("Background: {}", request.background_path);
  LOG_INFO("Music: {}", request.music_path);
  LOG_INFO("Output: {}", request.output_path);

  AssemblyPipeline pipeline(std::move(request));
  AssemblyResult result = pipeline.run();
  return result.publishable() ? EXIT_CODE_PASS : EXIT_CODE_VERIFY_FAILED;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  try {
    if (argc == 3 && std::filesystem::is_directory(argv[1]))
      return run_batch(argv[1], argv[2]);

    if (argc < 6 || argc > 9) {
      print_usage();
      return EXIT_CODE_USAGE;
    }
    return run_single(argc, argv);

  } catch (const AssemblyError &e) {
    /// Already logged by the pipeline with its diagnostic
    return exit_code_for(e.stage());
  } catch (const std::exception &e) {
    LOG_ERROR("{}", e.what());
    return EXIT_CODE_USAGE;
  }
}
