/**
 * @file batch_assembler.cpp
 * @brief Concurrent assembly runs implementation
 */

#include "loopweave/batch_assembler.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <thread>

#include <fmt/color.h>
#include <fmt/core.h>

#include "loopweave/errors.hpp"
#include "loopweave/logging.hpp"
#include "loopweave/pipeline.hpp"
#include "loopweave/segment_manifest.hpp"
#include "loopweave/system.hpp"

namespace loopweave {

namespace fs = std::filesystem;

BatchAssembler::BatchAssembler(int num_runs) : num_runs_(num_runs) {}

int batch_exit_status(int failed_jobs) {
  return std::clamp(failed_jobs, 0, 255);
}

int BatchAssembler::process(const std::vector<std::string> &job_files,
                            const std::string &output_dir) {
  if (job_files.empty()) {
    LOG_WARN("No job files to process");
    return 0;
  }

  total_jobs_ = static_cast<int>(job_files.size());
  jobs_done_.store(0);
  outcomes_.clear();

  const int workers = num_runs_ > 0
                          ? std::clamp(num_runs_, 1, total_jobs_)
                          : calculate_parallel_runs(total_jobs_);

  RunQueue queue;
  RunResultCollector results;
  for (size_t i = 0; i < job_files.size(); ++i)
    queue.push({static_cast<int>(i) + 1, job_files[i]});
  queue.finish();

  LOG_PHASE("================== BATCH ASSEMBLY ==================");
  LOG_INFO("Jobs: {}", total_jobs_);
  LOG_INFO("Concurrent runs: {}", workers);
  LOG_INFO("Available CPUs: {}", detect_cpu_limit());
  LOG_INFO("Output directory: {}", output_dir);
  LOG_PHASE("====================================================");

  auto batch_start = std::chrono::steady_clock::now();

  std::vector<std::thread> threads;
  for (int i = 0; i < workers; ++i) {
    threads.emplace_back(&BatchAssembler::run_worker, this, i, &queue,
                         &results, output_dir);
  }
  for (auto &t : threads) {
    t.join();
  }

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - batch_start)
                           .count();

  outcomes_ = results.extract();
  print_batch_summary(elapsed_sec);

  return static_cast<int>(
      std::count_if(outcomes_.begin(), outcomes_.end(),
                    [](const RunOutcome &o) { return !o.success; }));
}

void BatchAssembler::run_worker(int worker_id, RunQueue *queue,
                                RunResultCollector *results,
                                const std::string &output_dir) {
  BatchJob job;
  while (queue->pop(job)) {
    LOG_PHASE("[Run {}] ----------------------------------------", job.run_id);
    LOG_INFO("[Run {}] Job: {} (worker {}, progress {}/{})", job.run_id,
             fs::path(job.job_path).filename().string(), worker_id,
             jobs_done_.load() + 1, total_jobs_);

    RunOutcome outcome = assemble_job(job, output_dir);
    ++jobs_done_;

    if (outcome.success) {
      LOG_SUCCESS("[Run {}] Completed: {} ({:.1f}s)", job.run_id,
                  outcome.output_path, outcome.elapsed_sec);
    } else {
      LOG_ERROR("[Run {}] Failed: {} ({})", job.run_id, outcome.job_name,
                outcome.reason);
    }
    results->add(std::move(outcome));

    /// Timing entries are per-run; batch mode does not print them
    TimingCollector::clear();
  }
}

RunOutcome BatchAssembler::assemble_job(const BatchJob &job,
                                        const std::string &output_dir) {
  auto start = std::chrono::steady_clock::now();

  RunOutcome outcome;
  outcome.run_id = job.run_id;
  outcome.job_name = fs::path(job.job_path).stem().string();

  try {
    JobSpec spec = load_job(job.job_path);
    RunRequest request = make_request(spec, output_dir);
    outcome.output_path = request.output_path;

    AssemblyPipeline pipeline(std::move(request), job.run_id);
    AssemblyResult result = pipeline.run();

    outcome.success = result.publishable();
    outcome.exit_code =
        outcome.success ? EXIT_CODE_PASS : EXIT_CODE_VERIFY_FAILED;
    outcome.reason = result.reason;
  } catch (const AssemblyError &e) {
    outcome.success = false;
    outcome.exit_code = exit_code_for(e.stage());
    outcome.reason = e.what();
  } catch (const std::exception &e) {
    /// Malformed environment tunables surface here (std::stod/stoi)
    outcome.success = false;
    outcome.exit_code = EXIT_CODE_USAGE;
    outcome.reason = e.what();
  }

  outcome.elapsed_sec = std::chrono::duration<double>(
                            std::chrono::steady_clock::now() - start)
                            .count();
  return outcome;
}

void BatchAssembler::print_batch_summary(double wall_clock_sec) {
  int total = static_cast<int>(outcomes_.size());
  int success = 0;
  int failed = 0;
  double sum_time_sec = 0.0;

  for (const auto &o : outcomes_) {
    if (o.success) {
      success++;
    } else {
      failed++;
    }
    sum_time_sec += o.elapsed_sec;
  }

  double speedup = (wall_clock_sec > 0) ? sum_time_sec / wall_clock_sec : 1.0;

  std::lock_guard<std::mutex> lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "=============== BATCH ASSEMBLY SUMMARY ===============\n");
  fmt::print("{:<25} {:>25}\n", "Total jobs:", total);
  fmt::print("{:<25} {:>25}\n", "Published:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);
  fmt::print("{:<25} {:>22.1f}s\n", "Sum of run times:", sum_time_sec);
  fmt::print("{:<25} {:>22.2f}x\n", "Speedup:", speedup);

  if (total > 0) {
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per run:",
               sum_time_sec / total);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");

  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed jobs:\n");
    for (const auto &o : outcomes_) {
      if (!o.success) {
        fmt::print(fg(fmt::color::red), "  - [Run {}] {} (exit {}): {}\n",
                   o.run_id, o.job_name, o.exit_code, o.reason);
      }
    }
  }
  std::fflush(stdout);
}

} // namespace loopweave
