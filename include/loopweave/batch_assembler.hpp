/**
 * @file batch_assembler.hpp
 * @brief Concurrent execution of independent assembly runs
 *
 * @details The BatchAssembler runs every *.job file of a directory:
 *
 *          - Spawns PARALLEL_RUNS worker threads
 *
 *          - Workers pop jobs from a shared RunQueue
 *
 *          - Each job gets its own AssemblyPipeline, work dir and output
 *            path; nothing mutable is shared between runs
 *
 *          - Logging is run-prefixed for clarity
 *
 * @note A job's failure (any stage, or a failing verdict) is recorded
 *       against it; the remaining jobs still run.
 */

#ifndef LOOPWEAVE_BATCH_ASSEMBLER_HPP
#define LOOPWEAVE_BATCH_ASSEMBLER_HPP

#include <atomic>
#include <string>
#include <vector>

#include "run_queue.hpp"

namespace loopweave {

/**
 * @brief Process exit status for a batch with failed_jobs failures.
 * @note Clamped to 255: the status is truncated to 8 bits, so 256 failures
 *       would otherwise read as success.
 */
int batch_exit_status(int failed_jobs);

/**
 * @class BatchAssembler
 * @brief Orchestrates concurrent assembly runs.
 */
class BatchAssembler {
public:
  /**
   * @brief Construct a batch assembler.
   * @param num_runs Number of concurrent runs (0 = auto-detect)
   */
  explicit BatchAssembler(int num_runs = 0);

  /**
   * @brief Assemble every job.
   *
   * @param job_files Job file paths
   * @param output_dir Directory receiving every output
   * @return Number of failed jobs (0 = all published)
   */
  int process(const std::vector<std::string> &job_files,
              const std::string &output_dir);

  /// Outcomes of the last process() call, ordered by run id
  const std::vector<RunOutcome> &outcomes() const { return outcomes_; }

private:
  int num_runs_;
  std::atomic<int> jobs_done_{0};
  int total_jobs_{0};
  std::vector<RunOutcome> outcomes_;

  /**
   * @brief Worker function for each run thread.
   */
  void run_worker(int worker_id, RunQueue *queue,
                  RunResultCollector *results, const std::string &output_dir);

  /**
   * @brief Assemble one job and describe the outcome; never throws an
   *        AssemblyError.
   */
  RunOutcome assemble_job(const BatchJob &job, const std::string &output_dir);

  /**
   * @brief Print final batch summary.
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  void print_batch_summary(double wall_clock_sec);
};

} // namespace loopweave

#endif // LOOPWEAVE_BATCH_ASSEMBLER_HPP
