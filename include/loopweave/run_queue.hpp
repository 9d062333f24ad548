/**
 * @file run_queue.hpp
 * @brief Thread-safe queue of batch jobs and result collection
 *
 * @details Provides:
 *          - RunQueue: shared queue the batch workers pop jobs from
 *
 *          - RunResultCollector: thread-safe aggregator of per-job outcomes
 */

#ifndef LOOPWEAVE_RUN_QUEUE_HPP
#define LOOPWEAVE_RUN_QUEUE_HPP

#include <atomic>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include <vector>

namespace loopweave {

/**
 * @struct BatchJob
 * @brief One job file waiting to be assembled.
 */
struct BatchJob {
  int run_id = 0;       //< 1-based, used as the [Run N] log prefix
  std::string job_path; //< Path of the *.job file
};

/**
 * @struct RunOutcome
 * @brief What happened to one job.
 */
struct RunOutcome {
  int run_id = 0;
  std::string job_name;
  std::string output_path;
  bool success = false;
  int exit_code = 0;  //< Same mapping as the single-run CLI
  std::string reason; //< Error text or verification reason
  double elapsed_sec = 0.0;
};

/**
 * @class RunQueue
 * @brief Thread-safe queue; idle workers take the next job.
 *
 * @note Jobs differ wildly in cost (a one-minute short next to an eight-hour
 *       video), so workers pull instead of being assigned jobs up front.
 */
class RunQueue {
  std::queue<BatchJob> jobs;
  std::mutex mutex;
  std::condition_variable cv;
  std::atomic<bool> done{false};

public:
  /**
   * @brief Add a job to the queue.
   * @note Thread-safe; notifies one waiting worker.
   */
  void push(BatchJob job);

  /**
   * @brief Pop a job from the queue.
   * @note Blocks until a job is available or the queue is finished.
   * @return true if a job was retrieved, false if queue is empty and done
   */
  bool pop(BatchJob &job);

  /**
   * @brief Signal that no more jobs will be added.
   */
  void finish();
};

/**
 * @class RunResultCollector
 * @brief Thread-safe aggregator for run outcomes.
 */
class RunResultCollector {
  std::vector<RunOutcome> outcomes;
  std::mutex mutex;

public:
  void add(RunOutcome outcome);

  /**
   * @brief Extract all outcomes, ordered by run id.
   * @attention Moves the internal vector out, leaving collector empty.
   */
  std::vector<RunOutcome> extract();
};

} // namespace loopweave

#endif // LOOPWEAVE_RUN_QUEUE_HPP
