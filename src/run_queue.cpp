/**
 * @file run_queue.cpp
 * @brief Batch job queue and outcome collection implementation
 */

#include "loopweave/run_queue.hpp"

#include <algorithm>

namespace loopweave {

// **----- RunQueue Implementation -----**

void RunQueue::push(BatchJob job) {
  std::lock_guard<std::mutex> lock(mutex);
  jobs.push(std::move(job));
  cv.notify_one();
}

bool RunQueue::pop(BatchJob &job) {
  std::unique_lock<std::mutex> lock(mutex);
  cv.wait(lock, [this] { return !jobs.empty() || done.load(); });
  if (jobs.empty())
    return false;
  job = std::move(jobs.front());
  jobs.pop();
  return true;
}

void RunQueue::finish() {
  {
    std::lock_guard<std::mutex> lock(mutex);
    done.store(true);
  }
  cv.notify_all();
}

// **----- RunResultCollector Implementation -----**

void RunResultCollector::add(RunOutcome outcome) {
  std::lock_guard<std::mutex> lock(mutex);
  outcomes.push_back(std::move(outcome));
}

std::vector<RunOutcome> RunResultCollector::extract() {
  std::lock_guard<std::mutex> lock(mutex);
  std::sort(outcomes.begin(), outcomes.end(),
            [](const RunOutcome &a, const RunOutcome &b) {
              return a.run_id < b.run_id;
            });
  std::vector<RunOutcome> out;
  out.swap(outcomes);
  return out;
}

} // namespace loopweave
