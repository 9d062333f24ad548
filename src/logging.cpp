/**
 * @file logging.cpp
 * @brief Global log mutex and TimingCollector storage
 */

#include "loopweave/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace loopweave {

// **----- GLOBAL LOG MUTEX -----**

std::mutex log_mutex;

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  std::lock_guard<std::mutex> out_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== PHASE TIMINGS ===================\n");
  fmt::print("{:<30} {:>20}\n", "Phase", "Time (us) [sec]");
  fmt::print("{:-<30} {:-<20}\n", "", "");

  long total_us = 0;
  for (const auto &e : entries) {
    fmt::print("{:<30} {:>10} [{:.2f}s]\n", e.name, e.microseconds,
               e.microseconds / 1000000.0);
    total_us += e.microseconds;
  }
  fmt::print("{:-<30} {:-<20}\n", "", "");
  fmt::print("{:<30} {:>10} [{:.2f}s]\n", "sum", total_us,
             total_us / 1000000.0);
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

} // namespace loopweave
