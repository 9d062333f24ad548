/**
 * @file system.cpp
 * @brief System utilities implementation
 */

#include "loopweave/system.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <string>
#include <thread>

#include <fmt/core.h>

#include "loopweave/config.hpp"

namespace loopweave {

// **---- Internal Helpers ----**

namespace {

/// Read a single number from a file, -1 when absent or malformed
long read_long_from_file(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  long val;
  f >> val;
  return f.fail() ? -1 : val;
}

/// Count CPUs in a cpuset string like "0,2,4-7"
int count_cpuset(const char *path) {
  std::ifstream f(path);
  if (!f)
    return -1;
  std::string line;
  std::getline(f, line);
  if (line.empty())
    return -1;

  int count = 0;
  size_t pos = 0;
  while (pos < line.size()) {
    size_t comma = line.find(',', pos);
    if (comma == std::string::npos)
      comma = line.size();
    std::string item = line.substr(pos, comma - pos);
    size_t dash = item.find('-');
    try {
      if (dash == std::string::npos) {
        std::stoi(item);
        ++count;
      } else {
        int first = std::stoi(item.substr(0, dash));
        int last = std::stoi(item.substr(dash + 1));
        count += std::max(0, last - first + 1);
      }
    } catch (const std::exception &) {
      return -1;
    }
    pos = comma + 1;
  }
  return count > 0 ? count : -1;
}

} // anonymous namespace

// **---- CPU Detection ----**

int detect_cpu_limit() {
  int limit = -1;

  /// cgroup v2 (unified hierarchy): "<quota> <period>" or "max <period>"
  {
    std::ifstream f("/sys/fs/cgroup/cpu.max");
    if (f) {
      std::string quota_str, period_str;
      f >> quota_str >> period_str;
      if (quota_str != "max" && !period_str.empty()) {
        try {
          long quota = std::stol(quota_str);
          long period = std::stol(period_str);
          if (quota > 0 && period > 0)
            limit = static_cast<int>((quota + period - 1) / period);
        } catch (const std::exception &) {
          limit = -1;
        }
      }
    }
  }

  /// cgroup v1 CFS quota
  if (limit <= 0) {
    long quota = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_quota_us");
    long period = read_long_from_file("/sys/fs/cgroup/cpu/cpu.cfs_period_us");
    if (quota > 0 && period > 0)
      limit = static_cast<int>((quota + period - 1) / period);
  }

  /// cpuset
  if (limit <= 0) {
    limit = count_cpuset("/sys/fs/cgroup/cpuset.cpus.effective");
    if (limit <= 0)
      limit = count_cpuset("/sys/fs/cgroup/cpuset/cpuset.cpus");
  }

  if (limit <= 0)
    limit = static_cast<int>(std::thread::hardware_concurrency());

  if (limit <= 0)
    limit = 4;
  return std::min(limit, 64);
}

int calculate_parallel_runs(int job_count) {
  int configured = Config::parallel_runs();
  int runs = configured > 0 ? configured : std::max(1, detect_cpu_limit() / 4);
  return std::max(1, std::min(runs, std::max(1, job_count)));
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  if (!std::isfinite(seconds) || seconds < 0)
    seconds = 0;
  long total_ms = std::lround(seconds * 1000.0);
  long h = total_ms / 3600000;
  long m = (total_ms % 3600000) / 60000;
  long s = (total_ms % 60000) / 1000;
  long ms = total_ms % 1000;
  return fmt::format("{:02d}:{:02d}:{:02d}.{:03d}", h, m, s, ms);
}

} // namespace loopweave
