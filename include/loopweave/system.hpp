/**
 * @file system.hpp
 * @brief System utilities: CPU limit detection and time formatting
 *
 * @details Provides:
 *
 *          - Cgroup-aware CPU limit detection for containers
 *
 *          - Batch run concurrency calculation
 *
 *          - Time formatting for summaries
 */

#ifndef LOOPWEAVE_SYSTEM_HPP
#define LOOPWEAVE_SYSTEM_HPP

#include <string>

namespace loopweave {

// **---- CPU Detection ----**

/**
 * @brief Detect the number of CPUs available to this process.
 *
 * @note In containers std::thread::hardware_concurrency() reports the host's
 *       cores. This reads the cgroup v2 `cpu.max`, the cgroup v1 CFS quota
 *       and the cpuset files before falling back to it.
 *
 * @return Detected CPU limit (at least 1)
 */
int detect_cpu_limit();

/**
 * @brief Number of assembly runs to execute concurrently in batch mode.
 *
 * @note PARALLEL_RUNS = 0 selects a quarter of the CPU limit, because each
 *       ffmpeg encode already spreads over several cores.
 *
 * @param job_count Jobs waiting; never start more workers than jobs
 */
int calculate_parallel_runs(int job_count);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS.mmm string.
 */
std::string format_time(double seconds);

} // namespace loopweave

#endif // LOOPWEAVE_SYSTEM_HPP
