/**
 * @file test_system.cpp
 * @brief CPU limit, run concurrency and time formatting
 */

#include <gtest/gtest.h>

#include <cmath>

#include "loopweave/system.hpp"

namespace loopweave {
namespace {

TEST(SystemTest, FormatTime) {
  EXPECT_EQ(format_time(0.0), "00:00:00.000");
  EXPECT_EQ(format_time(61.5), "00:01:01.500");
  EXPECT_EQ(format_time(28800.0), "08:00:00.000");
  EXPECT_EQ(format_time(3599.9996), "01:00:00.000");
}

TEST(SystemTest, FormatTimeClampsInvalidInput) {
  EXPECT_EQ(format_time(-3.0), "00:00:00.000");
  EXPECT_EQ(format_time(std::nan("")), "00:00:00.000");
}

TEST(SystemTest, CpuLimitIsBounded) {
  int cpus = detect_cpu_limit();
  EXPECT_GE(cpus, 1);
  EXPECT_LE(cpus, 64);
}

TEST(SystemTest, ParallelRunsNeverExceedJobs) {
  EXPECT_EQ(calculate_parallel_runs(1), 1);
  EXPECT_EQ(calculate_parallel_runs(0), 1);
  int runs = calculate_parallel_runs(1000);
  EXPECT_GE(runs, 1);
  EXPECT_LE(runs, 1000);
}

} // namespace
} // namespace loopweave
