/**
 * @file test_batch_assembler.cpp
 * @brief Job queue, result ordering and per-job failure isolation
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <string>
#include <thread>
#include <unistd.h>

#include "loopweave/batch_assembler.hpp"
#include "loopweave/errors.hpp"
#include "loopweave/run_queue.hpp"
#include "loopweave/segment_manifest.hpp"

namespace fs = std::filesystem;

namespace loopweave {
namespace {

// ---------------------------------------------------------------------------
// RunQueue / RunResultCollector
// ---------------------------------------------------------------------------

TEST(RunQueueTest, DrainsInOrderThenStops) {
  RunQueue q;
  q.push({1, "a.job"});
  q.push({2, "b.job"});
  q.finish();

  BatchJob job;
  ASSERT_TRUE(q.pop(job));
  EXPECT_EQ(job.run_id, 1);
  ASSERT_TRUE(q.pop(job));
  EXPECT_EQ(job.job_path, "b.job");
  EXPECT_FALSE(q.pop(job));
}

TEST(RunQueueTest, BlockedWorkerWakesOnFinish) {
  RunQueue q;
  bool got = true;
  std::thread worker([&] {
    BatchJob job;
    got = q.pop(job);
  });
  q.finish();
  worker.join();
  EXPECT_FALSE(got);
}

TEST(RunQueueTest, ConcurrentWorkersTakeEachJobOnce) {
  RunQueue q;
  RunResultCollector results;
  for (int i = 1; i <= 50; ++i)
    q.push({i, "job" + std::to_string(i)});
  q.finish();

  std::vector<std::thread> workers;
  for (int w = 0; w < 4; ++w) {
    workers.emplace_back([&] {
      BatchJob job;
      while (q.pop(job)) {
        RunOutcome o;
        o.run_id = job.run_id;
        o.success = true;
        results.add(o);
      }
    });
  }
  for (auto &t : workers)
    t.join();

  auto outcomes = results.extract();
  ASSERT_EQ(outcomes.size(), 50u);
  for (size_t i = 0; i < outcomes.size(); ++i)
    EXPECT_EQ(outcomes[i].run_id, static_cast<int>(i) + 1);
  EXPECT_TRUE(results.extract().empty());
}

// ---------------------------------------------------------------------------
// BatchAssembler
// ---------------------------------------------------------------------------

class BatchAssemblerTest : public ::testing::Test {
protected:
  void SetUp() override {
    root_ = fs::temp_directory_path() /
            ("loopweave_batch_" + std::to_string(::getpid()));
    fs::remove_all(root_);
    fs::create_directories(root_ / "jobs");
    fs::create_directories(root_ / "out");
  }
  void TearDown() override {
    std::error_code ec;
    fs::remove_all(root_, ec);
  }
  void write(const std::string &rel, const std::string &content) {
    std::ofstream(root_ / rel) << content;
  }

  fs::path root_;
};

TEST_F(BatchAssemblerTest, FailedJobsAreRecordedAndCounted) {
  write("jobs/verses.txt", "Be still - Psalm 46:10\nPeace\n");
  /// Missing background key
  write("jobs/a_incomplete.job", "music = harp.mp3\nsegments = verses.txt\n"
                                 "duration = 60\n");
  /// Well formed, but the media does not exist
  write("jobs/b_missing_media.job", "background = lake.mp4\n"
                                    "music = harp.mp3\n"
                                    "segments = verses.txt\n"
                                    "duration = 60\n");
  /// Manifest overflows the requested duration
  write("jobs/c_overflow.job", "background = lake.mp4\nmusic = harp.mp3\n"
                               "segments = long.txt\nduration = 60\n");
  write("jobs/long.txt", "90|Too long\nRest\n");

  auto jobs = find_job_files((root_ / "jobs").string());
  ASSERT_EQ(jobs.size(), 3u);

  BatchAssembler assembler(2);
  int failed = assembler.process(jobs, (root_ / "out").string());
  EXPECT_EQ(failed, 3);

  const auto &outcomes = assembler.outcomes();
  ASSERT_EQ(outcomes.size(), 3u);
  EXPECT_EQ(outcomes[0].run_id, 1);
  EXPECT_EQ(outcomes[0].job_name, "a_incomplete");
  EXPECT_EQ(outcomes[1].job_name, "b_missing_media");
  EXPECT_EQ(outcomes[1].output_path, (root_ / "out" / "b_missing_media.mp4").string());
  EXPECT_EQ(outcomes[2].job_name, "c_overflow");
  for (const auto &o : outcomes) {
    EXPECT_FALSE(o.success);
    EXPECT_EQ(o.exit_code, exit_code_for(Stage::Input)) << o.job_name;
    EXPECT_FALSE(o.reason.empty());
  }

  /// Nothing is written for failed jobs
  EXPECT_TRUE(fs::is_empty(root_ / "out"));
}

TEST(BatchExitStatusTest, FailureCountIsCappedAtByteRange) {
  EXPECT_EQ(batch_exit_status(0), 0);
  EXPECT_EQ(batch_exit_status(3), 3);
  EXPECT_EQ(batch_exit_status(255), 255);
  /// 256 would wrap to 0 and read as success
  EXPECT_EQ(batch_exit_status(256), 255);
  EXPECT_EQ(batch_exit_status(100000), 255);
}

TEST_F(BatchAssemblerTest, EmptyJobListIsNoFailure) {
  BatchAssembler assembler;
  EXPECT_EQ(assembler.process({}, (root_ / "out").string()), 0);
  EXPECT_TRUE(assembler.outcomes().empty());
}

} // namespace
} // namespace loopweave
