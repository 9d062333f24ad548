/**
 * @file test_segment_manifest.cpp
 * @brief Manifest lines, job files and job directory discovery
 */

#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <unistd.h>

#include "loopweave/errors.hpp"
#include "loopweave/segment_manifest.hpp"

namespace fs = std::filesystem;

namespace loopweave {
namespace {

std::vector<OverlaySegment> parse(const std::string &text) {
  std::istringstream in(text);
  return parse_segments(in, "verses.txt");
}

JobSpec parse_job_text(const std::string &text,
                       const std::string &path = "/srv/jobs/evening.job") {
  std::istringstream in(text);
  return parse_job(in, path);
}

// Scratch directory removed at scope exit
struct ScratchDir {
  fs::path path;
  ScratchDir() {
    path = fs::temp_directory_path() /
           ("loopweave_manifest_" + std::to_string(::getpid()) + "_" +
            ::testing::UnitTest::GetInstance()->current_test_info()->name());
    fs::remove_all(path);
    fs::create_directories(path);
  }
  ~ScratchDir() {
    std::error_code ec;
    fs::remove_all(path, ec);
  }
  void write(const std::string &name, const std::string &content) const {
    std::ofstream(path / name) << content;
  }
};

// ---------------------------------------------------------------------------
// Segment manifest
// ---------------------------------------------------------------------------

TEST(SegmentManifestTest, PlainLinesAreUntimedSegments) {
  auto segs = parse("Be still\nThe Lord is my shepherd\n");
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_EQ(segs[0].text, "Be still");
  EXPECT_EQ(segs[0].sequence_index, 0);
  EXPECT_FALSE(segs[0].requested_duration.has_value());
  EXPECT_EQ(segs[1].sequence_index, 1);
  EXPECT_TRUE(segs[1].reference.empty());
}

TEST(SegmentManifestTest, DurationPrefixAndReference) {
  auto segs = parse("45|Be still, and know that I am God - Psalm 46:10\n");
  ASSERT_EQ(segs.size(), 1u);
  ASSERT_TRUE(segs[0].requested_duration.has_value());
  EXPECT_DOUBLE_EQ(*segs[0].requested_duration, 45.0);
  EXPECT_EQ(segs[0].text, "Be still, and know that I am God");
  EXPECT_EQ(segs[0].reference, "Psalm 46:10");
}

TEST(SegmentManifestTest, SkipsBlankLinesAndComments) {
  auto segs = parse("# evening set\n\n   \nFirst\n# trailing\nSecond\n");
  ASSERT_EQ(segs.size(), 2u);
  EXPECT_EQ(segs[0].text, "First");
  EXPECT_EQ(segs[1].text, "Second");
  EXPECT_EQ(segs[1].sequence_index, 1);
}

TEST(SegmentManifestTest, NonNumericBarIsPartOfTheText) {
  auto segs = parse("either | or\n");
  ASSERT_EQ(segs.size(), 1u);
  EXPECT_FALSE(segs[0].requested_duration.has_value());
  EXPECT_EQ(segs[0].text, "either | or");
}

TEST(SegmentManifestTest, RejectsNonPositiveDuration) {
  try {
    parse("First\n-3|Second\n");
    FAIL() << "expected InputError";
  } catch (const InputError &e) {
    EXPECT_EQ(e.subject(), "verses.txt:2");
  }
  EXPECT_THROW(parse("0|Nothing\n"), InputError);
}

TEST(SegmentManifestTest, RejectsDurationWithoutText) {
  EXPECT_THROW(parse("12|\n"), InputError);
}

TEST(SegmentManifestTest, SplitReferenceUsesLastSeparator) {
  auto [verse, ref] = split_reference("Peace - be still - Mark 4:39");
  EXPECT_EQ(verse, "Peace - be still");
  EXPECT_EQ(ref, "Mark 4:39");

  auto [lone, none] = split_reference(" - Mark 4:39");
  EXPECT_EQ(lone, "- Mark 4:39");
  EXPECT_TRUE(none.empty());
}

TEST(SegmentManifestTest, ParsePositive) {
  EXPECT_DOUBLE_EQ(parse_positive("28800", "duration"), 28800.0);
  EXPECT_DOUBLE_EQ(parse_positive(" 2.5 ", "duration"), 2.5);
  EXPECT_THROW(parse_positive("0", "duration"), InputError);
  EXPECT_THROW(parse_positive("12s", "duration"), InputError);
  EXPECT_THROW(parse_positive("", "duration"), InputError);
  EXPECT_THROW(parse_positive("inf", "duration"), InputError);
}

TEST(SegmentManifestTest, ParseDimension) {
  EXPECT_EQ(parse_dimension("1080", "width"), 1080);
  EXPECT_EQ(parse_dimension("1920.0", "width"), 1920);
  EXPECT_EQ(parse_dimension("16384", "height"), MAX_DIMENSION);
  EXPECT_THROW(parse_dimension("1920.5", "width"), InputError);
  EXPECT_THROW(parse_dimension("16386", "height"), InputError);
  /// Beyond INT_MAX must be rejected, not converted
  EXPECT_THROW(parse_dimension("4294967296", "width"), InputError);
  EXPECT_THROW(parse_dimension("1e300", "width"), InputError);
  EXPECT_THROW(parse_dimension("-2", "width"), InputError);
}

TEST(SegmentManifestTest, MissingManifestFileIsInputError) {
  try {
    load_segments("/nonexistent/loopweave/verses.txt");
    FAIL() << "expected InputError";
  } catch (const InputError &e) {
    EXPECT_EQ(e.subject(), "/nonexistent/loopweave/verses.txt");
    EXPECT_EQ(e.stage(), Stage::Input);
  }
}

// ---------------------------------------------------------------------------
// Job files
// ---------------------------------------------------------------------------

TEST(JobFileTest, ResolvesRelativePathsNextToTheJob) {
  JobSpec job = parse_job_text("# evening\n"
                               "background = media/lake.mp4\n"
                               "music = /audio/harp.mp3\n"
                               "segments = verses.txt\n"
                               "duration = 3600\n");
  EXPECT_EQ(job.name, "evening");
  EXPECT_EQ(job.background, "/srv/jobs/media/lake.mp4");
  EXPECT_EQ(job.music, "/audio/harp.mp3");
  EXPECT_EQ(job.segments, "/srv/jobs/verses.txt");
  EXPECT_DOUBLE_EQ(job.duration, 3600.0);
  EXPECT_TRUE(job.narration.empty());
}

TEST(JobFileTest, DefaultsOutputNameAndCanvas) {
  JobSpec job = parse_job_text("background = a.mp4\nmusic = b.mp3\n"
                               "segments = c.txt\nduration = 60\n");
  EXPECT_EQ(job.output_name, "evening.mp4");
  EXPECT_EQ(job.canvas.width, 1920);
  EXPECT_EQ(job.canvas.height, 1080);
}

TEST(JobFileTest, OptionalKeys) {
  JobSpec job = parse_job_text("background = a.mp4\nmusic = b.mp3\n"
                               "segments = c.txt\nduration = 60\n"
                               "output = sunrise.mp4\nwidth = 1080\n"
                               "height = 1920\nnarration = voice.wav\n");
  EXPECT_EQ(job.output_name, "sunrise.mp4");
  EXPECT_EQ(job.canvas.width, 1080);
  EXPECT_EQ(job.canvas.height, 1920);
  EXPECT_EQ(job.narration, "/srv/jobs/voice.wav");
}

TEST(JobFileTest, RejectsUnknownKey) {
  EXPECT_THROW(parse_job_text("background = a.mp4\nvolume = 3\n"), InputError);
}

TEST(JobFileTest, RejectsMissingRequiredKeys) {
  EXPECT_THROW(parse_job_text("music = b.mp3\nsegments = c.txt\nduration = 60\n"),
               InputError);
  EXPECT_THROW(parse_job_text("background = a.mp4\nmusic = b.mp3\n"
                              "segments = c.txt\n"),
               InputError);
}

TEST(JobFileTest, RejectsLineWithoutEquals) {
  EXPECT_THROW(parse_job_text("background a.mp4\n"), InputError);
}

TEST(JobFileTest, RejectsFractionalDimension) {
  EXPECT_THROW(parse_job_text("background = a.mp4\nmusic = b.mp3\n"
                              "segments = c.txt\nduration = 60\n"
                              "width = 1280.5\n"),
               InputError);
}

// ---------------------------------------------------------------------------
// Job directory
// ---------------------------------------------------------------------------

TEST(JobDirectoryTest, FindsSortedJobFilesOnly) {
  ScratchDir dir;
  dir.write("b.job", "");
  dir.write("a.job", "");
  dir.write("notes.txt", "");
  fs::create_directories(dir.path / "nested.job");

  auto files = find_job_files(dir.path.string());
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(fs::path(files[0]).filename().string(), "a.job");
  EXPECT_EQ(fs::path(files[1]).filename().string(), "b.job");
}

TEST(JobDirectoryTest, MissingDirectoryIsInputError) {
  EXPECT_THROW(find_job_files("/nonexistent/loopweave/jobs"), InputError);
}

TEST(JobDirectoryTest, MakeRequestLoadsManifest) {
  ScratchDir dir;
  dir.write("verses.txt", "10|First - Ps 1:1\nSecond\n");
  dir.write("morning.job", "background = lake.mp4\nmusic = harp.mp3\n"
                           "segments = verses.txt\nduration = 60\n");

  JobSpec job = load_job((dir.path / "morning.job").string());
  RunRequest req = make_request(job, "/out");

  EXPECT_EQ(req.output_path, "/out/morning.mp4");
  EXPECT_EQ(req.background_path, (dir.path / "lake.mp4").string());
  EXPECT_DOUBLE_EQ(req.total_duration, 60.0);
  ASSERT_EQ(req.segments.size(), 2u);
  EXPECT_EQ(req.segments[0].reference, "Ps 1:1");
  EXPECT_TRUE(req.work_dir.empty());
}

} // namespace
} // namespace loopweave
